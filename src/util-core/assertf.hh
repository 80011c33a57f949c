#pragma once

#include <util-core/assert.hh>

#include <format>

// =========================================================================================================
// UC_ASSERTF - Runtime assertion with formatted message
//
// Formatted version of UC_ASSERT, supporting std::format-style arguments.
// Message arguments are only evaluated when the condition fails.
// Same activation rules as UC_ASSERT (see assert.hh).
//
// Usage:
//   UC_ASSERTF(0 <= r && r < _rows, "row {} out of bounds (rows: {})", r, _rows);
//
// Note:
//   For simple string literal messages without formatting, prefer UC_ASSERT from <util-core/assert.hh>
//   as it has minimal dependencies.
//
#define UC_ASSERTF(cond, msg, ...) UC_IMPL_ASSERTF(cond, msg, ##__VA_ARGS__)

// =========================================================================================================
// UC_ASSERTF_ALWAYS - Always-active assertion with formatted message
//
// Like UC_ASSERTF but remains active in all build configurations, including release builds.
//
#define UC_ASSERTF_ALWAYS(cond, msg, ...) UC_IMPL_ASSERTF_ALWAYS(cond, msg, ##__VA_ARGS__)


// =========================================================================================================
// Implementation details
// =========================================================================================================

#define UC_IMPL_ASSERTF_ALWAYS(cond, msg, ...)                                                            \
    do                                                                                                    \
    {                                                                                                     \
        if (!(cond)) [[unlikely]]                                                                         \
        {                                                                                                 \
            ::uc::impl::handle_assert_failure(#cond, std::format(msg __VA_OPT__(, ) __VA_ARGS__).c_str(), \
                                              ::uc::source_location::current());                          \
            UC_BREAK_AND_ABORT();                                                                         \
        }                                                                                                 \
    } while (false)

#if UC_ASSERT_ENABLED

#define UC_IMPL_ASSERTF(cond, msg, ...) UC_IMPL_ASSERTF_ALWAYS(cond, msg, ##__VA_ARGS__)

#else

// stripped, but the format string still has to compile against its arguments
#define UC_IMPL_ASSERTF(cond, msg, ...)                         \
    do                                                          \
    {                                                           \
        UC_UNUSED(cond);                                        \
        UC_UNUSED(std::format(msg __VA_OPT__(, ) __VA_ARGS__)); \
    } while (false)

#endif
