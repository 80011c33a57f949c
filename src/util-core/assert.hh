#pragma once

// Lean header with minimal dependencies, included by every container and view in util-core.
// For formatted assertions with std::format support, use <util-core/assertf.hh> instead.
#include <util-core/macros.hh>
#include <util-core/source_location.hh>

// =========================================================================================================
// UC_ASSERT - Runtime assertion with string literal message
//
// Validates a condition at runtime and triggers a debugger break + abort on failure.
//
// Features:
//   - Simple string literal error messages (no formatting dependencies)
//   - Automatic source location capture (file, line, function)
//   - Debugger integration: breaks into debugger when attached, otherwise aborts
//   - Expression stringification for clear error reporting
//
// When assertions are active:
//   Assertions are enabled in UC_DEBUG and UC_RELWITHDEBINFO builds.
//   In UC_RELEASE builds, assertions are disabled unless UC_ENABLE_ASSERT_IN_RELEASE is set in CMake.
//
// What assertions are for:
//   Assertions protect INVARIANTS, PRECONDITIONS, and POSTCONDITIONS.
//   In util-core that means index bounds of span/fixed_array/grid, access to empty optionals
//   and misuse of the incremental hashers.
//
// What assertions are NOT for:
//   - NOT for user input validation
//   - NOT for I/O failures (unseekable or broken streams throw uc::io_error)
//   - NOT for common/expected error conditions
//
// Error handling strategy:
//   - Assertions      -> programmer errors, violated invariants/preconditions/postconditions
//   - Exceptions      -> exceptional & nonlocal error handling (uc::io_error)
//   - optional<T>     -> absent data that is a valid outcome (e.g. a missing matrix)
//
// Usage:
//   UC_ASSERT(ptr != nullptr, "pointer must not be null");
//   UC_ASSERT(0 <= row && row < rows(), "row out of bounds");
//
// Note:
//   For formatted messages with arguments, use UC_ASSERTF from <util-core/assertf.hh>
//
#define UC_ASSERT(cond, msg) UC_IMPL_ASSERT(cond, msg)

// =========================================================================================================
// UC_ASSERT_ALWAYS - Always-active assertion
//
// Like UC_ASSERT but remains active in all build configurations, including release builds.
//
// Usage:
//   UC_ASSERT_ALWAYS(!_finalized, "digest was already finalized");
//
#define UC_ASSERT_ALWAYS(cond, msg) UC_IMPL_ASSERT_ALWAYS(cond, msg)

// =========================================================================================================
// UC_DEBUG_BREAK - Conditional debugger breakpoint
//
// Triggers a debugger break if a debugger is attached, otherwise does nothing.
// Executes inline (not in a function) so the debugger stops at the exact location.
//
#define UC_DEBUG_BREAK() UC_IMPL_DEBUG_BREAK()

// =========================================================================================================
// UC_BREAK_AND_ABORT - Debug break followed by program termination
//
// Used by UC_ASSERT after the assertion handler ran.
// The debugger break happens first to allow inspection before termination.
//
#define UC_BREAK_AND_ABORT() (UC_DEBUG_BREAK(), ::uc::impl::perform_abort())


// =========================================================================================================
// Implementation details
// =========================================================================================================

namespace uc::impl
{
// Called when an assertion fails
// Dispatches to the topmost handler (see assert-handler.hh) or prints diagnostics to stderr
// Note: does not abort, caller must follow with UC_BREAK_AND_ABORT()
UC_COLD_FUNC void handle_assert_failure(char const* expression, char const* message, uc::source_location location);

// Checks if a debugger is currently attached to the process
// Platform-specific implementation (Windows: IsDebuggerPresent, Linux: /proc, others: false)
bool is_debugger_connected() noexcept;

// Terminates the program
[[noreturn]] void perform_abort() noexcept;
} // namespace uc::impl

// Platform-specific debugger break implementation
// The debugger should break right in the assert macro, so this cannot hide in a function call

#ifdef UC_COMPILER_MSVC

// __debugbreak() terminates immediately without an attached debugger
#define UC_IMPL_DEBUG_BREAK() (::uc::impl::is_debugger_connected() ? __debugbreak() : void(0))

#elif defined(UC_COMPILER_POSIX)

// SIGTRAP is 5 according to https://man7.org/linux/man-pages/man7/signal.7.html
// raise is declared directly so that no posix header is pulled into every translation unit
extern "C" int raise(int) noexcept;
#define UC_IMPL_DEBUG_BREAK() (::uc::impl::is_debugger_connected() ? (void)::raise(5) : void(0))

#else

#define UC_IMPL_DEBUG_BREAK() void(0)

#endif

// UC_ASSERT_ALWAYS implementation - always enabled regardless of build configuration
#define UC_IMPL_ASSERT_ALWAYS(cond, msg)                                                     \
    do                                                                                       \
    {                                                                                        \
        if (!(cond)) [[unlikely]]                                                            \
        {                                                                                    \
            ::uc::impl::handle_assert_failure(#cond, msg, ::uc::source_location::current()); \
            UC_BREAK_AND_ABORT();                                                            \
        }                                                                                    \
    } while (false)

#if UC_ASSERT_ENABLED

#define UC_IMPL_ASSERT(cond, msg) UC_IMPL_ASSERT_ALWAYS(cond, msg)

#else

// stripped, but the expression and message still have to compile
#define UC_IMPL_ASSERT(cond, msg) \
    do                            \
    {                             \
        UC_UNUSED(cond);          \
        UC_UNUSED(msg);           \
    } while (false)

#endif
