#include <util-core/assert-handler.hh>
#include <util-core/assertf.hh>
#include <util-core/fwd.hh>
#include <util-core/stacktrace.hh>

#include <nexus/test.hh>

#include <string>
#include <vector>

namespace
{
struct handled
{
    int id = 0;
};

// installs a handler that records the failure and unwinds with handled{id}
auto recording_handler(std::vector<uc::impl::assertion_info>& out, int id)
{
    return [&out, id](uc::impl::assertion_info const& info)
    {
        out.push_back(info);
        throw handled{id};
    };
}

// runs f and returns the id of the handler that unwound it, 0 if none did
template <class F>
int unwinding_handler(F&& f)
{
    try
    {
        f();
    }
    catch (handled const& h)
    {
        return h.id;
    }
    return 0;
}
} // namespace

TEST("assert - handler receives expression, message and location")
{
    std::vector<uc::impl::assertion_info> failures;
    auto const scope = uc::impl::scoped_assertion_handler(recording_handler(failures, 1));

    int const expected_line = __LINE__ + 1;
    auto const id = unwinding_handler([] { UC_ASSERT_ALWAYS(1 + 1 == 3, "arithmetic is broken"); });

    CHECK(id == 1);
    REQUIRE(failures.size() == 1);

    auto const& info = failures.front();
    CHECK(info.expression.find("1 + 1 == 3") != std::string::npos);
    CHECK(info.message == "arithmetic is broken");
    CHECK(std::string(info.location.file_name()).ends_with("assert-test.cc"));
    CHECK(int(info.location.line()) == expected_line);
}

TEST("assert - formatted messages")
{
    std::vector<uc::impl::assertion_info> failures;
    auto const scope = uc::impl::scoped_assertion_handler(recording_handler(failures, 1));

    SECTION("arguments are formatted into the message")
    {
        auto const rows = 2;
        (void)unwinding_handler([&] { UC_ASSERTF_ALWAYS(rows > 3, "row {} out of bounds (rows: {})", 5, rows); });
        REQUIRE(failures.size() == 1);
        CHECK(failures[0].message == "row 5 out of bounds (rows: 2)");
    }

    SECTION("arguments are not evaluated when the condition holds")
    {
        int evaluated = 0;
        auto expensive = [&]
        {
            ++evaluated;
            return 1;
        };
        UC_ASSERTF_ALWAYS(true, "never shown {}", expensive());
        CHECK(evaluated == 0);
        CHECK(failures.empty());
    }
}

TEST("assert - handlers nest")
{
    std::vector<uc::impl::assertion_info> failures;
    auto const outer = uc::impl::scoped_assertion_handler(recording_handler(failures, 1));

    {
        auto const inner = uc::impl::scoped_assertion_handler(recording_handler(failures, 2));
        CHECK(unwinding_handler([] { UC_ASSERT_ALWAYS(false, "inner"); }) == 2);
    }

    CHECK(unwinding_handler([] { UC_ASSERT_ALWAYS(false, "outer"); }) == 1);

    SECTION("explicit push and pop")
    {
        uc::impl::push_assertion_handler(recording_handler(failures, 3));
        CHECK(unwinding_handler([] { UC_ASSERT_ALWAYS(false, "pushed"); }) == 3);
        uc::impl::pop_assertion_handler();

        CHECK(unwinding_handler([] { UC_ASSERT_ALWAYS(false, "after pop"); }) == 1);
    }

    REQUIRE(failures.size() >= 2);
    CHECK(failures[0].message == "inner");
    CHECK(failures[1].message == "outer");
}

TEST("assert - scoped handler is popped when its own handler unwinds the scope")
{
    std::vector<uc::impl::assertion_info> failures;
    auto const outer = uc::impl::scoped_assertion_handler(recording_handler(failures, 1));

    auto const id = unwinding_handler(
        [&]
        {
            auto const inner = uc::impl::scoped_assertion_handler(recording_handler(failures, 2));
            UC_ASSERT_ALWAYS(false, "thrown through the inner scope");
        });
    CHECK(id == 2);

    CHECK(unwinding_handler([] { UC_ASSERT_ALWAYS(false, "reaches outer"); }) == 1);
    CHECK(failures.size() == 2);
}

TEST("assert - UC_ASSERT follows the build configuration")
{
    std::vector<uc::impl::assertion_info> failures;
    auto const scope = uc::impl::scoped_assertion_handler(recording_handler(failures, 1));

    auto const id = unwinding_handler([] { UC_ASSERT(false, "configurable"); });

#if UC_ASSERT_ENABLED
    CHECK(id == 1);
    CHECK(failures.size() == 1);
#else
    CHECK(id == 0);
    CHECK(failures.empty());
#endif

    SECTION("passing assertions are silent")
    {
        UC_ASSERT(true, "fine");
        UC_ASSERT_ALWAYS(2 > 1, "fine");
        CHECK(failures.size() <= 1);
    }
}

TEST("assert - stacktrace of the current call")
{
    auto const trace = uc::stacktrace::current();
    CHECK(uc::isize(trace.size()) == trace.end() - trace.begin());
}
