#include <ordered-core/assert-handler.hh>
#include <ordered-core/optional.hh>

#include <nexus/test.hh>

#include <string>

// optional<int> is as cheap as the int itself
static_assert(std::is_trivially_copyable_v<oc::optional<int>>);
static_assert(std::is_trivially_destructible_v<oc::optional<int>>);
static_assert(!std::is_trivially_copyable_v<oc::optional<std::string>>);

// no accidental comparison with true/false
static_assert(!requires(oc::optional<int> o) { o == true; });

namespace
{
struct lifetime_counter
{
    int value = 0;

    static inline int alive = 0;
    static inline int copies = 0;
    static inline int moves = 0;

    static void reset()
    {
        alive = 0;
        copies = 0;
        moves = 0;
    }

    explicit lifetime_counter(int v) : value(v) { ++alive; }
    lifetime_counter(lifetime_counter const& rhs) : value(rhs.value)
    {
        ++alive;
        ++copies;
    }
    lifetime_counter(lifetime_counter&& rhs) noexcept : value(rhs.value)
    {
        ++alive;
        ++moves;
    }
    lifetime_counter& operator=(lifetime_counter const& rhs) = default;
    lifetime_counter& operator=(lifetime_counter&& rhs) noexcept = default;
    ~lifetime_counter() { --alive; }

    friend bool operator==(lifetime_counter const&, lifetime_counter const&) = default;
};
} // namespace

TEST("optional - empty and engaged states")
{
    SECTION("default is empty")
    {
        auto const opt = oc::optional<int>{};
        CHECK(!opt.has_value());
        CHECK(opt == oc::nullopt);
    }

    SECTION("nullopt is empty")
    {
        oc::optional<int> const opt = oc::nullopt;
        CHECK(!opt.has_value());
    }

    SECTION("a default-valued element is not the same as no value")
    {
        auto const zero = oc::optional<int>{0};
        CHECK(zero.has_value());
        CHECK(zero != oc::nullopt);
        CHECK(zero.value() == 0);
        CHECK(zero != oc::optional<int>{});
    }

    SECTION("value assignment and reset")
    {
        auto opt = oc::optional<std::string>{};
        opt = std::string("abc");
        CHECK(opt.has_value());
        CHECK(opt.value() == "abc");

        opt.reset();
        CHECK(!opt.has_value());

        opt = "xyz";
        CHECK(opt == std::string("xyz"));

        opt = oc::nullopt;
        CHECK(!opt.has_value());
    }
}

TEST("optional - value_or")
{
    CHECK(oc::optional<int>{}.value_or(-1) == -1);
    CHECK(oc::optional<int>{7}.value_or(-1) == 7);
    CHECK(oc::optional<std::string>{}.value_or("fallback") == "fallback");
}

TEST("optional - rvalue value() moves out")
{
    auto opt = oc::optional<std::string>{std::string(40, 'x')};
    std::string s = oc::move(opt).value();
    CHECK(s.size() == 40);
}

TEST("optional - object lifetime")
{
    lifetime_counter::reset();

    SECTION("empty optional never constructs")
    {
        {
            auto const opt = oc::optional<lifetime_counter>{};
            CHECK(lifetime_counter::alive == 0);
        }
        CHECK(lifetime_counter::alive == 0);
    }

    SECTION("copy keeps both engaged")
    {
        {
            auto const a = oc::optional<lifetime_counter>{lifetime_counter{3}};
            auto const b = a; // NOLINT
            CHECK(lifetime_counter::alive == 2);
            CHECK(lifetime_counter::copies == 1);
            CHECK(a == b);
        }
        CHECK(lifetime_counter::alive == 0);
    }

    SECTION("move leaves the source empty")
    {
        {
            auto a = oc::optional<lifetime_counter>{lifetime_counter{3}};
            lifetime_counter::reset();
            lifetime_counter::alive = 1;

            auto const b = oc::move(a);
            CHECK(!a.has_value()); // NOLINT(bugprone-use-after-move)
            CHECK(b.value().value == 3);
            CHECK(lifetime_counter::moves == 1);
            CHECK(lifetime_counter::alive == 1);
        }
        CHECK(lifetime_counter::alive == 0);
    }

    SECTION("assigning empty destroys the held value")
    {
        auto opt = oc::optional<lifetime_counter>{lifetime_counter{3}};
        CHECK(lifetime_counter::alive == 1);
        opt = oc::optional<lifetime_counter>{};
        CHECK(lifetime_counter::alive == 0);
    }
}

TEST("optional - value() on empty optional asserts")
{
    if constexpr (!OC_ASSERT_ENABLED)
        return;

    bool reported = false;
    auto handler = oc::impl::scoped_assertion_handler(
        [&](oc::impl::assertion_info const&)
        {
            reported = true;
            throw 0;
        });

    auto const opt = oc::optional<int>{};
    try
    {
        (void)opt.value();
    }
    catch (int) // NOLINT(bugprone-empty-catch)
    {
    }
    CHECK(reported);
}
