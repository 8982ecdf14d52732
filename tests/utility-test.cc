#include <ordered-core/utility.hh>

#include <nexus/test.hh>

#include <string>
#include <type_traits>

namespace
{
struct Box
{
    int v;
    bool operator<(Box const& rhs) const { return v < rhs.v; }
};

struct fake_self
{
    int id = 0;
};
} // namespace

// forward keeps value categories
static_assert(std::is_same_v<decltype(oc::forward<int&>(std::declval<int&>())), int&>);
static_assert(std::is_same_v<decltype(oc::forward<int>(std::declval<int&>())), int&&>);
static_assert(std::is_same_v<decltype(oc::move(std::declval<std::string&>())), std::string&&>);

// storage_for does not add non-trivial members of its own
static_assert(std::is_trivially_destructible_v<oc::storage_for<int>>);
static_assert(!std::is_trivially_destructible_v<oc::storage_for<std::string>>);
static_assert(sizeof(oc::storage_for<double>) == sizeof(double));

TEST("utility - min, max and clamp")
{
    CHECK(oc::min(3, 5) == 3);
    CHECK(oc::max(3, 5) == 5);
    CHECK(oc::clamp(7, 0, 4) == 4);
    CHECK(oc::clamp(-2, 0, 4) == 0);
    CHECK(oc::clamp(2, 0, 4) == 2);

    SECTION("ties keep min and max distinct")
    {
        Box const a{1};
        Box const b{1};
        CHECK(&oc::min(a, b) == &a);
        CHECK(&oc::max(a, b) == &b);
    }
}

TEST("utility - invoke_element_callback picks the richest shape")
{
    auto const self = fake_self{7};

    SECTION("element only")
    {
        auto f = [](int e) { return e + 1; };
        CHECK(oc::invoke_element_callback(f, 10, 3, self) == 11);
    }

    SECTION("element and index")
    {
        auto f = [](int e, oc::isize i) { return e + int(i); };
        CHECK(oc::invoke_element_callback(f, 10, 3, self) == 13);
    }

    SECTION("element, index and self")
    {
        auto f = [](int e, oc::isize i, fake_self const& s) { return e + int(i) + s.id; };
        CHECK(oc::invoke_element_callback(f, 10, 3, self) == 20);
    }

    SECTION("result type")
    {
        auto f = [](int e) { return std::to_string(e); };
        static_assert(std::is_same_v<oc::element_callback_result_t<decltype(f), int const&, fake_self>, std::string>);
        CHECK(oc::invoke_element_callback(f, 5, 0, self) == "5");
    }
}

TEST("utility - invoke_reducer passes the accumulator first")
{
    auto const self = fake_self{100};

    auto two = [](int acc, int e) { return acc * 10 + e; };
    CHECK(oc::invoke_reducer(two, 4, 2, 0, self) == 42);

    auto three = [](std::string acc, char e, oc::isize i) { return acc + e + std::to_string(i); };
    CHECK(oc::invoke_reducer(three, std::string("x"), 'y', 1, self) == "xy1");

    auto four = [](int acc, int, oc::isize, fake_self const& s) { return acc + s.id; };
    CHECK(oc::invoke_reducer(four, 1, 0, 0, self) == 101);
}
