#include <ordered-core/collection.hh>

#include <nexus/test.hh>

#include <string>

namespace
{
using ints = oc::collection<int>;
using strings = oc::collection<std::string>;
} // namespace

TEST("collection - slice")
{
    auto const c = strings{"a", "b", "c", "d"};

    SECTION("full slice is an equal but distinct collection")
    {
        auto copy = c.slice(0, c.length());
        CHECK(copy == c);

        copy.set(0, "changed");
        copy.push("e");
        CHECK(c.get(0) == "a");
        CHECK(c.length() == 4);
        CHECK(c.slice() == c);
    }

    SECTION("negative start counts from the end")
    {
        CHECK((c.slice(-2) == strings{"c", "d"}));
        CHECK((c.slice(-3, -1) == strings{"b", "c"}));
    }

    SECTION("regular bounds")
    {
        CHECK((c.slice(1, 3) == strings{"b", "c"}));
        CHECK((c.slice(2) == strings{"c", "d"}));
        CHECK((c.slice(0, -1) == strings{"a", "b", "c"}));
    }

    SECTION("out of range bounds clamp")
    {
        CHECK(c.slice(-10, 10) == c);
        CHECK(c.slice(4).empty());
        CHECK(c.slice(7, 9).empty());
    }

    SECTION("end before start is empty")
    {
        CHECK(c.slice(3, 1).empty());
        CHECK(c.slice(-1, -2).empty());
    }

    SECTION("slice of empty")
    {
        CHECK(strings().slice(-1, 1).empty());
    }
}

TEST("collection - splice")
{
    auto c = strings{"a", "b", "c", "d"};

    SECTION("removal returns exactly the removed region")
    {
        auto const removed = c.splice(1, 2);
        CHECK((removed == strings{"b", "c"}));
        CHECK((c == strings{"a", "d"}));
    }

    SECTION("delete_count defaults to zero")
    {
        auto const removed = c.splice(1);
        CHECK(removed.empty());
        CHECK(c.length() == 4);
    }

    SECTION("remove and insert in one call")
    {
        auto const removed = c.splice(1, 1, "x", "y");
        CHECK((removed == strings{"b"}));
        CHECK((c == strings{"a", "x", "y", "c", "d"}));
    }

    SECTION("pure insertion")
    {
        auto const removed = c.splice(2, 0, "x");
        CHECK(removed.empty());
        CHECK((c == strings{"a", "b", "x", "c", "d"}));
    }

    SECTION("negative start")
    {
        auto const removed = c.splice(-2, 1);
        CHECK((removed == strings{"c"}));
        CHECK((c == strings{"a", "b", "d"}));
    }

    SECTION("delete_count clamps to the available elements")
    {
        auto const removed = c.splice(-1, 5);
        CHECK((removed == strings{"d"}));
        CHECK((c == strings{"a", "b", "c"}));
    }

    SECTION("negative delete_count deletes nothing")
    {
        auto const removed = c.splice(0, -3, "z");
        CHECK(removed.empty());
        CHECK((c == strings{"z", "a", "b", "c", "d"}));
    }

    SECTION("start past the end appends")
    {
        auto const removed = c.splice(10, 1, "e");
        CHECK(removed.empty());
        CHECK((c == strings{"a", "b", "c", "d", "e"}));
    }

    SECTION("inserted items may reference removed elements")
    {
        auto const removed = c.splice(0, 2, c[1], c[0]);
        CHECK((removed == strings{"a", "b"}));
        CHECK((c == strings{"b", "a", "c", "d"}));
    }

    SECTION("remove everything")
    {
        auto const removed = c.splice(0, c.length());
        CHECK(removed.length() == 4);
        CHECK(c.empty());
    }
}

TEST("collection - copy_within")
{
    SECTION("copies a region over the front")
    {
        auto c = strings{"a", "b", "c", "d"};
        c.copy_within(0, 2, 4);
        CHECK((c == strings{"c", "d", "c", "d"}));
    }

    auto c = ints{1, 2, 3, 4, 5};

    SECTION("never changes the length")
    {
        c.copy_within(3, 0);
        CHECK((c == ints{1, 2, 3, 1, 2}));
        CHECK(c.length() == 5);
    }

    SECTION("overlapping forward copy reads the original values")
    {
        c.copy_within(1, 0);
        CHECK((c == ints{1, 1, 2, 3, 4}));
    }

    SECTION("overlapping backward copy")
    {
        c.copy_within(0, 3);
        CHECK((c == ints{4, 5, 3, 4, 5}));
    }

    SECTION("negative target")
    {
        c.copy_within(-2, 0);
        CHECK((c == ints{1, 2, 3, 1, 2}));
    }

    SECTION("negative start with omitted end")
    {
        c.copy_within(0, -2);
        CHECK((c == ints{4, 5, 3, 4, 5}));
    }

    SECTION("negative end")
    {
        c.copy_within(1, 0, -2);
        CHECK((c == ints{1, 1, 2, 3, 5}));
    }

    SECTION("negative start together with negative end copies nothing")
    {
        c.copy_within(0, -3, -1);
        CHECK((c == ints{1, 2, 3, 4, 5}));
    }

    SECTION("target past the end copies nothing")
    {
        c.copy_within(10, 0);
        CHECK((c == ints{1, 2, 3, 4, 5}));
    }

    SECTION("returns the receiver")
    {
        auto& result = c.copy_within(0, 4);
        CHECK(&result == &c);
        CHECK((c == ints{5, 2, 3, 4, 5}));
    }
}

TEST("collection - fill")
{
    auto c = strings{"a", "b", "c", "d"};

    SECTION("inner region")
    {
        c.fill("v", 1, 3);
        CHECK((c == strings{"a", "v", "v", "d"}));
    }

    SECTION("everything")
    {
        c.fill("x");
        CHECK((c == strings{"x", "x", "x", "x"}));
    }

    SECTION("negative start")
    {
        c.fill("x", -2);
        CHECK((c == strings{"a", "b", "x", "x"}));
    }

    SECTION("out of range bounds clamp")
    {
        c.fill("x", -10, 10);
        CHECK((c == strings{"x", "x", "x", "x"}));
    }

    SECTION("empty range changes nothing")
    {
        c.fill("x", 3, 1);
        CHECK((c == strings{"a", "b", "c", "d"}));
    }

    SECTION("an element of the collection as fill value")
    {
        c.fill(c[0], 0);
        CHECK((c == strings{"a", "a", "a", "a"}));
    }

    SECTION("returns the receiver and chains")
    {
        auto const n = ints::create_defaulted(4).fill(7, 1).fill(9, -1).length();
        CHECK(n == 4);

        auto& result = c.fill("z", 0, 1);
        CHECK(&result == &c);
    }
}
