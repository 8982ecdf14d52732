#include <ordered-core/to_string.hh>
#include <ordered-core/value.hh>

#include <nexus/test.hh>

#include <cmath>

TEST("value - kinds")
{
    CHECK(oc::value().is_undefined());
    CHECK(oc::value::create_undefined().kind() == oc::value::kind_t::undefined);
    CHECK(oc::value::create_null().is_null());
    CHECK(oc::value(nullptr).is_null());
    CHECK(oc::value(true).is_bool());
    CHECK(oc::value(3).is_number());
    CHECK(oc::value(oc::i64(3)).is_number());
    CHECK(oc::value(2.5f).is_number());
    CHECK(oc::value(2.5).is_number());
    CHECK(oc::value("text").is_string());
    CHECK(oc::value(oc::string("text")).is_string());
    CHECK(oc::value('c').is_string());
}

TEST("value - payload access")
{
    CHECK(oc::value(true).as_bool());
    CHECK(oc::value(7).as_number() == 7.0);
    CHECK(oc::value(oc::u8(255)).as_number() == 255.0);
    CHECK(oc::value("hi").as_string() == "hi");
    CHECK(oc::value('c').as_string() == "c");
}

TEST("value - equality")
{
    SECTION("same kind compares payload")
    {
        CHECK(oc::value(1) == oc::value(1.0));
        CHECK(oc::value("a") == oc::value(oc::string("a")));
        CHECK(oc::value(true) != oc::value(false));
        CHECK(oc::value() == oc::value::create_undefined());
        CHECK(oc::value(nullptr) == oc::value::create_null());
    }

    SECTION("different kinds are never equal")
    {
        CHECK(oc::value(1) != oc::value("1"));
        CHECK(oc::value(0) != oc::value(false));
        CHECK(oc::value() != oc::value(nullptr));
        CHECK(oc::value("") != oc::value());
    }

    SECTION("NaN is not equal to itself")
    {
        auto const nan = oc::value(std::nan(""));
        CHECK(nan != nan);
    }
}

TEST("value - ordering")
{
    // kind order: undefined < null < boolean < number < string
    CHECK(oc::value() < oc::value(nullptr));
    CHECK(oc::value(nullptr) < oc::value(false));
    CHECK(oc::value(true) < oc::value(-1000));
    CHECK(oc::value(1e9) < oc::value(""));

    CHECK(oc::value(false) < oc::value(true));
    CHECK(!(oc::value(true) < oc::value(true)));
    CHECK(oc::value(-1) < oc::value(2));
    CHECK(oc::value("abc") < oc::value("abd"));

    SECTION("NaN sorts last among numbers")
    {
        auto const nan = oc::value(std::nan(""));
        CHECK(oc::value(1e300) < nan);
        CHECK(!(nan < oc::value(1e300)));
        CHECK(!(nan < nan));
        CHECK(nan < oc::value("s"));
    }
}

TEST("value - to_string")
{
    CHECK(oc::to_string(oc::value()) == "undefined");
    CHECK(oc::to_string(oc::value(nullptr)) == "null");
    CHECK(oc::to_string(oc::value(true)) == "true");
    CHECK(oc::to_string(oc::value(42)) == "42");
    CHECK(oc::to_string(oc::value(0.25)) == "0.25");
    CHECK(oc::to_string(oc::value("plain")) == "plain");
    CHECK(oc::impl::element_to_string(oc::value(-3)) == "-3");
}
