#include <angles/units/degrees.hpp>
#include <angles/units/dms.hpp>
#include <angles/units/gradians.hpp>
#include <angles/units/radians.hpp>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <cmath>
#include <cstdint>
#include <limits>

using namespace angles;
using Catch::Matchers::WithinULP;

TEST_CASE("DMS init pads omitted components with zero", "[dms]")
{
    REQUIRE(dms::init(13).dms() == Dms{.degrees = 13, .minutes = 0, .seconds = 0.0});
    REQUIRE(dms::init(13, 30).dms() == Dms{.degrees = 13, .minutes = 30, .seconds = 0.0});
    REQUIRE(dms::init(13, 30, 45.0).dms() == Dms{.degrees = 13, .minutes = 30, .seconds = 45.0});
}

TEST_CASE("DMS init accepts irregular components", "[dms]")
{
    const Angle angle = dms::init(-5, 75, -3.5);
    REQUIRE(angle.dms() == Dms{.degrees = -5, .minutes = 75, .seconds = -3.5});
}

TEST_CASE("DMS from degrees", "[dms]")
{
    REQUIRE(
        dms::ensure(degrees::init(90.5)).dms() ==
        Dms{.degrees = 90, .minutes = 30, .seconds = 0.0});

    const Dms split = dms::ensure(degrees::init(166.76624)).dms().value();
    REQUIRE(split.degrees == 166);
    REQUIRE(split.minutes == 45);
    REQUIRE_THAT(split.seconds, WithinULP(58.464000000037686, 0));
}

TEST_CASE("DMS from degrees beyond 32 bits", "[dms]")
{
    const auto [angle, value] = dms::toDms(degrees::init(3.0e9));
    REQUIRE(value == Dms{.degrees = 3000000000, .minutes = 0, .seconds = 0.0});

    const auto [negative, negativeValue] = dms::toDms(degrees::init(-3.0e9 - 0.5));
    REQUIRE(negativeValue == Dms{.degrees = -3000000000, .minutes = -30, .seconds = 0.0});
}

TEST_CASE("DMS from degrees beyond 64 bits keeps the angle modulo a revolution", "[dms]")
{
    const double huge = 1.0e30;
    const auto [angle, value] = dms::toDms(degrees::init(huge));
    REQUIRE(value.degrees == static_cast<std::int64_t>(std::fmod(huge, 360.0)));
    REQUIRE(value.degrees >= 0);
    REQUIRE(value.degrees < 360);
    REQUIRE(value.minutes == 0);
    REQUIRE(value.seconds == 0.0);
    REQUIRE(angle.degrees() == huge);
}

TEST_CASE("DMS from non-finite degrees", "[dms]")
{
    const double inf = std::numeric_limits<double>::infinity();
    const auto [angle, value] = dms::toDms(degrees::init(inf));
    REQUIRE(value.degrees == 0);
    REQUIRE(value.minutes == 0);
    REQUIRE(value.seconds == inf);

    const auto [nanAngle, nanValue] = dms::toDms(degrees::init(std::nan("")));
    REQUIRE(nanValue.degrees == 0);
    REQUIRE(std::isnan(nanValue.seconds));
}

TEST_CASE("DMS from negative degrees truncates toward zero", "[dms]")
{
    const Angle angle = dms::ensure(degrees::init(-13.5));
    REQUIRE(angle.dms() == Dms{.degrees = -13, .minutes = -30, .seconds = 0.0});
}

TEST_CASE("DMS from radians and gradians goes through degrees", "[dms]")
{
    const Angle fromRadians = dms::ensure(radians::init(1.579522973054868));
    REQUIRE(fromRadians.dms() == Dms{.degrees = 90, .minutes = 30, .seconds = 0.0});
    REQUIRE(fromRadians.degrees().has_value());

    const Angle fromGradians = dms::ensure(gradians::init(100.55555555555556));
    REQUIRE(fromGradians.dms() == Dms{.degrees = 90, .minutes = 30, .seconds = 0.0});
    REQUIRE(fromGradians.degrees().has_value());
}

TEST_CASE("Converting to DMS", "[dms]")
{
    const auto [angle, value] = dms::toDms(radians::init(0.5));
    REQUIRE(value.degrees == 28);
    REQUIRE(value.minutes == 38);
    REQUIRE_THAT(value.seconds, WithinULP(52.403123548181156, 0));
    REQUIRE_THAT(angle.degrees().value(), WithinULP(28.64788975654116, 0));
    REQUIRE(dms::ensure(angle) == angle);
}

TEST_CASE("DMS round trip through degrees", "[dms]")
{
    const auto [withDegrees, d] = degrees::toDegrees(dms::init(90, 30));
    REQUIRE(d == 90.5);

    const auto [withDms, back] = dms::toDms(degrees::init(d));
    REQUIRE(back == Dms{.degrees = 90, .minutes = 30, .seconds = 0.0});
}

TEST_CASE("DMS absolute value", "[dms]")
{
    SECTION("negative degrees take the minute and second complement")
    {
        const Angle folded = dms::abs(dms::init(-270, 15, 45.0));
        REQUIRE(folded.dms() == Dms{.degrees = 90, .minutes = 45, .seconds = 15.0});
    }

    SECTION("complete revolutions are discarded")
    {
        const Angle folded = dms::abs(dms::init(1170, 0, 0.0));
        REQUIRE(folded.dms() == Dms{.degrees = 90, .minutes = 0, .seconds = 0.0});
    }

    SECTION("in range values are unchanged")
    {
        const Angle folded = dms::abs(dms::init(360, 10, 5.5));
        REQUIRE(folded.dms() == Dms{.degrees = 360, .minutes = 10, .seconds = 5.5});
    }

    SECTION("the complement is taken once, whatever the number of revolutions")
    {
        const Angle folded = dms::abs(dms::init(-990, 15, 45.0));
        REQUIRE(folded.dms() == Dms{.degrees = 90, .minutes = 45, .seconds = 15.0});
    }

    SECTION("many revolutions beyond 32 bits")
    {
        REQUIRE(
            dms::abs(dms::init(3000000090)).dms() ==
            Dms{.degrees = 210, .minutes = 0, .seconds = 0.0});
        REQUIRE(
            dms::abs(dms::init(-3000000090, 15, 45.0)).dms() ==
            Dms{.degrees = 150, .minutes = 45, .seconds = 15.0});
    }

    SECTION("the complement of the smallest minutes value")
    {
        const auto minutes = std::numeric_limits<std::int32_t>::min();
        const Angle folded = dms::abs(dms::init(-10, minutes, 0.0));
        REQUIRE(folded.dms() == Dms{.degrees = 350, .minutes = 2147483708, .seconds = 60.0});
    }

    SECTION("a whole negative revolution lands on zero degrees")
    {
        const Angle folded = dms::abs(dms::init(-360, 15, 45.0));
        REQUIRE(folded.dms() == Dms{.degrees = 0, .minutes = 45, .seconds = 15.0});
    }

    SECTION("the result holds only DMS")
    {
        const Angle folded = dms::abs(dms::init(-10));
        REQUIRE(folded.dms() == Dms{.degrees = 350, .minutes = 60, .seconds = 60.0});
        REQUIRE_FALSE(folded.degrees().has_value());
    }
}

TEST_CASE("Parse DMS", "[dms]")
{
    const Dms expected{.degrees = 166, .minutes = 45, .seconds = 58.46};

    SECTION("space separated")
    {
        const auto result = dms::parse("166 45 58.46");
        REQUIRE(result.ok());
        REQUIRE(result.value().dms() == expected);
    }

    SECTION("comma separated")
    {
        const auto result = dms::parse("166,45,58.46");
        REQUIRE(result.ok());
        REQUIRE(result.value().dms() == expected);
    }

    SECTION("with symbols")
    {
        const auto result = dms::parse("166° 45′ 58.46″");
        REQUIRE(result.ok());
        REQUIRE(result.value().dms() == expected);
    }

    SECTION("with symbols and no spaces")
    {
        const auto result = dms::parse("166°45′58.46″");
        REQUIRE(result.ok());
        REQUIRE(result.value().dms() == expected);
    }

    SECTION("with ASCII quotes")
    {
        const auto result = dms::parse("166 45' 58.46\"");
        REQUIRE(result.ok());
        REQUIRE(result.value().dms() == expected);
    }

    SECTION("negative")
    {
        const auto result = dms::parse("-166° 45′ 58.46″");
        REQUIRE(result.ok());
        REQUIRE(result.value().dms() == Dms{.degrees = -166, .minutes = 45, .seconds = 58.46});
    }

    SECTION("integer seconds")
    {
        const auto result = dms::parse("90 30 50");
        REQUIRE(result.ok());
        REQUIRE(result.value().dms() == Dms{.degrees = 90, .minutes = 30, .seconds = 50.0});
    }

    SECTION("too few components")
    {
        const auto result = dms::parse("13°");
        REQUIRE_FALSE(result.ok());
        REQUIRE(result.error().kind == ErrorKind::Parse);
        REQUIRE(result.error().message == "Unable to parse value as DMS");
    }

    SECTION("degrees beyond 32 bits")
    {
        const auto result = dms::parse("3000000000 1 1");
        REQUIRE(result.ok());
        REQUIRE(result.value().dms() == Dms{.degrees = 3000000000, .minutes = 1, .seconds = 1.0});
    }

    SECTION("degrees out of integer range")
    {
        const auto result = dms::parse("99999999999999999999 1 1");
        REQUIRE_FALSE(result.ok());
        REQUIRE(result.error().message == "Unable to convert value to integer");
    }
}
