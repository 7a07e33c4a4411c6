#include <angles/angle.hpp>
#include <angles/format.hpp>
#include <angles/literal.hpp>
#include <angles/trig.hpp>
#include <angles/units/degrees.hpp>
#include <angles/units/dms.hpp>
#include <angles/units/gradians.hpp>
#include <angles/units/radians.hpp>

#include <fmt/core.h>

#include <cstdio>
#include <exception>
#include <tuple>

using namespace angles;

void printHelp()
{
    std::printf("Usage:\n\tangle-tool <unit> <value>\n\n\t<unit> is one of d, r, g, dms\n");
}

int main(int argc, char** argv)
try
{
    if (argc != 3)
    {
        printHelp();
        return 0;
    }

    Angle angle = Angle::zero();
    try
    {
        angle = parseLiteral(argv[2], argv[1]);
    }
    catch (const InvalidAngle& e)
    {
        fmt::println(stderr, "Invalid angle \"{}\": {}", argv[2], e.what());
        return 1;
    }

    fmt::println("angle:     {}", angle);

    double inDegrees = 0.0;
    std::tie(angle, inDegrees) = degrees::toDegrees(angle);
    double inRadians = 0.0;
    std::tie(angle, inRadians) = radians::toRadians(angle);
    double inGradians = 0.0;
    std::tie(angle, inGradians) = gradians::toGradians(angle);
    Dms inDms;
    std::tie(angle, inDms) = dms::toDms(angle);

    fmt::println("degrees:   {}", inDegrees);
    fmt::println("radians:   {}", inRadians);
    fmt::println("gradians:  {}", inGradians);
    fmt::println("dms:       {} {} {}", inDms.degrees, inDms.minutes, inDms.seconds);
    fmt::println("abs:       {}", absoluteValue(angle));

    double sine = 0.0;
    std::tie(angle, sine) = trig::sin(angle);
    double cosine = 0.0;
    std::tie(angle, cosine) = trig::cos(angle);
    double tangent = 0.0;
    std::tie(angle, tangent) = trig::tan(angle);

    fmt::println("sin:       {}", sine);
    fmt::println("cos:       {}", cosine);
    fmt::println("tan:       {}", tangent);
}
catch (const std::exception& e)
{
    fmt::println(stderr, "Exception occurred. {}", e.what());
    return 1;
}
catch (...)
{
    fmt::println(stderr, "Unknown exception occurred.");
    return 1;
}
