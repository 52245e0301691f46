#pragma once

#include <array>

namespace junction
{
    struct Vec2
    {
        double x = 0.0;
        double y = 0.0;
    };

    struct Segment
    {
        Vec2 a;
        Vec2 b;
    };

    // Corners wound from the rear corner at local (-length/2, -width/2)
    using Quad = std::array<Vec2, 4>;

    constexpr double PI = 3.14159265358979323846;

    inline double toRadians(double degrees) { return degrees * PI / 180.0; }
    inline double toDegrees(double radians) { return radians * 180.0 / PI; }

    double distance(const Vec2 &a, const Vec2 &b);

    // Wraps an angle into [-180, 180]
    double normalizeDegrees(double degrees);

    // Signed rotation (degrees, [-180, 180]) that takes `from` onto `to` along the short arc
    double shortestAngleDifference(double from_degrees, double to_degrees);

    // One smoothing step: rotates `current` by half the shortest difference towards `target`
    double interpolateHeading(double current_degrees, double target_degrees, double factor = 0.5);

    // True when c lies counter-clockwise of the directed line a -> b
    bool ccw(const Vec2 &a, const Vec2 &b, const Vec2 &c);

    // Strict crossing test; shared or touching endpoints do not count
    bool segmentsIntersect(const Segment &first, const Segment &second);

    Quad rectangleVertices(const Vec2 &center, double rotation_degrees, double length, double width);
    std::array<Segment, 4> quadEdges(const Quad &quad);

    // Edge-crossing overlap. One rectangle fully containing the other without any edge
    // crossing is not detected; footprints are similar in size so this does not occur.
    bool rectanglesOverlap(const Quad &first, const Quad &second);

    bool carsIntersect(const Vec2 &position_a, double rotation_a,
                       const Vec2 &position_b, double rotation_b,
                       double length, double width);

} // namespace junction
