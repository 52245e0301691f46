#include "Geometry.hpp"

#include <cmath>

namespace junction
{
    double distance(const Vec2 &a, const Vec2 &b)
    {
        const double dx = a.x - b.x;
        const double dy = a.y - b.y;
        return std::sqrt(dx * dx + dy * dy);
    }

    double normalizeDegrees(double degrees)
    {
        return std::remainder(degrees, 360.0);
    }

    double shortestAngleDifference(double from_degrees, double to_degrees)
    {
        return normalizeDegrees(to_degrees - from_degrees);
    }

    double interpolateHeading(double current_degrees, double target_degrees, double factor)
    {
        const double diff = shortestAngleDifference(current_degrees, target_degrees);
        return normalizeDegrees(current_degrees + diff * factor);
    }

    bool ccw(const Vec2 &a, const Vec2 &b, const Vec2 &c)
    {
        return (c.y - a.y) * (b.x - a.x) > (b.y - a.y) * (c.x - a.x);
    }

    bool segmentsIntersect(const Segment &first, const Segment &second)
    {
        const Vec2 &a = first.a;
        const Vec2 &b = first.b;
        const Vec2 &c = second.a;
        const Vec2 &d = second.b;
        return ccw(a, c, d) != ccw(b, c, d) && ccw(a, b, c) != ccw(a, b, d);
    }

    Quad rectangleVertices(const Vec2 &center, double rotation_degrees, double length, double width)
    {
        const double half_length = length / 2.0;
        const double half_width = width / 2.0;
        const double cos_r = std::cos(toRadians(rotation_degrees));
        const double sin_r = std::sin(toRadians(rotation_degrees));

        auto place = [&](double local_x, double local_y)
        {
            return Vec2{center.x + local_x * cos_r - local_y * sin_r,
                        center.y + local_x * sin_r + local_y * cos_r};
        };

        return {place(-half_length, -half_width),
                place(half_length, -half_width),
                place(half_length, half_width),
                place(-half_length, half_width)};
    }

    std::array<Segment, 4> quadEdges(const Quad &quad)
    {
        std::array<Segment, 4> edges;
        for (std::size_t i = 0; i < quad.size(); ++i)
        {
            edges[i] = Segment{quad[i], quad[(i + 1) % quad.size()]};
        }
        return edges;
    }

    bool rectanglesOverlap(const Quad &first, const Quad &second)
    {
        const auto first_edges = quadEdges(first);
        const auto second_edges = quadEdges(second);
        for (const Segment &edge : first_edges)
        {
            for (const Segment &other : second_edges)
            {
                if (segmentsIntersect(edge, other))
                {
                    return true;
                }
            }
        }
        return false;
    }

    bool carsIntersect(const Vec2 &position_a, double rotation_a,
                       const Vec2 &position_b, double rotation_b,
                       double length, double width)
    {
        return rectanglesOverlap(rectangleVertices(position_a, rotation_a, length, width),
                                 rectangleVertices(position_b, rotation_b, length, width));
    }

} // namespace junction
