#include "HelperPrimitives.hpp"

#include <algorithm>
#include <cmath>

namespace
{
    constexpr float kPi = 3.14159265358979323846f;

    void addSegment(NodeGeometry& geo, const glm::vec3& a, const glm::vec3& b)
    {
        const auto base = static_cast<uint32_t>(geo.positions.size());
        geo.positions.push_back(a);
        geo.positions.push_back(b);
        geo.indices.push_back(base);
        geo.indices.push_back(base + 1);
    }

    // Closed polyline through a circle of points built by @p at(angle).
    template<typename Fn>
    void addCircle(NodeGeometry& geo, int segments, Fn at)
    {
        const auto base = static_cast<uint32_t>(geo.positions.size());
        for (int i = 0; i < segments; ++i)
        {
            const float t = (float(i) / float(segments)) * (2.0f * kPi);
            geo.positions.push_back(at(t));
        }
        for (int i = 0; i < segments; ++i)
        {
            geo.indices.push_back(base + uint32_t(i));
            geo.indices.push_back(base + uint32_t((i + 1) % segments));
        }
    }
} // namespace

namespace Primitives
{
    NodeGeometry wireSphere(float radius, int segments)
    {
        segments = std::max(8, segments);

        NodeGeometry geo;
        geo.primitive = PrimitiveType::Lines;

        addCircle(geo, segments, [&](float t) { return glm::vec3(std::cos(t), std::sin(t), 0.0f) * radius; });
        addCircle(geo, segments, [&](float t) { return glm::vec3(std::cos(t), 0.0f, std::sin(t)) * radius; });
        addCircle(geo, segments, [&](float t) { return glm::vec3(0.0f, std::cos(t), std::sin(t)) * radius; });

        return geo;
    }

    NodeGeometry solidSphere(float radius, int rings, int sides)
    {
        rings = std::max(2, rings);
        sides = std::max(3, sides);

        NodeGeometry geo;
        geo.primitive = PrimitiveType::Triangles;

        // Poles are shared vertices; rings-1 latitude circles in between.
        geo.positions.push_back(glm::vec3(0.0f, radius, 0.0f));
        for (int r = 1; r < rings; ++r)
        {
            const float phi = kPi * float(r) / float(rings);
            const float y   = std::cos(phi) * radius;
            const float rr  = std::sin(phi) * radius;
            for (int s = 0; s < sides; ++s)
            {
                const float theta = 2.0f * kPi * float(s) / float(sides);
                geo.positions.push_back(glm::vec3(std::cos(theta) * rr, y, std::sin(theta) * rr));
            }
        }
        geo.positions.push_back(glm::vec3(0.0f, -radius, 0.0f));

        const uint32_t top    = 0;
        const uint32_t bottom = static_cast<uint32_t>(geo.positions.size() - 1);
        auto           ringV  = [&](int r, int s) { return uint32_t(1 + (r - 1) * sides + (s % sides)); };

        for (int s = 0; s < sides; ++s)
        {
            geo.indices.insert(geo.indices.end(), {top, ringV(1, s + 1), ringV(1, s)});
        }

        for (int r = 1; r < rings - 1; ++r)
        {
            for (int s = 0; s < sides; ++s)
            {
                const uint32_t a = ringV(r, s);
                const uint32_t b = ringV(r, s + 1);
                const uint32_t c = ringV(r + 1, s + 1);
                const uint32_t d = ringV(r + 1, s);
                geo.indices.insert(geo.indices.end(), {a, b, c, a, c, d});
            }
        }

        for (int s = 0; s < sides; ++s)
        {
            geo.indices.insert(geo.indices.end(), {bottom, ringV(rings - 1, s), ringV(rings - 1, s + 1)});
        }

        return geo;
    }

    NodeGeometry wireCone(float length, float angleRad, int segments, int spokes)
    {
        segments = std::max(8, segments);
        spokes   = std::max(0, spokes);

        NodeGeometry geo;
        geo.primitive = PrimitiveType::Lines;

        const float rr = std::tan(std::clamp(angleRad, 0.0f, 1.5607964f)) * length;

        addCircle(geo, segments, [&](float t) { return glm::vec3(std::cos(t) * rr, std::sin(t) * rr, -length); });

        for (int i = 0; i < spokes; ++i)
        {
            const float t = (float(i) / float(spokes)) * (2.0f * kPi);
            addSegment(geo, glm::vec3(0.0f), glm::vec3(std::cos(t) * rr, std::sin(t) * rr, -length));
        }

        return geo;
    }

    NodeGeometry line(const glm::vec3& a, const glm::vec3& b)
    {
        NodeGeometry geo;
        geo.primitive = PrimitiveType::Lines;
        addSegment(geo, a, b);
        return geo;
    }

    NodeGeometry axes(float length)
    {
        NodeGeometry geo;
        geo.primitive = PrimitiveType::Lines;
        addSegment(geo, glm::vec3(0.0f), glm::vec3(length, 0.0f, 0.0f));
        addSegment(geo, glm::vec3(0.0f), glm::vec3(0.0f, length, 0.0f));
        addSegment(geo, glm::vec3(0.0f), glm::vec3(0.0f, 0.0f, length));
        return geo;
    }

    NodeGeometry rectOutline(float width, float height)
    {
        const float hw = 0.5f * width;
        const float hh = 0.5f * height;

        NodeGeometry geo;
        geo.primitive = PrimitiveType::Lines;
        geo.positions = {
            glm::vec3(-hw, -hh, 0.0f),
            glm::vec3(hw, -hh, 0.0f),
            glm::vec3(hw, hh, 0.0f),
            glm::vec3(-hw, hh, 0.0f),
        };
        geo.indices = {0, 1, 1, 2, 2, 3, 3, 0};
        return geo;
    }

    NodeGeometry cornerMarkers(float width, float height, float size)
    {
        const float hw = 0.5f * width;
        const float hh = 0.5f * height;
        const float s  = std::min({size, hw, hh});

        NodeGeometry geo;
        geo.primitive = PrimitiveType::Lines;

        for (const glm::vec2 sign : {glm::vec2(-1, -1), glm::vec2(1, -1), glm::vec2(1, 1), glm::vec2(-1, 1)})
        {
            const glm::vec3 corner(sign.x * hw, sign.y * hh, 0.0f);
            addSegment(geo, corner, corner - glm::vec3(sign.x * s, 0.0f, 0.0f));
            addSegment(geo, corner, corner - glm::vec3(0.0f, sign.y * s, 0.0f));
        }
        return geo;
    }

    NodeGeometry plane(float width, float height)
    {
        const float hw = 0.5f * width;
        const float hh = 0.5f * height;

        NodeGeometry geo;
        geo.primitive = PrimitiveType::Triangles;
        geo.positions = {
            glm::vec3(-hw, -hh, 0.0f),
            glm::vec3(hw, -hh, 0.0f),
            glm::vec3(hw, hh, 0.0f),
            glm::vec3(-hw, hh, 0.0f),
        };
        geo.indices = {0, 1, 2, 0, 2, 3};
        return geo;
    }
} // namespace Primitives
