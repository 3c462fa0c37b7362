//============================================================
// Light.cpp
//============================================================
#include "Light.hpp"

#include "ColorUtilities.hpp"

const char* toString(LightKind kind) noexcept
{
    switch (kind)
    {
        case LightKind::Ambient:
            return "Ambient";
        case LightKind::Directional:
            return "Directional";
        case LightKind::Point:
            return "Point";
        case LightKind::Spot:
            return "Spot";
        case LightKind::Area:
            return "Area";
    }
    return "Unknown";
}

const char* kindKey(LightKind kind) noexcept
{
    switch (kind)
    {
        case LightKind::Ambient:
            return "ambient";
        case LightKind::Directional:
            return "directional";
        case LightKind::Point:
            return "point";
        case LightKind::Spot:
            return "spot";
        case LightKind::Area:
            return "area";
    }
    return "unknown";
}

LightProperties defaultLightProperties(LightKind kind) noexcept
{
    LightProperties p = {};

    switch (kind)
    {
        case LightKind::Ambient:
            p.intensity = 0.3f;
            p.color     = color::fromInt(0x404040);
            break;

        case LightKind::Directional:
            p.intensity = 1.0f;
            p.position  = glm::vec3(5.0f, 10.0f, 5.0f);
            break;

        case LightKind::Point:
            p.position = glm::vec3(0.0f, 3.0f, 0.0f);
            p.distance = 10.0f;
            p.decay    = 2.0f;
            break;

        case LightKind::Spot:
            p.position = glm::vec3(0.0f, 5.0f, 0.0f);
            p.distance = 10.0f;
            p.angle    = 0.52359877559f; // pi/6
            p.penumbra = 0.1f;
            p.decay    = 2.0f;
            break;

        case LightKind::Area:
            p.position = glm::vec3(0.0f, 3.0f, 0.0f);
            p.width    = 2.0f;
            p.height   = 2.0f;
            break;
    }

    return p;
}

EngineLightType engineLightType(LightKind kind) noexcept
{
    switch (kind)
    {
        case LightKind::Ambient:
            return EngineLightType::Ambient;
        case LightKind::Directional:
            return EngineLightType::Directional;
        case LightKind::Point:
            return EngineLightType::Point;
        case LightKind::Spot:
            return EngineLightType::Spot;
        case LightKind::Area:
            return EngineLightType::RectArea;
    }
    return EngineLightType::Point;
}
