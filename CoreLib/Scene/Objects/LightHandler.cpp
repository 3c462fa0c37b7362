//============================================================
// LightHandler.cpp
//============================================================
#include "LightHandler.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <glm/common.hpp>
#include <iostream>
#include <limits>
#include <utility>

#include "ColorUtilities.hpp"
#include "Config.hpp"
#include "CoreUtilities.hpp"
#include "SysNodeGraph.hpp"

namespace
{
    constexpr float kHalfPi = 1.57079632679f;

    enum class Concern
    {
        Color,
        Intensity,
        Transform,
        Attenuation,
        Shape
    };

    std::optional<float> asScalar(const PropertyValue& v) noexcept
    {
        // Finite as a float, not only as a double.
        const double* d = std::get_if<double>(&v);
        if (!d || !std::isfinite(*d) || std::abs(*d) > static_cast<double>(std::numeric_limits<float>::max()))
            return std::nullopt;
        return static_cast<float>(*d);
    }

    std::optional<glm::vec3> asVector(const PropertyValue& v) noexcept
    {
        const glm::vec3* p = std::get_if<glm::vec3>(&v);
        if (!p || !un::is_finite(*p))
            return std::nullopt;
        return *p;
    }

    std::optional<glm::vec3> asColor(const PropertyValue& v) noexcept
    {
        if (const std::string* s = std::get_if<std::string>(&v))
            return color::parseHex(*s);

        auto rgb = asVector(v);
        if (!rgb || rgb->x < 0.0f || rgb->y < 0.0f || rgb->z < 0.0f)
            return std::nullopt;
        return rgb;
    }

    /// "position.y" -> ("position", 1); "position" -> ("position", -1); bad suffix -> index -2.
    std::pair<std::string_view, int> splitPath(std::string_view path) noexcept
    {
        const auto dot = path.find('.');
        if (dot == std::string_view::npos)
            return {path, -1};

        const std::string_view base = path.substr(0, dot);
        const std::string_view comp = path.substr(dot + 1);
        if (comp == "x")
            return {base, 0};
        if (comp == "y")
            return {base, 1};
        if (comp == "z")
            return {base, 2};
        return {base, -2};
    }

    bool hasRange(LightKind k) noexcept
    {
        return k == LightKind::Point || k == LightKind::Spot;
    }

    bool isAimed(LightKind k) noexcept
    {
        return k == LightKind::Directional || k == LightKind::Spot;
    }
} // namespace

LightHandler::LightHandler(SysNodeGraph& graph, const LightVisualSettings& settings) :
    m_graph{graph},
    m_settings{settings},
    m_changeCounter{std::make_shared<SysCounter>()}
{
    config::registerLightHelpers(m_helpers);
}

LightBundle* LightHandler::bundle(LightId id) noexcept
{
    auto it = m_bundles.find(id);
    return it != m_bundles.end() ? it->second.get() : nullptr;
}

const LightBundle* LightHandler::bundle(LightId id) const noexcept
{
    auto it = m_bundles.find(id);
    return it != m_bundles.end() ? it->second.get() : nullptr;
}

void LightHandler::warn(LightId id, const std::string& message) const
{
    std::cerr << "LightHandler: " << message << "\n";

    if (!m_onWarning)
        return;

    try
    {
        m_onWarning(id, message);
    }
    catch (const std::exception& e)
    {
        std::cerr << "LightHandler: warning callback threw: " << e.what() << "\n";
    }
}

std::string LightHandler::nextName(LightKind kind)
{
    const int32_t n = ++m_nameCounters[static_cast<std::size_t>(kind)];
    return std::string(toString(kind)) + " Light " + std::to_string(n);
}

// ------------------------------------------------------------
// create()
// ------------------------------------------------------------

LightId LightHandler::create(LightKind kind, const LightInit& init)
{
    LightProperties p = defaultLightProperties(kind);

    if (init.intensity)
        p.intensity = *init.intensity;
    if (init.color)
        p.color = *init.color;
    if (init.position)
        p.position = *init.position;
    if (init.rotation)
        p.rotation = *init.rotation;
    if (init.distance)
        p.distance = *init.distance;
    if (init.decay)
        p.decay = *init.decay;
    if (init.angle)
        p.angle = *init.angle;
    if (init.penumbra)
        p.penumbra = *init.penumbra;
    if (init.width)
        p.width = *init.width;
    if (init.height)
        p.height = *init.height;

    sanitize(p);

    // Aim at the origin like a default-targeted engine light.
    if (isAimed(kind) && !init.rotation)
        p.rotation = un::aim_rotation(-p.position);

    const LightId     id   = m_nextId++;
    const std::string name = init.name.empty() ? nextName(kind) : init.name;

    auto b = std::make_unique<LightBundle>(id, kind, name, p, m_settings);
    if (!b->buildLight(m_graph))
    {
        std::cerr << "LightHandler: light node could not be created for '" << name << "'\n";
        return kInvalidLightId;
    }

    if (kind != LightKind::Ambient)
    {
        std::string error;
        if (!b->buildHelper(m_graph, m_helpers.createItem(kindKey(kind)), error))
            warn(id, "helper build failed for light " + std::to_string(id) + " (" + kindKey(kind) + "): " + error);
    }

    if (kind == LightKind::Area)
    {
        std::string error;
        if (!b->buildProxy(m_graph, error))
            warn(id, "proxy build failed for light " + std::to_string(id) + " (" + kindKey(kind) + "): " + error);
    }

    b->applyVisibility(m_graph, init.visible);

    m_bundles.emplace(id, std::move(b));
    m_changeCounter->change();
    syncAll();
    return id;
}

// ------------------------------------------------------------
// updateProperty()
// ------------------------------------------------------------

bool LightHandler::updateProperty(LightId id, std::string_view path, const PropertyValue& value)
{
    LightBundle* b = bundle(id);
    if (!b)
        return false;

    const LightKind kind        = b->kind();
    LightProperties next        = b->properties();
    const auto [base, component] = splitPath(path);

    if (component == -2 || (component >= 0 && base != "position" && base != "rotation"))
        return false;

    Concern concern = Concern::Intensity;

    if (base == "intensity")
    {
        auto v = asScalar(value);
        if (!v || *v < 0.0f)
            return false;
        next.intensity = *v;
        concern        = Concern::Intensity;
    }
    else if (base == "color")
    {
        auto c = asColor(value);
        if (!c)
            return false;
        next.color = *c;
        concern    = Concern::Color;
    }
    else if (base == "position" || base == "rotation")
    {
        if (kind == LightKind::Ambient)
            return false;

        glm::vec3& target = (base == "position") ? next.position : next.rotation;
        if (component >= 0)
        {
            auto v = asScalar(value);
            if (!v)
                return false;
            target[component] = *v;
        }
        else
        {
            auto v = asVector(value);
            if (!v)
                return false;
            target = *v;
        }
        concern = Concern::Transform;
    }
    else if (base == "distance" || base == "range")
    {
        auto v = asScalar(value);
        if (!hasRange(kind) || !v || *v < 0.0f)
            return false;
        next.distance = *v;
        concern       = Concern::Shape;
    }
    else if (base == "decay")
    {
        auto v = asScalar(value);
        if (!hasRange(kind) || !v || *v < 0.0f)
            return false;
        next.decay = *v;
        concern    = Concern::Attenuation;
    }
    else if (base == "angle")
    {
        auto v = asScalar(value);
        if (kind != LightKind::Spot || !v || *v <= 0.0f || *v > kHalfPi)
            return false;
        next.angle = *v;
        concern    = Concern::Shape;
    }
    else if (base == "penumbra")
    {
        auto v = asScalar(value);
        if (kind != LightKind::Spot || !v)
            return false;
        next.penumbra = std::clamp(*v, 0.0f, 1.0f);
        concern       = Concern::Attenuation;
    }
    else if (base == "width" || base == "height")
    {
        auto v = asScalar(value);
        if (kind != LightKind::Area || !v || *v <= 0.0f)
            return false;
        (base == "width" ? next.width : next.height) = *v;
        concern                                       = Concern::Shape;
    }
    else
    {
        return false;
    }

    switch (concern)
    {
        case Concern::Color:
            b->applyColor(m_graph, next.color);
            break;
        case Concern::Intensity:
            b->applyIntensity(m_graph, next.intensity);
            break;
        case Concern::Transform:
            b->applyTransform(m_graph, next.position, next.rotation);
            break;
        case Concern::Attenuation:
            b->applyAttenuation(m_graph, next.decay, next.penumbra);
            break;
        case Concern::Shape:
            if (!b->applyShape(m_graph, next))
                warn(id, "geometry rebuild failed for light " + std::to_string(id) + " (" + std::string(path) + ")");
            break;
    }

    m_changeCounter->change();
    syncAll();
    return true;
}

// ------------------------------------------------------------
// Visibility / lifetime
// ------------------------------------------------------------

std::optional<bool> LightHandler::toggleVisibility(LightId id)
{
    LightBundle* b = bundle(id);
    if (!b)
        return std::nullopt;

    const bool next = !b->visible();
    b->applyVisibility(m_graph, next);

    m_changeCounter->change();
    syncAll();
    return next;
}

bool LightHandler::setVisible(LightId id, bool visible)
{
    LightBundle* b = bundle(id);
    if (!b)
        return false;

    if (b->visible() != visible)
    {
        b->applyVisibility(m_graph, visible);
        m_changeCounter->change();
    }

    syncAll();
    return true;
}

bool LightHandler::remove(LightId id)
{
    auto it = m_bundles.find(id);
    if (it == m_bundles.end())
        return false;

    it->second->destroy(m_graph);
    m_bundles.erase(it);
    m_links.removeLight(id);

    m_changeCounter->change();
    syncAll();
    return true;
}

void LightHandler::clear()
{
    for (auto& [id, b] : m_bundles)
        b->destroy(m_graph);

    m_bundles.clear();
    m_links.clear();
    m_changeCounter->change();
}

bool LightHandler::rename(LightId id, std::string_view name)
{
    LightBundle* b = bundle(id);
    if (!b || name.empty())
        return false;

    b->rename(m_graph, name);
    m_changeCounter->change();
    return true;
}

std::vector<LightId> LightHandler::createDefaultRig()
{
    std::vector<LightId> out;
    out.reserve(3);

    LightInit ambient = {};
    ambient.name      = "Ambient Light";
    ambient.intensity = 0.4f;
    ambient.color     = glm::vec3(1.0f);
    out.push_back(create(LightKind::Ambient, ambient));

    LightInit main = {};
    main.name      = "Main Light";
    main.intensity = 1.0f;
    main.position  = glm::vec3(10.0f, 10.0f, 5.0f);
    out.push_back(create(LightKind::Directional, main));

    LightInit fill = {};
    fill.name      = "Fill Light";
    fill.intensity = 0.3f;
    fill.position  = glm::vec3(-5.0f, 5.0f, 10.0f);
    out.push_back(create(LightKind::Directional, fill));

    return out;
}

void LightHandler::syncAll()
{
    for (auto& [id, b] : m_bundles)
        b->sync(m_graph);
}

// ------------------------------------------------------------
// Queries
// ------------------------------------------------------------

std::optional<ManagedLight> LightHandler::get(LightId id) const
{
    const LightBundle* b = bundle(id);
    if (!b)
        return std::nullopt;
    return b->snapshot(m_graph);
}

std::vector<ManagedLight> LightHandler::getAll() const
{
    std::vector<ManagedLight> out;
    out.reserve(m_bundles.size());
    for (const auto& [id, b] : m_bundles)
        out.push_back(b->snapshot(m_graph));
    return out;
}

std::vector<LightId> LightHandler::ids() const
{
    std::vector<LightId> out;
    out.reserve(m_bundles.size());
    for (const auto& [id, b] : m_bundles)
        out.push_back(id);
    return out;
}

LightId LightHandler::lightIdForNode(NodeId node) const
{
    for (const auto& [id, b] : m_bundles)
    {
        if (b->owns(m_graph, node))
            return id;
    }
    return kInvalidLightId;
}

// ------------------------------------------------------------
// sanitize()
// ------------------------------------------------------------

void LightHandler::sanitize(LightProperties& p) noexcept
{
    const LightProperties fallback = {};

    if (!std::isfinite(p.intensity) || p.intensity < 0.0f)
        p.intensity = 0.0f;

    // Color: finite + non-negative (HDR allowed, so no clamp to 1).
    if (!un::is_finite(p.color))
        p.color = fallback.color;
    p.color = glm::max(p.color, glm::vec3(0.0f));

    if (!un::is_finite(p.position))
        p.position = fallback.position;
    if (!un::is_finite(p.rotation))
        p.rotation = fallback.rotation;

    if (!std::isfinite(p.distance) || p.distance < 0.0f)
        p.distance = 0.0f;
    if (!std::isfinite(p.decay) || p.decay < 0.0f)
        p.decay = fallback.decay;

    if (!std::isfinite(p.angle) || p.angle <= 0.0f || p.angle > kHalfPi)
        p.angle = fallback.angle;
    p.penumbra = std::isfinite(p.penumbra) ? std::clamp(p.penumbra, 0.0f, 1.0f) : 0.0f;

    if (!std::isfinite(p.width) || p.width <= 0.0f)
        p.width = fallback.width;
    if (!std::isfinite(p.height) || p.height <= 0.0f)
        p.height = fallback.height;
}
