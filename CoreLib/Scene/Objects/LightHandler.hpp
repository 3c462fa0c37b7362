//============================================================
// LightHandler.hpp
//============================================================
#pragma once

#include <array>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "ItemFactory.hpp"
#include "Light.hpp"
#include "LightBundle.hpp"
#include "LightHelperBuilders.hpp"
#include "LightLinks.hpp"
#include "LightVisualSettings.hpp"
#include "SysCounter.hpp"

class SysNodeGraph;

/**
 * @brief Registry of managed lights with stable IDs.
 *
 * Each light is a LightBundle: the light node plus its viewport helper and,
 * for area lights, an emissive proxy. The handler is the only writer of those
 * nodes; every call that changes a bundle goes through the bundle's per-concern
 * entry point and leaves all members on one transform and one visibility.
 *
 * Notes:
 *  - IDs are monotonic and never reused within the lifetime of the handler.
 *  - Helper builders are looked up by kind key in an ItemFactory filled by
 *    config::registerLightHelpers(); callers may replace entries.
 *  - Failures to build a helper or proxy do not fail creation. The bundle is
 *    marked partial and a warning is raised.
 */
class LightHandler final
{
public:
    /// Receives BundleConstructionFailure and shape rebuild warnings.
    using WarningCallback = std::function<void(LightId, const std::string&)>;

    explicit LightHandler(SysNodeGraph& graph, const LightVisualSettings& settings = {});
    ~LightHandler() = default;

    LightHandler(const LightHandler&)            = delete;
    LightHandler& operator=(const LightHandler&) = delete;

    // Bundles reference m_settings.
    LightHandler(LightHandler&&)            = delete;
    LightHandler& operator=(LightHandler&&) = delete;

public:
    /**
     * @brief Creates a light of @p kind with its helper and proxy.
     *
     * Unset LightInit fields take defaultLightProperties(kind). Directional
     * and spot lights without an explicit rotation are aimed at the origin.
     *
     * @return Fresh LightId, or kInvalidLightId if the graph refused the light node.
     */
    LightId create(LightKind kind, const LightInit& init = {});

    /**
     * @brief Sets one property by path and fans it out to the bundle.
     *
     * Paths: intensity, color, position[.x|.y|.z], rotation[.x|.y|.z],
     * distance (alias range), decay, angle, penumbra, width, height.
     *
     * @return False for an unknown id, unknown or inapplicable path, wrong
     *         value type or out-of-range value. Nothing changes on failure.
     */
    bool updateProperty(LightId id, std::string_view path, const PropertyValue& value);

    /// Flips visibility of every bundle member. nullopt for an unknown id.
    std::optional<bool> toggleVisibility(LightId id);

    bool setVisible(LightId id, bool visible);

    /// Destroys the bundle and its light links.
    bool remove(LightId id);

    /// Removes every managed light. IDs keep counting up.
    void clear();

    bool rename(LightId id, std::string_view name);

    /**
     * @brief Ambient fill plus a main and a fill directional light.
     * @return IDs in creation order.
     */
    std::vector<LightId> createDefaultRig();

    /// Re-aligns helpers and proxies with their light nodes.
    void syncAll();

    // ------------------------------------------------------------
    // Queries
    // ------------------------------------------------------------

    [[nodiscard]] std::optional<ManagedLight> get(LightId id) const;

    /// Snapshots in creation order.
    [[nodiscard]] std::vector<ManagedLight> getAll() const;

    [[nodiscard]] std::vector<LightId> ids() const;

    [[nodiscard]] std::size_t count() const noexcept { return m_bundles.size(); }

    [[nodiscard]] bool contains(LightId id) const noexcept { return m_bundles.find(id) != m_bundles.end(); }

    /// Light owning @p node (light node, helper part or proxy), or kInvalidLightId.
    [[nodiscard]] LightId lightIdForNode(NodeId node) const;

    // ------------------------------------------------------------
    // Collaborators
    // ------------------------------------------------------------

    [[nodiscard]] LightLinkTable&       links() noexcept { return m_links; }
    [[nodiscard]] const LightLinkTable& links() const noexcept { return m_links; }

    [[nodiscard]] ItemFactory<LightHelperBuilder>& helperFactory() noexcept { return m_helpers; }

    [[nodiscard]] const LightVisualSettings& settings() const noexcept { return m_settings; }

    void setWarningCallback(WarningCallback cb) { m_onWarning = std::move(cb); }

    [[nodiscard]] SysCounterPtr changeCounter() const noexcept { return m_changeCounter; }

private:
    [[nodiscard]] LightBundle*       bundle(LightId id) noexcept;
    [[nodiscard]] const LightBundle* bundle(LightId id) const noexcept;

    std::string nextName(LightKind kind);
    void        warn(LightId id, const std::string& message) const;

    static void sanitize(LightProperties& p) noexcept;

private:
    SysNodeGraph&                   m_graph;
    const LightVisualSettings       m_settings;
    ItemFactory<LightHelperBuilder> m_helpers;

    std::map<LightId, std::unique_ptr<LightBundle>> m_bundles;

    LightId                m_nextId       = 1;
    std::array<int32_t, 5> m_nameCounters = {};

    LightLinkTable  m_links;
    WarningCallback m_onWarning;
    SysCounterPtr   m_changeCounter;
};
