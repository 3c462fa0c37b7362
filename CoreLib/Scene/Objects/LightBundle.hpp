//============================================================
// LightBundle.hpp
//============================================================
#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "Light.hpp"
#include "LightHelperBuilders.hpp"
#include "LightVisualSettings.hpp"

class SysNodeGraph;

/**
 * @brief One managed light as a single owned aggregate.
 *
 * A bundle owns up to three scene nodes: the light node, the helper tree and
 * (area lights only) the emissive proxy. They are only edited through the
 * apply*() entry points below, one per concern, which is what keeps their
 * transform and visibility identical.
 *
 * The bundle never outlives its nodes: destroy() removes every member at
 * once. A bundle whose helper or proxy could not be built is partial; the
 * apply*() calls skip the missing members.
 *
 * Members are remembered by id and uid. A member destroyed behind the
 * bundle's back is dropped (and the bundle becomes partial) even when its
 * slot has been handed to a new node.
 *
 * Helper root and proxy always share the light node's parent.
 */
class LightBundle final
{
public:
    LightBundle(LightId id, LightKind kind, std::string name, const LightProperties& props, const LightVisualSettings& settings);
    ~LightBundle() = default;

    LightBundle(const LightBundle&)            = delete;
    LightBundle& operator=(const LightBundle&) = delete;

    // ------------------------------------------------------------
    // Construction
    // ------------------------------------------------------------

    /// Creates the light node. Returns false if the graph refused the node.
    bool buildLight(SysNodeGraph& graph);

    /**
     * @brief Builds the helper with @p builder (owned afterwards).
     *
     * On failure any half-built helper nodes are removed and @p error says why.
     * A null builder is a failure.
     */
    bool buildHelper(SysNodeGraph& graph, std::unique_ptr<LightHelperBuilder> builder, std::string& error);

    /**
     * @brief Builds the emissive proxy plane (area lights).
     *
     * The proxy is the pickable surface of the light: it carries
     * isLightSelector, isLightProxy, keepInRender and lightId.
     */
    bool buildProxy(SysNodeGraph& graph, std::string& error);

    // ------------------------------------------------------------
    // Mutation entry points
    // ------------------------------------------------------------

    /// Light color, helper tint, proxy color and emissive color.
    void applyColor(SysNodeGraph& graph, const glm::vec3& color);

    /// Light intensity, helper opacity and icon scale, proxy emissive intensity.
    void applyIntensity(SysNodeGraph& graph, float intensity);

    /// Same world placement for every member.
    void applyTransform(SysNodeGraph& graph, const glm::vec3& position, const glm::vec3& rotation);

    /// Same visibility for every member.
    void applyVisibility(SysNodeGraph& graph, bool visible);

    /// decay and penumbra: light node only.
    void applyAttenuation(SysNodeGraph& graph, float decay, float penumbra);

    /**
     * @brief Size change: distance, angle, width or height.
     *
     * Updates the light node and regenerates helper and proxy geometry.
     * @return False when a geometry rebuild failed; the light node is updated regardless.
     */
    bool applyShape(SysNodeGraph& graph, const LightProperties& next);

    void rename(SysNodeGraph& graph, std::string_view name);

    /**
     * @brief Re-aligns helper and proxy to the light node.
     *
     * Picks up transform, visibility and parent edits made to the light node
     * directly (e.g. by a transform gizmo or an outliner drag).
     */
    void sync(SysNodeGraph& graph);

    /// Destroys every member node. The bundle is empty afterwards.
    void destroy(SysNodeGraph& graph);

    // ------------------------------------------------------------
    // Queries
    // ------------------------------------------------------------

    [[nodiscard]] LightId                id() const noexcept { return m_id; }
    [[nodiscard]] LightKind              kind() const noexcept { return m_kind; }
    [[nodiscard]] const std::string&     name() const noexcept { return m_name; }
    [[nodiscard]] const LightProperties& properties() const noexcept { return m_props; }
    [[nodiscard]] bool                   visible() const noexcept { return m_visible; }
    [[nodiscard]] bool                   partial() const noexcept { return m_partial; }

    /// True if @p node is the light node, the proxy or any node of the helper tree.
    [[nodiscard]] bool owns(const SysNodeGraph& graph, NodeId node) const;

    [[nodiscard]] ManagedLight snapshot(const SysNodeGraph& graph) const;

private:
    [[nodiscard]] HelperContext context() const noexcept;
    [[nodiscard]] NodeTransform placement() const noexcept;

    void markPartial() noexcept { m_partial = true; }
    void dropStaleMembers(const SysNodeGraph& graph);
    [[nodiscard]] bool isHelperPart(const SysNodeGraph& graph, NodeId id) const;
    void applyLightData(SysNodeGraph& graph) const;
    void applyHelperLook(SysNodeGraph& graph) const;
    void applyProxyLook(SysNodeGraph& graph) const;

    LightId                    m_id;
    LightKind                  m_kind;
    std::string                m_name;
    LightProperties            m_props;
    const LightVisualSettings& m_settings;
    bool                       m_visible = true;
    bool                       m_partial = false;

    NodeId                              m_lightNode = kInvalidNodeId;
    NodeId                              m_proxyNode = kInvalidNodeId;
    uint64_t                            m_lightUid  = 0;
    uint64_t                            m_proxyUid  = 0;
    uint64_t                            m_helperUid = 0;
    HelperParts                         m_helper;
    std::unique_ptr<LightHelperBuilder> m_builder;
};
