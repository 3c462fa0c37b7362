//=============================================================================
// LightHelperBuilders.hpp
//=============================================================================
#pragma once

#include <string_view>
#include <vector>

#include "Light.hpp"
#include "LightVisualSettings.hpp"
#include "NodeTypes.hpp"

class SysNodeGraph;

/**
 * @brief Node ids of a light helper tree.
 *
 * The root is a Group whose local transform mirrors the light. Parts are its
 * children; a part a kind does not use stays kInvalidNodeId.
 */
struct HelperParts
{
    NodeId root      = kInvalidNodeId;
    NodeId range     = kInvalidNodeId; ///< Point range sphere, spot cone
    NodeId body      = kInvalidNodeId; ///< Directional axes, area outline
    NodeId markers   = kInvalidNodeId; ///< Area corner markers
    NodeId direction = kInvalidNodeId; ///< Emission direction line
    NodeId selector  = kInvalidNodeId; ///< Pickable solid sphere

    /// Parts whose local scale follows the light intensity.
    std::vector<NodeId> icons;

    /// Every valid part (root excluded).
    [[nodiscard]] std::vector<NodeId> parts() const;
};

/**
 * @brief Inputs to a helper build or rebuild.
 */
struct HelperContext
{
    LightId                    lightId = kInvalidLightId;
    std::string_view           name;
    const LightProperties&     props;
    const LightVisualSettings& settings;
};

/**
 * @brief Builds the viewport helper of one light kind.
 *
 * Builders are registered per kind in an ItemFactory (see
 * config::registerLightHelpers) and owned by the bundle they serve, so the
 * bundle can ask for shape rebuilds later.
 *
 * Every node a builder creates carries isLightHelper, lightId and
 * hideInOutliner; selector parts also carry isLightSelector.
 */
class LightHelperBuilder
{
public:
    virtual ~LightHelperBuilder() = default;

    /**
     * @brief Creates the helper tree.
     *
     * @p out.root is assigned before any part is created so the caller can
     * tear down a half-built tree when this returns false or throws.
     *
     * @return False if a part could not be created (e.g. no geometry support).
     */
    virtual bool build(SysNodeGraph& graph, const HelperContext& ctx, HelperParts& out) = 0;

    /**
     * @brief Regenerates shape geometry after a size change (distance, angle,
     *        width, height). Geometry is rebuilt at the configured resolution,
     *        never rescaled.
     */
    virtual bool rebuild(SysNodeGraph& graph, const HelperContext& ctx, const HelperParts& parts) = 0;

protected:
    LightHelperBuilder() = default;

    /// Creates the tagged helper root group.
    static NodeId makeRoot(SysNodeGraph& graph, const HelperContext& ctx, std::string_view typeName);

    /**
     * @brief Creates a tagged child part with the given geometry.
     * @return kInvalidNodeId if the node or its geometry could not be created.
     */
    static NodeId makePart(SysNodeGraph&       graph,
                           const HelperContext& ctx,
                           NodeId              root,
                           std::string_view    suffix,
                           NodeGeometry        geometry);

    /// Range drawn for a distance, substituting the infinite-range indicator for 0.
    static float shownRange(const HelperContext& ctx) noexcept;
};

class PointHelperBuilder final : public LightHelperBuilder
{
public:
    bool build(SysNodeGraph& graph, const HelperContext& ctx, HelperParts& out) override;
    bool rebuild(SysNodeGraph& graph, const HelperContext& ctx, const HelperParts& parts) override;
};

class SpotHelperBuilder final : public LightHelperBuilder
{
public:
    bool build(SysNodeGraph& graph, const HelperContext& ctx, HelperParts& out) override;
    bool rebuild(SysNodeGraph& graph, const HelperContext& ctx, const HelperParts& parts) override;
};

class DirectionalHelperBuilder final : public LightHelperBuilder
{
public:
    bool build(SysNodeGraph& graph, const HelperContext& ctx, HelperParts& out) override;
    bool rebuild(SysNodeGraph& graph, const HelperContext& ctx, const HelperParts& parts) override;
};

class AreaHelperBuilder final : public LightHelperBuilder
{
public:
    bool build(SysNodeGraph& graph, const HelperContext& ctx, HelperParts& out) override;
    bool rebuild(SysNodeGraph& graph, const HelperContext& ctx, const HelperParts& parts) override;
};
