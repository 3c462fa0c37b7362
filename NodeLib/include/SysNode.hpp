#ifndef SYS_NODE_HPP_INCLUDED
#define SYS_NODE_HPP_INCLUDED

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "NodeTypes.hpp"
#include "SysCounter.hpp"

class SysNodeGraph;

/**
 * @brief A single node of the scene graph.
 *
 * Nodes are owned by SysNodeGraph and referenced by NodeId. The node keeps its
 * own data (name, type tag, transform, visibility, attributes and optional
 * payloads); hierarchy links are maintained by the graph, which is the only
 * place that can change them.
 *
 * Every mutating setter bumps the node change counter, which propagates to the
 * graph counter.
 */
class SysNode
{
public:
    SysNode(NodeId id, uint64_t uid, std::string_view name, NodeKind kind);

    SysNode(const SysNode&)            = delete;
    SysNode& operator=(const SysNode&) = delete;

    [[nodiscard]] NodeId id() const noexcept;

    /// Unique per graph. Unlike the id it is never handed out again after the node dies.
    [[nodiscard]] uint64_t uid() const noexcept;

    [[nodiscard]] const std::string& name() const noexcept;
    void                             name(std::string_view name);

    [[nodiscard]] NodeKind kind() const noexcept;
    void                   kind(NodeKind kind) noexcept;

    /// Engine type string, e.g. "GridHelper". Empty when not set.
    [[nodiscard]] const std::string& typeName() const noexcept;
    void                             typeName(std::string_view typeName);

    [[nodiscard]] bool visible() const noexcept;
    void               visible(bool visible) noexcept;

    [[nodiscard]] const NodeTransform& transform() const noexcept;
    void                               transform(const NodeTransform& xf) noexcept;

    void position(const glm::vec3& p) noexcept;
    void rotation(const glm::vec3& r) noexcept;
    void scale(const glm::vec3& s) noexcept;

    [[nodiscard]] const NodeAttributes& attributes() const noexcept;

    /// Mutable attribute access. Marks the node changed.
    [[nodiscard]] NodeAttributes& editAttributes() noexcept;

    // ------------------------------------------------------------
    // Payloads
    // ------------------------------------------------------------

    [[nodiscard]] const NodeGeometry* geometry() const noexcept;

    [[nodiscard]] const NodeMaterial* material() const noexcept;
    [[nodiscard]] NodeMaterial*       material() noexcept;
    void                              material(const NodeMaterial& mat);

    [[nodiscard]] const NodeLightData* light() const noexcept;
    [[nodiscard]] NodeLightData*       light() noexcept;
    void                               light(const NodeLightData& data);

    [[nodiscard]] const NodeCameraData* camera() const noexcept;
    void                                camera(const NodeCameraData& data);

    // ------------------------------------------------------------
    // Hierarchy (read-only, edited through SysNodeGraph)
    // ------------------------------------------------------------

    [[nodiscard]] NodeId                     parent() const noexcept;
    [[nodiscard]] const std::vector<NodeId>& children() const noexcept;
    [[nodiscard]] bool                       hasChildren() const noexcept;

    /// Marks the node changed after edits through material()/light() pointers.
    void touch() noexcept;

    [[nodiscard]] SysCounterPtr changeCounter() const noexcept;

private:
    friend class SysNodeGraph;

    NodeId         m_id;
    uint64_t       m_uid;
    std::string    m_name;
    std::string    m_typeName;
    NodeKind       m_kind;
    bool           m_visible = true;
    NodeTransform  m_transform;
    NodeAttributes m_attributes;

    std::optional<NodeGeometry>   m_geometry;
    std::optional<NodeMaterial>   m_material;
    std::optional<NodeLightData>  m_light;
    std::optional<NodeCameraData> m_camera;

    NodeId              m_parent = kInvalidNodeId;
    std::vector<NodeId> m_children;

    SysCounterPtr m_changeCounter;
};

#endif // SYS_NODE_HPP_INCLUDED
