#ifndef SYS_NODE_GRAPH_HPP_INCLUDED
#define SYS_NODE_GRAPH_HPP_INCLUDED

#include <memory>
#include <string_view>
#include <vector>

#include "HoleList.hpp"
#include "SysCounter.hpp"
#include "SysNode.hpp"

/**
 * @brief Feature switches of a graph instance.
 *
 * A graph without geometry support refuses setGeometry(); code that builds
 * visual helpers must cope with that.
 */
struct NodeGraphCaps
{
    bool geometry = true;
};

/**
 * @brief Owns all scene nodes and their parent/child links.
 *
 * Node ids are HoleList slots: stable while the node lives, recycled after
 * it is destroyed. Code that keeps an id across foreign edits pairs it with
 * the node uid and checks both through alive(). Top-level nodes are kept in creation order and children
 * in insertion order, which defines the traversal order used by every
 * consumer of the graph.
 */
class SysNodeGraph final
{
public:
    explicit SysNodeGraph(NodeGraphCaps caps = {});
    ~SysNodeGraph() = default;

    SysNodeGraph(const SysNodeGraph&)            = delete;
    SysNodeGraph& operator=(const SysNodeGraph&) = delete;

    /**
     * @brief Creates a node, optionally under @p parent.
     * @return The new id, or kInvalidNodeId when @p parent is given but not alive.
     */
    [[nodiscard]] NodeId createNode(std::string_view name, NodeKind kind, NodeId parent = kInvalidNodeId);

    /**
     * @brief Destroys a node and its whole subtree.
     * @return False if @p id is not alive.
     */
    bool destroyNode(NodeId id);

    /**
     * @brief Moves @p id under @p parent (kInvalidNodeId = top level).
     * @return False for dead ids or when the move would create a cycle.
     */
    bool reparent(NodeId id, NodeId parent);

    [[nodiscard]] SysNode*       node(NodeId id) noexcept;
    [[nodiscard]] const SysNode* node(NodeId id) const noexcept;

    [[nodiscard]] bool valid(NodeId id) const noexcept;

    /// True if @p id is alive and still holds the node that was given @p uid.
    [[nodiscard]] bool alive(NodeId id, uint64_t uid) const noexcept;

    [[nodiscard]] const std::vector<NodeId>& roots() const noexcept;

    /// Every live node, depth-first pre-order over the roots.
    [[nodiscard]] std::vector<NodeId> traverse() const;

    /// @p id followed by its descendants in pre-order. Empty for a dead id.
    [[nodiscard]] std::vector<NodeId> subtree(NodeId id) const;

    /// Parent first, root last. Empty for top-level or dead nodes.
    [[nodiscard]] std::vector<NodeId> ancestors(NodeId id) const;

    [[nodiscard]] glm::mat4 worldMatrix(NodeId id) const noexcept;

    /// Own visibility AND the visibility of every ancestor.
    [[nodiscard]] bool effectiveVisible(NodeId id) const noexcept;

    /**
     * @brief Sets the geometry payload.
     * @return False when the node is dead or the graph has no geometry support.
     */
    bool setGeometry(NodeId id, NodeGeometry geometry);

    [[nodiscard]] const NodeGraphCaps& caps() const noexcept;

    [[nodiscard]] int32_t size() const noexcept;

    void clear() noexcept;

    [[nodiscard]] SysCounterPtr changeCounter() const noexcept;

private:
    void collect(NodeId id, std::vector<NodeId>& out) const;
    void detach(NodeId id) noexcept;

    HoleList<std::unique_ptr<SysNode>> m_nodes;
    std::vector<NodeId>                m_roots;
    NodeGraphCaps                      m_caps;
    SysCounterPtr                      m_changeCounter;
    uint64_t                           m_nextUid = 1;
};

#endif // SYS_NODE_GRAPH_HPP_INCLUDED
