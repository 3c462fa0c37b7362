#include "SceneFilter.hpp"

#include <iostream>
#include <unordered_map>

#include "ObjectClassifier.hpp"
#include "SceneTags.hpp"
#include "SysNodeGraph.hpp"

namespace filter
{
    std::vector<FilteredNode> apply(const SysNodeGraph&     graph,
                                    std::span<const NodeId> nodes,
                                    const FilterQuery&      query)
    {
        std::vector<FilteredNode> out;
        out.reserve(nodes.size());

        for (NodeId id : nodes)
        {
            const SysNode* n = graph.node(id);
            if (!n)
                continue;

            if (query.requireVisible && !graph.effectiveVisible(id))
                continue;

            const NodeAttributes& attrs = n->attributes();
            if (query.honorHideInOutliner && attrs.flag(tags::kHideInOutliner))
                continue;

            const ObjectCategory category = classifier::classify(graph, id);

            if (category == ObjectCategory::Unknown && query.logUnknown)
                std::cerr << "SceneFilter: node " << id << " ('" << n->name() << "') did not match any category\n";

            const bool selector = query.includeLightSelectors && attrs.flag(tags::kIsLightSelector);
            if (!selector && !query.includes(category))
                continue;

            out.push_back(FilteredNode{id, category});
        }

        return out;
    }

    std::vector<FilteredNode> applyToScene(const SysNodeGraph& graph, const FilterQuery& query)
    {
        const std::vector<NodeId> all = graph.traverse();
        return apply(graph, all, query);
    }

    FilterQuery outliner(bool showSystemHelpers) noexcept
    {
        FilterQuery q;
        q.with(ObjectCategory::UserMesh)
            .with(ObjectCategory::UserLight)
            .with(ObjectCategory::UserCamera)
            .with(ObjectCategory::UserGroup);

        if (showSystemHelpers)
        {
            q.with(ObjectCategory::SystemHelper)
                .with(ObjectCategory::SystemGrid)
                .with(ObjectCategory::SystemLightHelper)
                .with(ObjectCategory::SystemCameraHelper);
        }

        // SystemGizmo, TransformControl and TransformHandle are never listed.
        q.honorHideInOutliner = true;
        return q;
    }

    FilterQuery pickable() noexcept
    {
        FilterQuery q;
        q.with(ObjectCategory::UserMesh);
        q.includeLightSelectors = true;
        q.requireVisible        = true;
        return q;
    }

    FilterQuery exportVisible() noexcept
    {
        FilterQuery q;
        q.with(ObjectCategory::UserMesh)
            .with(ObjectCategory::UserLight)
            .with(ObjectCategory::UserCamera)
            .with(ObjectCategory::UserGroup)
            .with(ObjectCategory::Unknown);
        return q;
    }

    FilterQuery userMeshes() noexcept
    {
        FilterQuery q;
        q.with(ObjectCategory::UserMesh);
        return q;
    }

    std::string displayName(const SysNodeGraph& graph, NodeId id)
    {
        const SysNode* n = graph.node(id);
        if (!n)
            return {};

        if (!n->name().empty())
            return n->name();

        const char* kind = n->typeName().empty() ? toString(n->kind()) : n->typeName().c_str();
        return std::string(kind) + " " + std::to_string(id);
    }

    std::vector<OutlinerRow> outlinerRows(const SysNodeGraph& graph, bool showSystemHelpers)
    {
        const std::vector<FilteredNode> listed = applyToScene(graph, outliner(showSystemHelpers));

        std::unordered_map<NodeId, int32_t> depthOf;
        depthOf.reserve(listed.size());

        std::vector<OutlinerRow> rows;
        rows.reserve(listed.size());

        // Traversal order guarantees listed ancestors come before their descendants.
        for (const FilteredNode& fn : listed)
        {
            int32_t depth = 0;
            for (NodeId a : graph.ancestors(fn.id))
            {
                if (auto it = depthOf.find(a); it != depthOf.end())
                {
                    depth = it->second + 1;
                    break;
                }
            }
            depthOf[fn.id] = depth;

            rows.push_back(OutlinerRow{fn.id, displayName(graph, fn.id), fn.category, depth});
        }

        return rows;
    }
} // namespace filter
