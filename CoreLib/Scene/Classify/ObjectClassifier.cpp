#include "ObjectClassifier.hpp"

#include <algorithm>
#include <array>
#include <new>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "CoreUtilities.hpp"
#include "SceneTags.hpp"
#include "SysNodeGraph.hpp"

namespace
{
    struct TypeRule
    {
        std::string_view typeName;
        ObjectCategory   category;
    };

    // Engine helper types. Compared case-sensitively, these are code identifiers.
    constexpr std::array<TypeRule, 13> kHelperTypes = {{
        {"GridHelper", ObjectCategory::SystemGrid},
        {"PointLightHelper", ObjectCategory::SystemLightHelper},
        {"DirectionalLightHelper", ObjectCategory::SystemLightHelper},
        {"SpotLightHelper", ObjectCategory::SystemLightHelper},
        {"HemisphereLightHelper", ObjectCategory::SystemLightHelper},
        {"RectAreaLightHelper", ObjectCategory::SystemLightHelper},
        {"CameraHelper", ObjectCategory::SystemCameraHelper},
        {"AxesHelper", ObjectCategory::SystemHelper},
        {"ArrowHelper", ObjectCategory::SystemHelper},
        {"BoxHelper", ObjectCategory::SystemHelper},
        {"Box3Helper", ObjectCategory::SystemHelper},
        {"PlaneHelper", ObjectCategory::SystemHelper},
        {"SkeletonHelper", ObjectCategory::SystemHelper},
    }};

    constexpr std::string_view kTransformControlsType = "TransformControls";

    struct NameRule
    {
        std::array<std::string_view, 2> words; // second word empty for single-word rules
        ObjectCategory                  category;
    };

    // Most specific first.
    constexpr std::array<NameRule, 12> kNameRules = {{
        {{"light", "helper"}, ObjectCategory::SystemLightHelper},
        {{"camera", "helper"}, ObjectCategory::SystemCameraHelper},
        {{"grid", ""}, ObjectCategory::SystemGrid},
        {{"helper", ""}, ObjectCategory::SystemGizmo},
        {{"gizmo", ""}, ObjectCategory::SystemGizmo},
        {{"target", ""}, ObjectCategory::SystemGizmo},
        {{"selector", ""}, ObjectCategory::SystemGizmo},
        {{"control", ""}, ObjectCategory::SystemGizmo},
        {{"handle", ""}, ObjectCategory::SystemGizmo},
        {{"arrow", ""}, ObjectCategory::SystemGizmo},
        {{"axis", ""}, ObjectCategory::SystemGizmo},
        {{"axes", ""}, ObjectCategory::SystemGizmo},
    }};

    bool tokenMatches(const std::string& token, std::string_view word) noexcept
    {
        // Prefix match so plurals and suffixes still count: "helpers", "controls", "handle2".
        return token.size() >= word.size() && std::string_view(token).substr(0, word.size()) == word;
    }

    std::optional<ObjectCategory> fromAttributes(const NodeAttributes& attrs) noexcept
    {
        if (attrs.flag(tags::kIsSystemObject) || attrs.flag(tags::kIsHelper))
            return ObjectCategory::SystemHelper;

        if (attrs.flag(tags::kIsLightHelper) || attrs.has(tags::kLightId))
            return ObjectCategory::SystemLightHelper;

        if (attrs.flag(tags::kIsTransformHandle))
            return ObjectCategory::TransformHandle;

        if (attrs.flag(tags::kIsTransformControl) || attrs.flag(tags::kIsGizmo))
            return ObjectCategory::TransformControl;

        return std::nullopt;
    }

    bool isTransformControlRoot(const SysNode& n) noexcept
    {
        return n.attributes().flag(tags::kIsTransformControl) ||
               n.typeName() == kTransformControlsType ||
               n.name().find("TransformControl") != std::string::npos;
    }

    std::optional<ObjectCategory> fromHelperType(const std::string& typeName) noexcept
    {
        if (typeName.empty())
            return std::nullopt;

        if (typeName == kTransformControlsType)
            return ObjectCategory::TransformControl;

        for (const TypeRule& rule : kHelperTypes)
        {
            if (rule.typeName == typeName)
                return rule.category;
        }
        return std::nullopt;
    }

    bool isAxisCode(std::string_view name) noexcept
    {
        if (un::equals_nocase(name, "e") || un::equals_nocase(name, "start") || un::equals_nocase(name, "end"))
            return true;

        if (name.empty() || name.size() > 3)
            return false;

        return std::all_of(name.begin(), name.end(), [](char c) {
            return c == 'x' || c == 'y' || c == 'z' || c == 'X' || c == 'Y' || c == 'Z';
        });
    }

    std::optional<ObjectCategory> fromNamePatterns(const std::string& name)
    {
        const std::vector<std::string> tokens = un::name_tokens(name);
        if (tokens.empty())
            return std::nullopt;

        for (const NameRule& rule : kNameRules)
        {
            const bool twoWords = !rule.words[1].empty();
            for (std::size_t i = 0; i < tokens.size(); ++i)
            {
                if (!tokenMatches(tokens[i], rule.words[0]))
                    continue;

                if (!twoWords)
                    return rule.category;

                if (i + 1 < tokens.size() && tokenMatches(tokens[i + 1], rule.words[1]))
                    return rule.category;
            }
        }
        return std::nullopt;
    }

    std::optional<ObjectCategory> fromKind(const SysNode& n) noexcept
    {
        switch (n.kind())
        {
            case NodeKind::Mesh:
                return ObjectCategory::UserMesh;
            case NodeKind::Light:
                return ObjectCategory::UserLight;
            case NodeKind::Camera:
                return ObjectCategory::UserCamera;
            case NodeKind::Group:
                if (n.hasChildren())
                    return ObjectCategory::UserGroup;
                return std::nullopt;
            case NodeKind::Other:
                return std::nullopt;
            case NodeKind::Unknown:
                break;
        }

        // Untagged node from outside: look at what it carries.
        if (n.light())
            return ObjectCategory::UserLight;
        if (n.camera())
            return ObjectCategory::UserCamera;
        if (n.geometry() && !n.geometry()->empty())
            return ObjectCategory::UserMesh;
        if (n.hasChildren() && !n.geometry())
            return ObjectCategory::UserGroup;

        return std::nullopt;
    }

    ObjectCategory classifyImpl(const SysNodeGraph& graph, NodeId id)
    {
        const SysNode* n = graph.node(id);
        if (!n)
            return ObjectCategory::Unknown;

        if (auto c = fromAttributes(n->attributes()))
            return *c;

        for (NodeId a : graph.ancestors(id))
        {
            const SysNode* an = graph.node(a);
            if (an && isTransformControlRoot(*an))
                return ObjectCategory::TransformControl;
        }

        if (auto c = fromHelperType(n->typeName()))
            return *c;

        if (isAxisCode(n->name()))
            return ObjectCategory::TransformHandle;

        if (auto c = fromNamePatterns(n->name()))
            return *c;

        if (auto c = fromKind(*n))
            return *c;

        return ObjectCategory::Unknown;
    }
} // namespace

namespace classifier
{
    ObjectCategory classify(const SysNodeGraph& graph, NodeId id) noexcept
    {
        try
        {
            return classifyImpl(graph, id);
        }
        catch (const std::bad_alloc&)
        {
            return ObjectCategory::Unknown;
        }
    }

    bool isUserContent(const SysNodeGraph& graph, NodeId id) noexcept
    {
        return isUserCategory(classify(graph, id));
    }

    bool isSystemObject(const SysNodeGraph& graph, NodeId id) noexcept
    {
        return isSystemCategory(classify(graph, id));
    }
} // namespace classifier
