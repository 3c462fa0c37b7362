#ifndef NODE_TYPES_HPP_INCLUDED
#define NODE_TYPES_HPP_INCLUDED

#include <cstdint>
#include <glm/glm.hpp>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

using NodeId                    = int32_t; // stable slot index from HoleList
constexpr NodeId kInvalidNodeId = -1;

/**
 * @brief Structural tag stamped on a node when it is created.
 *
 * Unknown is reserved for nodes handed over by external code that did not
 * state what they are. Such nodes are classified by inspecting payloads.
 */
enum class NodeKind : uint8_t
{
    Unknown = 0,
    Mesh,
    Light,
    Camera,
    Group,
    Other
};

[[nodiscard]] const char* toString(NodeKind kind) noexcept;

/**
 * @brief Local transform. Rotation is XYZ Euler in radians.
 */
struct NodeTransform
{
    glm::vec3 position = glm::vec3(0.0f);
    glm::vec3 rotation = glm::vec3(0.0f);
    glm::vec3 scale    = glm::vec3(1.0f);

    [[nodiscard]] glm::mat4 matrix() const noexcept;

    bool operator==(const NodeTransform&) const = default;
};

enum class PrimitiveType : uint8_t
{
    Triangles,
    Lines
};

/**
 * @brief Indexed vertex data. Triangles use 3 indices per primitive,
 *        lines use 2. Positions are in node-local space.
 */
struct NodeGeometry
{
    PrimitiveType          primitive = PrimitiveType::Triangles;
    std::vector<glm::vec3> positions = {};
    std::vector<uint32_t>  indices   = {};

    [[nodiscard]] int32_t triangleCount() const noexcept
    {
        return primitive == PrimitiveType::Triangles ? static_cast<int32_t>(indices.size() / 3) : 0;
    }

    [[nodiscard]] bool empty() const noexcept
    {
        return positions.empty() || indices.empty();
    }
};

struct NodeMaterial
{
    glm::vec3 color             = glm::vec3(1.0f);
    glm::vec3 emissive          = glm::vec3(0.0f);
    float     emissiveIntensity = 0.0f;
    float     opacity           = 1.0f;
    bool      transparent       = false;
    bool      wireframe         = false;
    bool      doubleSided       = false;
};

/// Light types the engine can render.
enum class EngineLightType : uint8_t
{
    Ambient,
    Hemisphere,
    Directional,
    Point,
    Spot,
    RectArea
};

/**
 * @brief Engine-side light payload.
 *
 * Which fields are meaningful depends on the type:
 *  - distance/decay: Point, Spot (distance 0 means unlimited)
 *  - angle/penumbra: Spot
 *  - width/height:   RectArea
 */
struct NodeLightData
{
    EngineLightType type       = EngineLightType::Point;
    glm::vec3       color      = glm::vec3(1.0f);
    float           intensity  = 1.0f;
    float           distance   = 0.0f;
    float           decay      = 2.0f;
    float           angle      = 0.52359877559f; // pi/6
    float           penumbra   = 0.0f;
    float           width      = 1.0f;
    float           height     = 1.0f;
    bool            castShadow = false;
};

struct NodeCameraData
{
    float fovDeg    = 45.0f;
    float nearPlane = 0.1f;
    float farPlane  = 5000.0f;
};

using AttributeValue = std::variant<bool, int64_t, double, std::string>;

/**
 * @brief Free-form key/value annotations attached to a node.
 *
 * Tooling marks its nodes through attributes (isHelper, lightId, ...).
 * Values from external sources are untrusted, so readers go through
 * flag()/integer() which tolerate any stored type.
 */
class NodeAttributes
{
public:
    void set(std::string key, AttributeValue value);

    bool erase(std::string_view key);

    [[nodiscard]] bool has(std::string_view key) const noexcept;

    [[nodiscard]] const AttributeValue* get(std::string_view key) const noexcept;

    /**
     * @brief Truthiness of an attribute.
     *
     * Missing keys, false, 0, 0.0 and the empty string are false.
     */
    [[nodiscard]] bool flag(std::string_view key) const noexcept;

    /// Integer view of a bool/int/double attribute. Strings are parsed when they hold a whole number.
    [[nodiscard]] std::optional<int64_t> integer(std::string_view key) const noexcept;

    [[nodiscard]] std::optional<std::string> string(std::string_view key) const;

    [[nodiscard]] bool empty() const noexcept
    {
        return m_values.empty();
    }

    [[nodiscard]] std::size_t size() const noexcept
    {
        return m_values.size();
    }

private:
    std::map<std::string, AttributeValue, std::less<>> m_values;
};

#endif // NODE_TYPES_HPP_INCLUDED
