#include "NodeTypes.hpp"

#include <charconv>
#include <cmath>
#include <glm/gtc/matrix_transform.hpp>

const char* toString(NodeKind kind) noexcept
{
    switch (kind)
    {
        case NodeKind::Unknown:
            return "Object";
        case NodeKind::Mesh:
            return "Mesh";
        case NodeKind::Light:
            return "Light";
        case NodeKind::Camera:
            return "Camera";
        case NodeKind::Group:
            return "Group";
        case NodeKind::Other:
            return "Object";
    }
    return "Object";
}

glm::mat4 NodeTransform::matrix() const noexcept
{
    // T * Rz * Ry * Rx * S, i.e. XYZ Euler order.
    glm::mat4 m = glm::translate(glm::mat4(1.0f), position);
    m           = glm::rotate(m, rotation.z, glm::vec3(0.0f, 0.0f, 1.0f));
    m           = glm::rotate(m, rotation.y, glm::vec3(0.0f, 1.0f, 0.0f));
    m           = glm::rotate(m, rotation.x, glm::vec3(1.0f, 0.0f, 0.0f));
    return glm::scale(m, scale);
}

void NodeAttributes::set(std::string key, AttributeValue value)
{
    m_values.insert_or_assign(std::move(key), std::move(value));
}

bool NodeAttributes::erase(std::string_view key)
{
    auto it = m_values.find(key);
    if (it == m_values.end())
        return false;

    m_values.erase(it);
    return true;
}

bool NodeAttributes::has(std::string_view key) const noexcept
{
    return m_values.find(key) != m_values.end();
}

const AttributeValue* NodeAttributes::get(std::string_view key) const noexcept
{
    auto it = m_values.find(key);
    return it != m_values.end() ? &it->second : nullptr;
}

bool NodeAttributes::flag(std::string_view key) const noexcept
{
    const AttributeValue* v = get(key);
    if (!v)
        return false;

    if (const bool* b = std::get_if<bool>(v))
        return *b;
    if (const int64_t* i = std::get_if<int64_t>(v))
        return *i != 0;
    if (const double* d = std::get_if<double>(v))
        return *d != 0.0 && !std::isnan(*d);
    if (const std::string* s = std::get_if<std::string>(v))
        return !s->empty();

    return false;
}

std::optional<int64_t> NodeAttributes::integer(std::string_view key) const noexcept
{
    const AttributeValue* v = get(key);
    if (!v)
        return std::nullopt;

    if (const bool* b = std::get_if<bool>(v))
        return *b ? 1 : 0;
    if (const int64_t* i = std::get_if<int64_t>(v))
        return *i;
    if (const double* d = std::get_if<double>(v))
    {
        if (!std::isfinite(*d) || std::trunc(*d) != *d)
            return std::nullopt;
        return static_cast<int64_t>(*d);
    }
    if (const std::string* s = std::get_if<std::string>(v))
    {
        int64_t     out   = 0;
        const char* first = s->data();
        const char* last  = s->data() + s->size();
        auto [ptr, ec]    = std::from_chars(first, last, out);
        if (ec != std::errc{} || ptr != last || s->empty())
            return std::nullopt;
        return out;
    }

    return std::nullopt;
}

std::optional<std::string> NodeAttributes::string(std::string_view key) const
{
    const AttributeValue* v = get(key);
    if (!v)
        return std::nullopt;

    if (const std::string* s = std::get_if<std::string>(v))
        return *s;

    return std::nullopt;
}
