#pragma once

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>

/**
 * @defgroup Factories Factory System
 * @brief Generic runtime factory for pluggable components looked up by key.
 */

/**
 * @class ItemFactory
 * @brief Generic factory for constructing items by string key.
 *
 * @ingroup Factories
 *
 * Used to look up the helper builder for each light kind
 * (`ItemFactory<LightHelperBuilder>`), filled once at startup by
 * config::registerLightHelpers().
 *
 * Usage example:
 * @code
 * ItemFactory<LightHelperBuilder> builders;
 * builders.registerItem("point", &ItemFactory<LightHelperBuilder>::createItemType<PointHelperBuilder>);
 * auto builder = builders.createItem("point");
 * @endcode
 *
 * @tparam T Base type of items created by the factory.
 */
template<typename T>
class ItemFactory
{
public:
    ItemFactory() = default;

    /// Functor used to create new items.
    using CreateFunc = std::function<std::unique_ptr<T>()>;

    /**
     * @brief Register a new item type under a name.
     *
     * If the name already exists, the previous entry is replaced.
     */
    void registerItem(const std::string& name, CreateFunc createFunc)
    {
        m_registry[name] = std::move(createFunc);
    }

    /// Remove a registration. Returns false if the name was unknown.
    bool unregisterItem(const std::string& name)
    {
        return m_registry.erase(name) > 0;
    }

    [[nodiscard]] bool contains(const std::string& name) const
    {
        return m_registry.find(name) != m_registry.end();
    }

    /**
     * @brief Create an item instance by name.
     * @return A newly constructed item, or nullptr if the name is not registered.
     */
    [[nodiscard]] std::unique_ptr<T> createItem(const std::string& name) const
    {
        if (auto it = m_registry.find(name); it != m_registry.end())
            return it->second();
        return nullptr;
    }

    /**
     * @brief Helper that constructs items of a specific derived type.
     * @tparam Derived The concrete type to construct (must derive from T).
     */
    template<typename Derived>
    static std::unique_ptr<T> createItemType()
    {
        return std::make_unique<Derived>();
    }

private:
    std::unordered_map<std::string, CreateFunc> m_registry;
};
