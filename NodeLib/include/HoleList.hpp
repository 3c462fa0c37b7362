#ifndef HOLE_LIST_HPP_INCLUDED
#define HOLE_LIST_HPP_INCLUDED

#include <cstdint>
#include <type_traits>
#include <utility>
#include <vector>

/**
 * @brief Slot container with stable indices.
 *
 * Removing an element leaves a hole whose index is recycled by a later insert.
 * Indices of live elements never move, which makes them usable as ids.
 * Occupancy is tracked per slot so validity checks are O(1).
 */
template<typename T>
class HoleList
{
public:
    using value_type      = T;
    using reference       = T&;
    using const_reference = const T&;
    using size_type       = std::int32_t;

    HoleList()                               = default;
    HoleList(const HoleList&)                = default;
    HoleList(HoleList&&) noexcept            = default;
    HoleList& operator=(const HoleList&)     = default;
    HoleList& operator=(HoleList&&) noexcept = default;
    ~HoleList()                              = default;

    /// Number of live elements.
    [[nodiscard]] size_type size() const noexcept
    {
        return m_size;
    }

    /// Number of slots, live or not. Valid indices are in [0, slot_count()).
    [[nodiscard]] size_type slot_count() const noexcept
    {
        return static_cast<size_type>(m_elements.size());
    }

    [[nodiscard]] bool empty() const noexcept
    {
        return m_size == 0;
    }

    [[nodiscard]] bool valid(int32_t index) const noexcept
    {
        return index >= 0 && index < slot_count() && m_occupied[index];
    }

    [[nodiscard]] reference operator[](int32_t index) noexcept
    {
        return m_elements[index];
    }

    [[nodiscard]] const_reference operator[](int32_t index) const noexcept
    {
        return m_elements[index];
    }

    // Copy-insert: only enabled if T is copy-constructible
    template<typename Q = T>
    std::enable_if_t<std::is_copy_constructible_v<Q>, int32_t>
    insert(const T& element)
    {
        return insert_impl(element);
    }

    // Move-insert: always enabled
    int32_t insert(T&& element)
    {
        return insert_impl(std::move(element));
    }

    /**
     * @brief Frees the slot at @p index.
     * @return False for an out-of-range index or a slot that is already free.
     */
    bool remove(int32_t index) noexcept
    {
        if (!valid(index))
            return false;

        m_occupied[index] = false;
        m_freeIndices.push_back(index);
        --m_size;
        m_dirty = true;
        return true;
    }

    void clear() noexcept
    {
        m_elements.clear();
        m_occupied.clear();
        m_freeIndices.clear();
        m_cachedValidIndices.clear();
        m_dirty = true;
        m_size  = 0;
    }

    void reserve(size_type amount)
    {
        m_elements.reserve(amount);
        m_occupied.reserve(amount);
    }

    /// Live indices in ascending order. Cached until the next insert/remove.
    [[nodiscard]] const std::vector<int32_t>& valid_indices() const
    {
        if (!m_dirty)
            return m_cachedValidIndices;

        m_cachedValidIndices.clear();
        m_cachedValidIndices.reserve(m_size);
        for (int32_t i = 0; i < slot_count(); ++i)
        {
            if (m_occupied[i])
                m_cachedValidIndices.push_back(i);
        }

        m_dirty = false;
        return m_cachedValidIndices;
    }

private:
    template<typename U>
    int32_t insert_impl(U&& element)
    {
        int32_t index;
        if (m_freeIndices.empty())
        {
            index = slot_count();
            m_elements.push_back(std::forward<U>(element));
            m_occupied.push_back(true);
        }
        else
        {
            index = m_freeIndices.back();
            m_freeIndices.pop_back();
            m_elements[index] = std::forward<U>(element);
            m_occupied[index] = true;
        }
        ++m_size;
        m_dirty = true;
        return index;
    }

    std::vector<T>               m_elements;
    std::vector<bool>            m_occupied;
    std::vector<int32_t>         m_freeIndices;
    mutable std::vector<int32_t> m_cachedValidIndices;
    mutable bool                 m_dirty = true;
    size_type                    m_size  = 0;
};

#endif // HOLE_LIST_HPP_INCLUDED
