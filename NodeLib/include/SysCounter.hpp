#ifndef SYS_COUNTER_HPP_INCLUDED
#define SYS_COUNTER_HPP_INCLUDED

#include <cstdint>
#include <memory>
#include <vector>

/**
 * @brief Shared pointer to a SysCounter.
 */
class SysCounter;
using SysCounterPtr = std::shared_ptr<SysCounter>;

/**
 * @brief Version counter used to detect scene graph changes.
 *
 * Every node owns a counter whose parent is the graph counter, so a
 * change to any node is visible on the graph as a whole. Consumers that
 * cache derived data (picking acceleration, outliner rows) compare values
 * instead of subscribing to events.
 */
class SysCounter
{
public:
    SysCounter() = default;

    /**
     * @brief Increments the counter and every parent counter.
     */
    void change() noexcept;

    /**
     * @brief Adds a parent counter that is bumped whenever this one changes.
     * @return False for a null parent, a duplicate, or this counter itself.
     */
    bool addParent(const SysCounterPtr& parent);

    [[nodiscard]] uint64_t value() const noexcept;

private:
    std::vector<SysCounterPtr> m_parents;
    uint64_t                   m_value{0};
};

/**
 * @brief Remembers a counter value and reports whether it moved since.
 *
 * A fresh monitor reports a change on its first query so that caches
 * built lazily from it are populated once.
 */
class SysMonitor
{
public:
    explicit SysMonitor(SysCounterPtr counter);

    /**
     * @brief True if the counter changed since the last call (or construction).
     */
    [[nodiscard]] bool changed() noexcept;

    /// Forget the remembered value; the next changed() returns true.
    void reset() noexcept;

private:
    SysCounterPtr m_counter;
    uint64_t      m_prevValue{0};
    bool          m_primed{false};
};

#endif // SYS_COUNTER_HPP_INCLUDED
