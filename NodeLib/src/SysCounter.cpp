#include "SysCounter.hpp"

#include <algorithm>

void SysCounter::change() noexcept
{
    ++m_value;

    for (const SysCounterPtr& parent : m_parents)
    {
        if (parent)
            parent->change();
    }
}

bool SysCounter::addParent(const SysCounterPtr& parent)
{
    if (!parent || parent.get() == this)
        return false;

    if (std::find(m_parents.begin(), m_parents.end(), parent) != m_parents.end())
        return false;

    m_parents.push_back(parent);
    return true;
}

uint64_t SysCounter::value() const noexcept
{
    return m_value;
}

/// ---------------------------------------------
/// SysMonitor implementation
/// ---------------------------------------------

SysMonitor::SysMonitor(SysCounterPtr counter) : m_counter{std::move(counter)}
{
}

bool SysMonitor::changed() noexcept
{
    if (!m_counter)
        return false;

    const uint64_t value = m_counter->value();
    if (m_primed && value == m_prevValue)
        return false;

    m_prevValue = value;
    m_primed    = true;
    return true;
}

void SysMonitor::reset() noexcept
{
    m_primed = false;
}
