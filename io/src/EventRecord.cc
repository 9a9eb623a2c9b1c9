/* -- C++ -- */
/**
 *  @file  io/src/EventRecord.cc
 *
 *  @brief Implementation for event record flag lookup.
 */

#include "EventRecord.hh"

#include "AnalysisErrors.hh"

namespace trigeff
{

double EventRecord::flag(const std::string &name) const
{
    const auto it = m_flags.find(name);
    if (it == m_flags.end())
    {
        throw MissingFieldError(name, "event record");
    }
    return it->second;
}

bool EventRecord::has_flag(const std::string &name) const noexcept
{
    return m_flags.find(name) != m_flags.end();
}

} // namespace trigeff
