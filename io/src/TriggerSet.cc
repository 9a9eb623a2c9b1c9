/* -- C++ -- */
/**
 *  @file  io/src/TriggerSet.cc
 *
 *  @brief Implementation for the trigger name set.
 */

#include "TriggerSet.hh"

#include <algorithm>
#include <cctype>
#include <unordered_set>
#include <utility>

#include "AnalysisErrors.hh"

namespace trigeff
{

namespace
{

std::string strip(const std::string &s)
{
    auto notspace = [](unsigned char c)
    {
        return std::isspace(c) == 0;
    };
    const auto first = std::find_if(s.begin(), s.end(), notspace);
    const auto last = std::find_if(s.rbegin(), s.rend(), notspace).base();
    if (first >= last)
    {
        return std::string();
    }
    return std::string(first, last);
}

}

TriggerSet::TriggerSet(const std::vector<std::string> &names)
{
    std::unordered_set<std::string> seen;
    m_names.reserve(names.size());
    for (const auto &raw : names)
    {
        std::string name = strip(raw);
        if (name.empty())
        {
            continue;
        }
        if (seen.insert(name).second)
        {
            m_names.push_back(std::move(name));
        }
    }

    if (m_names.empty())
    {
        throw ConfigurationError("Trigger set is empty.");
    }
}

bool TriggerSet::contains(const std::string &name) const
{
    return std::find(m_names.begin(), m_names.end(), name) != m_names.end();
}

} // namespace trigeff
