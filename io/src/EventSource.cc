/* -- C++ -- */
/**
 *  @file  io/src/EventSource.cc
 *
 *  @brief In-memory and entry-capped event sources.
 */

#include "EventSource.hh"

#include <string>
#include <utility>

#include "AnalysisErrors.hh"

namespace trigeff
{

VectorEventSource::VectorEventSource(std::vector<EventRecord> records)
    : m_records(std::move(records))
{
}

bool VectorEventSource::next(EventRecord &record)
{
    if (m_cursor >= m_records.size())
    {
        return false;
    }
    record = std::move(m_records[m_cursor]);
    ++m_cursor;
    return true;
}

LimitedEventSource::LimitedEventSource(EventSource &source, long long max_entries)
    : m_source(source), m_max_entries(max_entries)
{
    if (max_entries <= 0)
    {
        throw ConfigurationError("Entry cap must be positive, got " + std::to_string(max_entries));
    }
}

bool LimitedEventSource::next(EventRecord &record)
{
    if (m_read >= m_max_entries)
    {
        return false;
    }
    if (!m_source.next(record))
    {
        return false;
    }
    ++m_read;
    return true;
}

} // namespace trigeff
