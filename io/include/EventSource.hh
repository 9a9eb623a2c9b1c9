/* -- C++ -- */
/**
 *  @file  io/include/EventSource.hh
 *
 *  @brief Single-use event stream interfaces.
 */

#ifndef TRIGEFF_IO_EVENT_SOURCE_H
#define TRIGEFF_IO_EVENT_SOURCE_H

#include <cstddef>
#include <vector>

#include "EventRecord.hh"

namespace trigeff
{

/**
 *  \brief Ordered, finite stream of event records.
 *
 *  Each record is produced once; a source is not restartable.
 */
class EventSource
{
  public:
    virtual ~EventSource() = default;

    /// Fills \p record with the next event. Returns false once exhausted.
    virtual bool next(EventRecord &record) = 0;

    /// Number of entries in the underlying dataset, or -1 when unknown.
    virtual long long entries() const { return -1; }
};

class VectorEventSource final : public EventSource
{
  public:
    explicit VectorEventSource(std::vector<EventRecord> records);

    bool next(EventRecord &record) override;
    long long entries() const override { return static_cast<long long>(m_records.size()); }

  private:
    std::vector<EventRecord> m_records;
    std::size_t m_cursor = 0;
};

/** \brief Stops the wrapped source after a fixed number of records. */
class LimitedEventSource final : public EventSource
{
  public:
    LimitedEventSource(EventSource &source, long long max_entries);

    bool next(EventRecord &record) override;
    long long entries() const override { return m_source.entries(); }

  private:
    EventSource &m_source;
    long long m_max_entries;
    long long m_read = 0;
};

} // namespace trigeff

#endif // TRIGEFF_IO_EVENT_SOURCE_H
