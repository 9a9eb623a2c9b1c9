/* -- C++ -- */
/**
 *  @file  io/include/EventRecord.hh
 *
 *  @brief Event-level record with named flag lookup.
 */

#ifndef TRIGEFF_IO_EVENT_RECORD_H
#define TRIGEFF_IO_EVENT_RECORD_H

#include <map>
#include <string>
#include <utility>

namespace trigeff
{

/**
 *  \brief One event row as seen by the filter.
 *
 *  Flags are stored as doubles so that boolean, integer and floating-point
 *  branches share one lookup without narrowing. A trigger counts as fired
 *  when its flag is non-zero; the reference selection passes only when its
 *  flag equals 1.
 */
class EventRecord
{
  public:
    using FlagMap = std::map<std::string, double>;

    EventRecord() = default;
    EventRecord(FlagMap flags, double weight) : m_flags(std::move(flags)), m_weight(weight) {}

    /// Throws MissingFieldError when the record has no flag called \p name.
    double flag(const std::string &name) const;
    bool has_flag(const std::string &name) const noexcept;

    bool fired(const std::string &trigger) const { return flag(trigger) != 0.0; }
    bool passes_reference(const std::string &reference) const { return flag(reference) == 1.0; }

    double weight() const noexcept { return m_weight; }
    const FlagMap &flags() const noexcept { return m_flags; }

  private:
    FlagMap m_flags;
    double m_weight = 1.0;
};

} // namespace trigeff

#endif // TRIGEFF_IO_EVENT_RECORD_H
