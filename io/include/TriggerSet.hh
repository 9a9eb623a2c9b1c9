/* -- C++ -- */
/**
 *  @file  io/include/TriggerSet.hh
 *
 *  @brief Ordered, de-duplicated set of trigger names.
 */

#ifndef TRIGEFF_IO_TRIGGER_SET_H
#define TRIGEFF_IO_TRIGGER_SET_H

#include <cstddef>
#include <string>
#include <vector>

namespace trigeff
{

class TriggerSet
{
  public:
    using const_iterator = std::vector<std::string>::const_iterator;

    TriggerSet() = default;

    /**
     *  Trims each name, drops blanks and keeps the first occurrence of
     *  duplicates. Throws ConfigurationError when nothing remains.
     */
    explicit TriggerSet(const std::vector<std::string> &names);

    bool empty() const noexcept { return m_names.empty(); }
    std::size_t size() const noexcept { return m_names.size(); }
    bool contains(const std::string &name) const;

    const std::vector<std::string> &names() const noexcept { return m_names; }
    const_iterator begin() const noexcept { return m_names.begin(); }
    const_iterator end() const noexcept { return m_names.end(); }

  private:
    std::vector<std::string> m_names;
};

} // namespace trigeff

#endif // TRIGEFF_IO_TRIGGER_SET_H
