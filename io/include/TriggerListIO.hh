/* -- C++ -- */
/**
 *  @file  io/include/TriggerListIO.hh
 *
 *  @brief Reader for newline-delimited trigger lists.
 */

#ifndef TRIGEFF_IO_TRIGGER_LIST_IO_H
#define TRIGEFF_IO_TRIGGER_LIST_IO_H

#include <istream>
#include <string>

#include "TriggerSet.hh"

namespace trigeff
{

class TriggerListIO
{
  public:
    /// One trigger per line; blank lines and '#' comments are skipped.
    static TriggerSet read(const std::string &path);
    static TriggerSet read(std::istream &in, const std::string &source_name);
};

} // namespace trigeff

#endif // TRIGEFF_IO_TRIGGER_LIST_IO_H
