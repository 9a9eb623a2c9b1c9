/* -- C++ -- */
/**
 *  @file  io/include/RunSummaryIO.hh
 *
 *  @brief Reader for per-run generator counters stored in the runs tree.
 */

#ifndef TRIGEFF_IO_RUN_SUMMARY_IO_H
#define TRIGEFF_IO_RUN_SUMMARY_IO_H

#include <string>
#include <vector>

#include "RunMetadata.hh"

namespace trigeff
{

struct RunTreeConfig
{
    std::string tree_name = "Runs";
    std::string count_branch = "genEventCount";
    std::string sumw_branch = "genEventSumw";
};

class RunSummaryIO
{
  public:
    static std::vector<RunMetadata> read(const std::vector<std::string> &files,
                                         const RunTreeConfig &config);
};

} // namespace trigeff

#endif // TRIGEFF_IO_RUN_SUMMARY_IO_H
