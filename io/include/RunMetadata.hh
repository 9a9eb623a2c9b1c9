/* -- C++ -- */
/**
 *  @file  io/include/RunMetadata.hh
 *
 *  @brief Generator-level run counters and their dataset sums.
 */

#ifndef TRIGEFF_IO_RUN_METADATA_H
#define TRIGEFF_IO_RUN_METADATA_H

namespace trigeff
{

struct RunMetadata
{
    long long gen_event_count = 0;
    // Signed: generators with negative weights can give a negative sum.
    double gen_event_sumw = 0.0;
};

struct DatasetSummary
{
    long long total_gen_event_count = 0;
    double total_gen_sumw = 0.0;
    long long n_runs = 0;
};

} // namespace trigeff

#endif // TRIGEFF_IO_RUN_METADATA_H
