/* -- C++ -- */
/**
 *  @file  io/include/NormalisationService.hh
 *
 *  @brief Generator-level sum-of-weights normalisation.
 */

#ifndef TRIGEFF_IO_NORMALISATION_SERVICE_H
#define TRIGEFF_IO_NORMALISATION_SERVICE_H

#include <optional>
#include <vector>

#include "RunMetadata.hh"

namespace trigeff
{

struct NormalisationResult
{
    double sumw = 0.0;
    long long effective_entries = 0;
    bool scaled = false;
};

class NormalisationService
{
  public:
    static DatasetSummary summarise(const std::vector<RunMetadata> &runs);

    /**
     *  Scales the generator sum of weights down to the processed entry budget.
     *
     *  With no cap, or a cap at least as large as \p processed_entries, the
     *  sum is returned unchanged. Otherwise it is multiplied by
     *  max_entries / processed_entries and the effective entry count becomes
     *  the cap. Throws ConfigurationError when a cap is requested with a
     *  non-positive cap or entry count.
     */
    static NormalisationResult normalise(const DatasetSummary &summary,
                                         long long processed_entries,
                                         std::optional<long long> max_entries);

  private:
    static double scale_sumw(double sumw, long long processed_entries, long long max_entries);
};

} // namespace trigeff

#endif // TRIGEFF_IO_NORMALISATION_SERVICE_H
