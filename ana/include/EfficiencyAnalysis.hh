/* -- C++ -- */
/**
 *  @file  ana/include/EfficiencyAnalysis.hh
 *
 *  @brief Sequencing of filtering, normalisation and efficiency estimation.
 */

#ifndef TRIGEFF_ANA_EFFICIENCY_ANALYSIS_H
#define TRIGEFF_ANA_EFFICIENCY_ANALYSIS_H

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "EfficiencyService.hh"
#include "EventSource.hh"
#include "NormalisationService.hh"
#include "RunMetadata.hh"
#include "TriggerFilterService.hh"
#include "TriggerSet.hh"

namespace trigeff
{

/**
 *  \brief An efficiency, or the reason its interval could not be computed.
 *
 *  The point selected / total is kept whenever total is non-zero, even when
 *  the interval is undefined (weighted sums above sumw, negative sumw).
 */
struct EfficiencyOutcome
{
    std::optional<double> point;
    std::optional<EfficiencyResult> result;
    std::string error;

    bool ok() const noexcept { return result.has_value(); }
};

struct AnalysisResult
{
    CountAccumulator selection;
    DataQualityReport quality;
    DatasetSummary summary;
    NormalisationResult normalisation;
    EfficiencyOutcome raw_efficiency;
    EfficiencyOutcome normalised_efficiency;
};

struct AnalysisOptions
{
    std::string reference_flag = "HLT_passZZ4l";
    double confidence_level = EfficiencyService::default_confidence_level;
};

class EfficiencyAnalysis
{
  public:
    /**
     *  Runs the full chain over one stream. When \p max_entries is set only
     *  that many records are filtered and the generator sum of weights is
     *  scaled to match; the source must then report its entry count.
     *
     *  Configuration and missing-field errors propagate. A failure of one
     *  efficiency estimate is stored in its outcome.
     */
    static AnalysisResult run(EventSource &source,
                              const TriggerSet &triggers,
                              const std::vector<RunMetadata> &runs,
                              std::optional<long long> max_entries,
                              const AnalysisOptions &options);

    /// Filters each chunk concurrently, merges, then normalises and estimates once.
    static AnalysisResult run_chunks(std::vector<std::unique_ptr<EventSource>> &chunks,
                                     const TriggerSet &triggers,
                                     const std::vector<RunMetadata> &runs,
                                     const AnalysisOptions &options);

  private:
    static AnalysisResult finalise(const FilterResult &filtered,
                                   const DatasetSummary &summary,
                                   const NormalisationResult &normalisation,
                                   const AnalysisOptions &options);
    static EfficiencyOutcome try_estimate(double total, double selected, double level);
};

} // namespace trigeff

#endif // TRIGEFF_ANA_EFFICIENCY_ANALYSIS_H
