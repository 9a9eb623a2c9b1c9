/* -- C++ -- */
/**
 *  @file  io/src/NormalisationService.cc
 *
 *  @brief Implementation for generator-level normalisation.
 */

#include "NormalisationService.hh"

#include <string>

#include "AnalysisErrors.hh"

namespace trigeff
{

DatasetSummary NormalisationService::summarise(const std::vector<RunMetadata> &runs)
{
    DatasetSummary out;
    for (const auto &run : runs)
    {
        out.total_gen_event_count += run.gen_event_count;
        out.total_gen_sumw += run.gen_event_sumw;
        ++out.n_runs;
    }
    return out;
}

NormalisationResult NormalisationService::normalise(const DatasetSummary &summary,
                                                    long long processed_entries,
                                                    std::optional<long long> max_entries)
{
    NormalisationResult out;
    out.sumw = summary.total_gen_sumw;
    out.effective_entries = processed_entries;

    if (!max_entries)
    {
        return out;
    }
    if (*max_entries <= 0)
    {
        throw ConfigurationError("Entry cap must be positive, got " + std::to_string(*max_entries));
    }
    if (processed_entries <= 0)
    {
        throw ConfigurationError("Cannot scale normalisation to " + std::to_string(*max_entries) +
                                 " entries with processed entry count " +
                                 std::to_string(processed_entries));
    }
    if (processed_entries <= *max_entries)
    {
        return out;
    }

    out.sumw = scale_sumw(summary.total_gen_sumw, processed_entries, *max_entries);
    out.effective_entries = *max_entries;
    out.scaled = true;
    return out;
}

double NormalisationService::scale_sumw(double sumw, long long processed_entries, long long max_entries)
{
    return sumw * static_cast<double>(max_entries) / static_cast<double>(processed_entries);
}

} // namespace trigeff
