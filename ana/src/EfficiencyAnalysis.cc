/* -- C++ -- */
/**
 *  @file  ana/src/EfficiencyAnalysis.cc
 *
 *  @brief Implementation for the efficiency analysis chain.
 */

#include "EfficiencyAnalysis.hh"

#include <exception>
#include <future>
#include <stdexcept>
#include <string>
#include <utility>

#include "AnalysisErrors.hh"

namespace trigeff
{

AnalysisResult EfficiencyAnalysis::run(EventSource &source,
                                       const TriggerSet &triggers,
                                       const std::vector<RunMetadata> &runs,
                                       std::optional<long long> max_entries,
                                       const AnalysisOptions &options)
{
    const DatasetSummary summary = NormalisationService::summarise(runs);

    // Scaling needs the full dataset size; a capped scan cannot recover it.
    if (max_entries && source.entries() < 0)
    {
        throw ConfigurationError("Entry cap of " + std::to_string(*max_entries) +
                                 " requested for a source with unknown entry count.");
    }

    FilterResult filtered;
    if (max_entries)
    {
        LimitedEventSource limited(source, *max_entries);
        filtered = TriggerFilterService::filter(limited, triggers, options.reference_flag);
    }
    else
    {
        filtered = TriggerFilterService::filter(source, triggers, options.reference_flag);
    }

    const long long dataset_entries = source.entries();
    const long long processed = (dataset_entries >= 0) ? dataset_entries : filtered.counts.total_seen;
    const NormalisationResult normalisation =
        NormalisationService::normalise(summary, processed, max_entries);

    return finalise(filtered, summary, normalisation, options);
}

AnalysisResult EfficiencyAnalysis::run_chunks(std::vector<std::unique_ptr<EventSource>> &chunks,
                                              const TriggerSet &triggers,
                                              const std::vector<RunMetadata> &runs,
                                              const AnalysisOptions &options)
{
    if (chunks.empty())
    {
        throw ConfigurationError("Chunked analysis requires at least one event source.");
    }
    if (triggers.empty())
    {
        throw ConfigurationError("Trigger set is empty; refusing to scan.");
    }

    const DatasetSummary summary = NormalisationService::summarise(runs);

    std::vector<std::future<FilterResult>> pending;
    pending.reserve(chunks.size());
    for (auto &chunk : chunks)
    {
        if (!chunk)
        {
            throw ConfigurationError("Chunked analysis received a null event source.");
        }
        EventSource *source = chunk.get();
        pending.push_back(std::async(std::launch::async,
                                     [source, &triggers, &options]()
                                     {
                                         return TriggerFilterService::filter(*source, triggers,
                                                                             options.reference_flag);
                                     }));
    }

    // Every future is waited on before the first error is rethrown.
    std::vector<FilterResult> parts;
    parts.reserve(pending.size());
    std::exception_ptr first_error;
    for (auto &f : pending)
    {
        try
        {
            parts.push_back(f.get());
        }
        catch (...)
        {
            if (!first_error)
            {
                first_error = std::current_exception();
            }
        }
    }
    if (first_error)
    {
        std::rethrow_exception(first_error);
    }

    const FilterResult merged = TriggerFilterService::merge(parts);
    const NormalisationResult normalisation =
        NormalisationService::normalise(summary, merged.counts.total_seen, std::nullopt);

    return finalise(merged, summary, normalisation, options);
}

AnalysisResult EfficiencyAnalysis::finalise(const FilterResult &filtered,
                                            const DatasetSummary &summary,
                                            const NormalisationResult &normalisation,
                                            const AnalysisOptions &options)
{
    AnalysisResult out;
    out.selection = filtered.counts;
    out.quality = filtered.quality;
    out.summary = summary;
    out.normalisation = normalisation;

    out.raw_efficiency = try_estimate(static_cast<double>(filtered.counts.total_seen),
                                      static_cast<double>(filtered.counts.total_passed),
                                      options.confidence_level);
    out.normalised_efficiency = try_estimate(normalisation.sumw,
                                             filtered.counts.weighted_passed,
                                             options.confidence_level);
    return out;
}

EfficiencyOutcome EfficiencyAnalysis::try_estimate(double total, double selected, double level)
{
    EfficiencyOutcome out;
    if (total != 0.0)
    {
        out.point = selected / total;
    }
    try
    {
        out.result = EfficiencyService::estimate(total, selected, level);
    }
    catch (const std::logic_error &e)
    {
        // DivisionByZeroError, std::domain_error and std::invalid_argument.
        out.error = e.what();
    }
    return out;
}

} // namespace trigeff
