/* -- C++ -- */
/**
 *  @file  ana/src/TriggerFilterService.cc
 *
 *  @brief Implementation for trigger filtering and counting.
 */

#include "TriggerFilterService.hh"

#include <sstream>

#include "AnalysisErrors.hh"

namespace trigeff
{

void DataQualityReport::record_negative_weight(long long entry, double weight)
{
    ++negative_weight_events;
    negative_weight_sum += weight;
    if (samples.size() < max_samples)
    {
        std::ostringstream msg;
        msg << "negative event weight " << weight << " at entry " << entry;
        samples.push_back(DataQualityWarning{entry, weight, msg.str()});
    }
}

void DataQualityReport::merge(const DataQualityReport &other)
{
    negative_weight_events += other.negative_weight_events;
    negative_weight_sum += other.negative_weight_sum;
    for (const auto &w : other.samples)
    {
        if (samples.size() >= max_samples)
        {
            break;
        }
        samples.push_back(w);
    }
}

bool TriggerFilterService::any_fired(const EventRecord &record, const TriggerSet &triggers)
{
    for (const auto &trigger : triggers)
    {
        if (record.fired(trigger))
        {
            return true;
        }
    }
    return false;
}

FilterResult TriggerFilterService::filter(EventSource &source,
                                          const TriggerSet &triggers,
                                          const std::string &reference_flag)
{
    if (triggers.empty())
    {
        throw ConfigurationError("Trigger set is empty; refusing to scan.");
    }
    if (reference_flag.empty())
    {
        throw ConfigurationError("Reference selection flag name is empty.");
    }

    FilterResult out;
    EventRecord record;
    while (source.next(record))
    {
        const long long entry = out.counts.total_seen;
        ++out.counts.total_seen;

        const double weight = record.weight();
        if (weight < 0.0)
        {
            out.quality.record_negative_weight(entry, weight);
        }

        const bool fired = any_fired(record, triggers);
        const bool reference = record.passes_reference(reference_flag);
        if (fired && reference)
        {
            ++out.counts.total_passed;
            out.counts.weighted_passed += weight;
        }
    }
    return out;
}

FilterResult TriggerFilterService::merge(const std::vector<FilterResult> &parts)
{
    FilterResult out;
    for (const auto &part : parts)
    {
        out.counts += part.counts;
        out.quality.merge(part.quality);
    }
    return out;
}

} // namespace trigeff
