/* -- C++ -- */
/**
 *  @file  ana/include/TriggerFilterService.hh
 *
 *  @brief Trigger-OR and reference selection with weighted counting.
 */

#ifndef TRIGEFF_ANA_TRIGGER_FILTER_SERVICE_H
#define TRIGEFF_ANA_TRIGGER_FILTER_SERVICE_H

#include <cstddef>
#include <string>
#include <vector>

#include "EventSource.hh"
#include "TriggerSet.hh"

namespace trigeff
{

struct CountAccumulator
{
    long long total_seen = 0;
    long long total_passed = 0;
    double weighted_passed = 0.0;

    CountAccumulator &operator+=(const CountAccumulator &other) noexcept
    {
        total_seen += other.total_seen;
        total_passed += other.total_passed;
        weighted_passed += other.weighted_passed;
        return *this;
    }
};

struct DataQualityWarning
{
    // Position within the scanned stream, not the global tree entry.
    long long entry = -1;
    double value = 0.0;
    std::string message;
};

/**
 *  \brief Non-fatal conditions observed during a scan.
 *
 *  Only the first max_samples warnings are kept; the counters cover all.
 */
struct DataQualityReport
{
    static constexpr std::size_t max_samples = 10;

    long long negative_weight_events = 0;
    double negative_weight_sum = 0.0;
    std::vector<DataQualityWarning> samples;

    bool empty() const noexcept { return negative_weight_events == 0; }
    void record_negative_weight(long long entry, double weight);
    void merge(const DataQualityReport &other);
};

struct FilterResult
{
    CountAccumulator counts;
    DataQualityReport quality;
};

class TriggerFilterService
{
  public:
    /**
     *  Single pass over \p source. An event is selected when any trigger in
     *  \p triggers fired and the \p reference_flag equals 1; selected events
     *  add their weight to weighted_passed.
     *
     *  Throws ConfigurationError for an empty trigger set before reading,
     *  MissingFieldError when a record lacks a looked-up flag.
     */
    static FilterResult filter(EventSource &source,
                               const TriggerSet &triggers,
                               const std::string &reference_flag);

    static bool any_fired(const EventRecord &record, const TriggerSet &triggers);

    /// Field-wise sum of partial results from independent chunks.
    static FilterResult merge(const std::vector<FilterResult> &parts);
};

} // namespace trigeff

#endif // TRIGEFF_ANA_TRIGGER_FILTER_SERVICE_H
