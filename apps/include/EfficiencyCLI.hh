/* -- C++ -- */
/**
 *  @file  apps/include/EfficiencyCLI.hh
 *
 *  @brief Argument parsing and reporting for the trigger efficiency driver.
 */

#ifndef TRIGEFF_APPS_EFFICIENCY_CLI_H
#define TRIGEFF_APPS_EFFICIENCY_CLI_H

#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "AppLog.hh"
#include "AppUtils.hh"
#include "EfficiencyAnalysis.hh"

namespace trigeff
{

namespace app
{

namespace efficiency
{

struct Args
{
    std::string trigger_list;
    std::string input;
    std::optional<long long> max_entries;
    int nthreads = 1;
};

inline Args parse_args(const std::vector<std::string> &args, const std::string &usage)
{
    if (args.size() < 2 || args.size() > 4)
    {
        throw std::runtime_error(usage);
    }

    Args out;
    out.trigger_list = trigeff::app::trim(args.at(0));
    out.input = trigeff::app::trim(args.at(1));
    if (out.trigger_list.empty() || out.input.empty())
    {
        throw std::runtime_error("Invalid arguments (empty path)");
    }

    // "-" or "0" leaves the entry cap unset.
    if (args.size() > 2)
    {
        const std::string cap = trigeff::app::trim(args.at(2));
        if (cap != "-" && cap != "0")
        {
            const long long value = trigeff::app::parse_count(cap, "MAX_ENTRIES");
            if (value < 0)
            {
                throw std::runtime_error("MAX_ENTRIES must be positive: " + cap);
            }
            out.max_entries = value;
        }
    }
    if (args.size() > 3)
    {
        const long long value = trigeff::app::parse_count(args.at(3), "NTHREADS");
        if (value < 1 || value > 256)
        {
            throw std::runtime_error("NTHREADS must lie in [1, 256]: " + args.at(3));
        }
        out.nthreads = static_cast<int>(value);
    }

    return out;
}

inline std::string format_outcome(const std::string &label, const EfficiencyOutcome &outcome)
{
    std::ostringstream out;
    if (outcome.ok())
    {
        const EfficiencyResult &r = *outcome.result;
        out << label << "=" << trigeff::app::log::format_fixed(r.point)
            << " " << label << "_err_up=" << trigeff::app::log::format_fixed(r.err_up)
            << " " << label << "_err_low=" << trigeff::app::log::format_fixed(r.err_low);
    }
    else if (outcome.point)
    {
        out << label << "=" << trigeff::app::log::format_fixed(*outcome.point)
            << " " << label << "_interval=unavailable reason=\"" << outcome.error << "\"";
    }
    else
    {
        out << label << "=unavailable reason=\"" << outcome.error << "\"";
    }
    return out.str();
}

inline void log_result(const std::string &log_prefix, const AnalysisResult &result)
{
    namespace lg = trigeff::app::log;

    std::ostringstream runs;
    runs << "action=run_summary runs=" << result.summary.n_runs
         << " gen_event_count=" << result.summary.total_gen_event_count
         << " gen_event_sumw=" << result.summary.total_gen_sumw;
    lg::log_info(log_prefix, runs.str());

    if (result.normalisation.scaled)
    {
        std::ostringstream scaled;
        scaled << "action=normalise status=scaled entries=" << result.normalisation.effective_entries
               << " sumw=" << result.normalisation.sumw;
        lg::log_info(log_prefix, scaled.str());
    }

    std::ostringstream counts;
    counts << "action=filter total=" << result.selection.total_seen
           << " passed=" << result.selection.total_passed
           << " weighted_passed=" << lg::format_fixed(result.selection.weighted_passed, 2);
    if (result.selection.total_seen > 0)
    {
        counts << " percentage="
               << lg::format_fixed(100.0 * static_cast<double>(result.selection.total_passed) /
                                       static_cast<double>(result.selection.total_seen),
                                   2);
    }
    lg::log_info(log_prefix, counts.str());

    if (!result.quality.empty())
    {
        std::ostringstream dq;
        dq << "action=data_quality negative_weight_events=" << result.quality.negative_weight_events
           << " negative_weight_sum=" << result.quality.negative_weight_sum;
        lg::log_warning(log_prefix, dq.str());
        for (const auto &w : result.quality.samples)
        {
            lg::log_warning(log_prefix, "action=data_quality message=\"" + w.message + "\"");
        }
    }

    const auto raw = format_outcome("eff", result.raw_efficiency);
    const auto norm = format_outcome("eff_weighted", result.normalised_efficiency);
    if (result.raw_efficiency.ok())
    {
        lg::log_success(log_prefix, "action=efficiency " + raw);
    }
    else
    {
        lg::log_warning(log_prefix, "action=efficiency " + raw);
    }
    if (result.normalised_efficiency.ok())
    {
        lg::log_success(log_prefix, "action=efficiency " + norm);
    }
    else
    {
        lg::log_warning(log_prefix, "action=efficiency " + norm);
    }
}

int run(const Args &efficiency_args, const std::string &log_prefix);

} // namespace efficiency

} // namespace app

} // namespace trigeff

#endif // TRIGEFF_APPS_EFFICIENCY_CLI_H
