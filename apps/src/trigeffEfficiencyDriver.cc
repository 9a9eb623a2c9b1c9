/* -- C++ -- */
/**
 *  @file  apps/src/trigeffEfficiencyDriver.cc
 *
 *  @brief Main entrypoint for trigger efficiency measurement.
 */

#include <TROOT.h>

#include <algorithm>
#include <chrono>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "AnalysisConfigService.hh"
#include "EfficiencyCLI.hh"
#include "EventTreeSource.hh"
#include "RunSummaryIO.hh"
#include "TriggerListIO.hh"

namespace trigeff
{

namespace app
{

namespace efficiency
{

namespace
{

std::vector<std::unique_ptr<EventSource>> make_chunks(const std::vector<std::string> &files,
                                                      const TriggerSet &triggers,
                                                      const EventTreeConfig &cfg,
                                                      const int nchunks)
{
    const long long n_entries = EventTreeSource(files, triggers, cfg).entries();
    const long long n = std::max(1LL, std::min<long long>(nchunks, n_entries));
    const long long step = (n_entries + n - 1) / n;

    std::vector<std::unique_ptr<EventSource>> chunks;
    for (long long first = 0; first < n_entries; first += step)
    {
        chunks.push_back(std::make_unique<EventTreeSource>(files, triggers, cfg, first,
                                                           std::min(first + step, n_entries)));
    }
    if (chunks.empty())
    {
        chunks.push_back(std::make_unique<EventTreeSource>(files, triggers, cfg));
    }
    return chunks;
}

}

int run(const Args &efficiency_args, const std::string &log_prefix)
{
    const auto &analysis = trigeff::AnalysisConfigService::instance();

    const TriggerSet triggers = TriggerListIO::read(efficiency_args.trigger_list);
    const std::vector<std::string> files = trigeff::app::resolve_inputs(efficiency_args.input);

    std::ostringstream start;
    start << "action=efficiency status=start analysis=" << analysis.name()
          << " triggers=" << triggers.size()
          << " files=" << files.size()
          << " reference=" << analysis.reference_flag();
    if (efficiency_args.max_entries)
    {
        start << " max_entries=" << *efficiency_args.max_entries;
    }
    trigeff::app::log::log_info(log_prefix, start.str());

    const auto start_time = std::chrono::steady_clock::now();
    const std::vector<RunMetadata> runs = RunSummaryIO::read(files, analysis.make_run_tree_config());

    AnalysisOptions options;
    options.reference_flag = analysis.reference_flag();
    options.confidence_level = analysis.confidence_level();

    const EventTreeConfig tree_cfg = analysis.make_event_tree_config();

    trigeff::app::StatusMonitor status_monitor(
        log_prefix,
        "action=efficiency status=running message=scanning");

    AnalysisResult result;
    if (efficiency_args.nthreads > 1 && !efficiency_args.max_entries)
    {
        ROOT::EnableThreadSafety();
        auto chunks = make_chunks(files, triggers, tree_cfg, efficiency_args.nthreads);
        trigeff::app::log::log_info(log_prefix,
                                    "action=efficiency status=chunked chunks=" + std::to_string(chunks.size()));
        result = EfficiencyAnalysis::run_chunks(chunks, triggers, runs, options);
    }
    else
    {
        if (efficiency_args.nthreads > 1)
        {
            trigeff::app::log::log_warning(log_prefix,
                                           "action=efficiency message=\"entry cap set, scanning on one thread\"");
        }
        EventTreeSource source(files, triggers, tree_cfg);
        result = EfficiencyAnalysis::run(source, triggers, runs, efficiency_args.max_entries, options);
    }
    status_monitor.stop();

    log_result(log_prefix, result);

    const auto end_time = std::chrono::steady_clock::now();
    const double elapsed_seconds =
        std::chrono::duration_cast<std::chrono::duration<double>>(end_time - start_time).count();
    std::ostringstream done;
    done << "action=efficiency status=complete events="
         << trigeff::app::log::format_count(result.selection.total_seen)
         << " elapsed_s=" << trigeff::app::log::format_fixed(elapsed_seconds, 1);
    trigeff::app::log::log_success(log_prefix, done.str());

    return (result.raw_efficiency.ok() || result.normalised_efficiency.ok()) ? 0 : 2;
}

} // namespace efficiency

} // namespace app

} // namespace trigeff

int main(int argc, char **argv)
{
    return trigeff::app::run_guarded(
        "trigeffEfficiencyDriver",
        [argc, argv]()
        {
            const std::vector<std::string> args = trigeff::app::collect_args(argc, argv);
            const trigeff::app::efficiency::Args efficiency_args =
                trigeff::app::efficiency::parse_args(
                    args, "Usage: trigeffEfficiencyDriver TRIGGER_LIST INPUT.root|FILELIST [MAX_ENTRIES] [NTHREADS]");
            return trigeff::app::efficiency::run(efficiency_args, "trigeffEfficiencyDriver");
        });
}
