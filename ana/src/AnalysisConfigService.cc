/* -- C++ -- */
/**
 *  @file  ana/src/AnalysisConfigService.cc
 *
 *  @brief Compiled analysis configuration service.
 */

#include "AnalysisConfigService.hh"

#include <cstdlib>

namespace trigeff
{

namespace
{

std::string env_or(const char *name, const char *fallback)
{
    const char *value = std::getenv(name);
    if (value && std::string(value).size() > 0)
    {
        return value;
    }
    return fallback;
}

}

const AnalysisConfigService &AnalysisConfigService::instance()
{
    static const AnalysisConfigService analysis{};
    return analysis;
}

AnalysisConfigService::AnalysisConfigService()
{
    m_name = "trigeff_default_v1";
    m_events_tree = env_or("TRIGEFF_EVENTS_TREE", "Events");
    m_runs_tree = env_or("TRIGEFF_RUNS_TREE", "Runs");
    m_reference_flag = env_or("TRIGEFF_REFERENCE_FLAG", "HLT_passZZ4l");
    m_weight_branch = env_or("TRIGEFF_WEIGHT_BRANCH", "overallEventWeight");
    m_gen_count_branch = env_or("TRIGEFF_GEN_COUNT_BRANCH", "genEventCount");
    m_gen_sumw_branch = env_or("TRIGEFF_GEN_SUMW_BRANCH", "genEventSumw");
    m_confidence_level = 0.683;
}

EventTreeConfig AnalysisConfigService::make_event_tree_config() const
{
    EventTreeConfig cfg;
    cfg.tree_name = m_events_tree;
    cfg.reference_flag = m_reference_flag;
    cfg.weight_branch = m_weight_branch;
    return cfg;
}

RunTreeConfig AnalysisConfigService::make_run_tree_config() const
{
    RunTreeConfig cfg;
    cfg.tree_name = m_runs_tree;
    cfg.count_branch = m_gen_count_branch;
    cfg.sumw_branch = m_gen_sumw_branch;
    return cfg;
}

} // namespace trigeff
