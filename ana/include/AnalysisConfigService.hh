/* -- C++ -- */
/**
 *  @file  ana/include/AnalysisConfigService.hh
 *
 *  @brief Compiled analysis configuration service.
 */

#ifndef TRIGEFF_ANA_ANALYSIS_CONFIG_SERVICE_H
#define TRIGEFF_ANA_ANALYSIS_CONFIG_SERVICE_H

#include <string>

#include "EventTreeSource.hh"
#include "RunSummaryIO.hh"

namespace trigeff
{

/** \brief Compiled analysis configuration. */
class AnalysisConfigService final
{
  public:
    static const AnalysisConfigService &instance();

    const std::string &name() const noexcept { return m_name; }
    const std::string &events_tree() const noexcept { return m_events_tree; }
    const std::string &runs_tree() const noexcept { return m_runs_tree; }
    const std::string &reference_flag() const noexcept { return m_reference_flag; }
    const std::string &weight_branch() const noexcept { return m_weight_branch; }
    const std::string &gen_count_branch() const noexcept { return m_gen_count_branch; }
    const std::string &gen_sumw_branch() const noexcept { return m_gen_sumw_branch; }
    double confidence_level() const noexcept { return m_confidence_level; }

    EventTreeConfig make_event_tree_config() const;
    RunTreeConfig make_run_tree_config() const;

  private:
    AnalysisConfigService();

    std::string m_name;
    std::string m_events_tree;
    std::string m_runs_tree;
    std::string m_reference_flag;
    std::string m_weight_branch;
    std::string m_gen_count_branch;
    std::string m_gen_sumw_branch;
    double m_confidence_level = 0.683;
};

} // namespace trigeff

#endif // TRIGEFF_ANA_ANALYSIS_CONFIG_SERVICE_H
