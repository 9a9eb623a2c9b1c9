/* -- C++ -- */
/**
 *  @file  ana/src/EfficiencyService.cc
 *
 *  @brief Implementation for efficiency estimation.
 */

#include "EfficiencyService.hh"

#include <TEfficiency.h>

#include <cmath>
#include <sstream>
#include <stdexcept>

#include "AnalysisErrors.hh"

namespace trigeff
{

namespace
{

void check_inputs(double total, double selected, double level)
{
    if (total == 0.0)
    {
        throw DivisionByZeroError("Efficiency requested with zero total.");
    }
    if (total < 0.0 || selected < 0.0)
    {
        std::ostringstream msg;
        msg << "Efficiency inputs must be non-negative (total=" << total
            << " selected=" << selected << ")";
        throw std::invalid_argument(msg.str());
    }
    if (!(level > 0.0 && level < 1.0))
    {
        std::ostringstream msg;
        msg << "Confidence level must lie in (0, 1), got " << level;
        throw std::invalid_argument(msg.str());
    }
}

}

double EfficiencyService::upper_bound(double total, double selected, double level)
{
    check_inputs(total, selected, level);
    if (selected == total)
    {
        return 1.0;
    }
    return TEfficiency::ClopperPearson(total, selected, level, true);
}

double EfficiencyService::lower_bound(double total, double selected, double level)
{
    check_inputs(total, selected, level);
    if (selected == 0.0)
    {
        return 0.0;
    }
    return TEfficiency::ClopperPearson(total, selected, level, false);
}

EfficiencyResult EfficiencyService::estimate(double total, double selected, double level)
{
    check_inputs(total, selected, level);
    if (selected > total)
    {
        // Only reachable with weighted sums; the Beta quantile has no support here.
        std::ostringstream msg;
        msg << "Clopper-Pearson interval undefined for selected > total (total=" << total
            << " selected=" << selected << " point=" << selected / total << ")";
        throw std::domain_error(msg.str());
    }

    const double up = upper_bound(total, selected, level);
    const double dn = lower_bound(total, selected, level);
    if (!std::isfinite(up) || !std::isfinite(dn))
    {
        std::ostringstream msg;
        msg << "Clopper-Pearson interval is not finite (total=" << total
            << " selected=" << selected << ")";
        throw std::domain_error(msg.str());
    }

    EfficiencyResult out;
    out.point = selected / total;
    out.err_up = up - out.point;
    out.err_low = out.point - dn;
    return out;
}

} // namespace trigeff
