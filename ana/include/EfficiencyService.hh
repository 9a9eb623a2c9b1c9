/* -- C++ -- */
/**
 *  @file  ana/include/EfficiencyService.hh
 *
 *  @brief Binomial efficiency with Clopper-Pearson uncertainties.
 */

#ifndef TRIGEFF_ANA_EFFICIENCY_SERVICE_H
#define TRIGEFF_ANA_EFFICIENCY_SERVICE_H

namespace trigeff
{

/**
 *  \brief Efficiency with asymmetric errors.
 *
 *  The errors are distances from the point estimate, err_up = upper - point
 *  and err_low = point - lower, as they are reported on error bars.
 */
struct EfficiencyResult
{
    double point = 0.0;
    double err_up = 0.0;
    double err_low = 0.0;

    double upper() const noexcept { return point + err_up; }
    double lower() const noexcept { return point - err_low; }
};

class EfficiencyService
{
  public:
    static constexpr double default_confidence_level = 0.683;

    /**
     *  Point estimate selected / total with the exact Clopper-Pearson
     *  interval at \p level.
     *
     *  Weighted sums are accepted and passed through the same binomial
     *  formula, which is only an approximation for non-unit weights. The
     *  point is never clamped to [0, 1].
     *
     *  Throws DivisionByZeroError when total is zero, std::invalid_argument
     *  for negative inputs or a level outside (0, 1), and std::domain_error
     *  when selected exceeds total or the interval is not finite.
     */
    static EfficiencyResult estimate(double total,
                                     double selected,
                                     double level = default_confidence_level);

    static double upper_bound(double total, double selected, double level);
    static double lower_bound(double total, double selected, double level);
};

} // namespace trigeff

#endif // TRIGEFF_ANA_EFFICIENCY_SERVICE_H
