/**
 * @file distribution.hh
 * @brief Probability distribution functions.
 * @version 0.1
 */
#ifndef distribution_h
#define distribution_h

#include "datatypes.hh"
#include "error.hh"

namespace micstat {

    /**
     * Computes the quantile `Φ⁻¹(p)` of the standard normal distribution with Acklam's rational approximation.
     * The lower and upper tails (`p < 0.02425` and `p > 0.97575`) use a rational function in `√(-2 ln q)`, the central region one in `(p - 0.5)²`.
     * The relative error of the approximation is at most `1.15e-9`.
     *
     * @param p The probability.
     * @return The quantile. `-inf` for `p == 0` and `+inf` for `p == 1`.
     * @throws invalid_parameter if `p` is outside `[0, 1]` or `NaN`.
     */
    double inverse_normal_cdf(const double p);

    /**
     * Samples the Gaussian `exp(-(x - center)² / (2σ²))` at `bins` evenly spaced positions `x` spanning `[0, range]` and normalizes the samples to sum to 1.
     *
     * @param sigma The standard deviation.
     * @param bins The number of samples.
     * @param range The extent of the sampled interval.
     * @param center The position of the peak.
     * @param parallel Whether to use multiple threads.
     * @return The normalized samples.
     * @throws invalid_parameter if `bins < 2` or `sigma <= 0`.
     */
    std::vector<double> normalized_gaussian(const double sigma, const int64_t bins, const double range, const double center, const bool parallel);

} // namespace micstat

#endif // distribution_h
