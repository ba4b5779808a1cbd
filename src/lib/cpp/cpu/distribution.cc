/**
 * @file distribution.cc
 * @brief Probability distribution functions.
 * @version 0.1
 */
#include "micstat/distribution.hh"
#include "micstat/boilerplate.hh"
#include "micstat/general.hh"

#include <cmath>
#include <limits>

namespace micstat {

    // Coefficients of Acklam's rational approximation.
    constexpr double
        acklam_a[6] = { -3.969683028665376e+01,  2.209460984245205e+02, -2.759285104469687e+02,
                         1.383577518672690e+02, -3.066479806614716e+01,  2.506628277459239e+00 },
        acklam_b[5] = { -5.447609879822406e+01,  1.615858368580409e+02, -1.556989798598866e+02,
                         6.680131188771972e+01, -1.328068155288572e+01 },
        acklam_c[6] = { -7.784894002430293e-03, -3.223964580411365e-01, -2.400758277161838e+00,
                        -2.549732539343734e+00,  4.374664141464968e+00,  2.938163982698783e+00 },
        acklam_d[4] = {  7.784695709041462e-03,  3.224671290700398e-01,  2.445134137142996e+00,
                         3.754408661907416e+00 };

    constexpr double
        p_low = 0.02425,
        p_high = 1.0 - p_low;

    // Rational function used in both tails, for q = √(-2 ln p).
    static double acklam_tail(const double q) {
        auto &c = acklam_c;
        auto &d = acklam_d;
        return (((((c[0]*q + c[1])*q + c[2])*q + c[3])*q + c[4])*q + c[5]) /
                ((((d[0]*q + d[1])*q + d[2])*q + d[3])*q + 1.0);
    }

    double inverse_normal_cdf(const double p) {
        if (std::isnan(p) || p < 0.0 || p > 1.0) {
            throw invalid_parameter("p", "the probability must lie in [0, 1]");
        }
        if (p == 0.0) return -std::numeric_limits<double>::infinity();
        if (p == 1.0) return  std::numeric_limits<double>::infinity();

        if (p < p_low) {
            return acklam_tail(std::sqrt(-2.0 * std::log(p)));
        }
        if (p > p_high) {
            return -acklam_tail(std::sqrt(-2.0 * std::log(1.0 - p)));
        }

        auto &a = acklam_a;
        auto &b = acklam_b;
        double
            q = p - 0.5,
            r = q*q;
        return (((((a[0]*r + a[1])*r + a[2])*r + a[3])*r + a[4])*r + a[5])*q /
               (((((b[0]*r + b[1])*r + b[2])*r + b[3])*r + b[4])*r + 1.0);
    }

    std::vector<double> normalized_gaussian(const double sigma, const int64_t bins, const double range, const double center, const bool parallel) {
        if (bins < 2) {
            throw invalid_parameter("bins", "at least two samples are needed, got " + std::to_string(bins));
        }
        if (!(sigma > 0.0)) {
            throw invalid_parameter("sigma", "the standard deviation must be positive");
        }

        std::vector<double> samples(bins);
        double
            *samples_data = samples.data(),
            width = range / (double) (bins - 1),
            two_sigma_sq = 2.0 * sigma * sigma;

        FOR_FLAT_BEGIN(bins, parallel,) {
            double d = (double) flat_index * width - center;
            samples_data[flat_index] = std::exp(-(d*d) / two_sigma_sq);
        } FOR_FLAT_END();

        double total = kahan_sum(samples);
        for (double &v : samples) {
            v /= total;
        }

        return samples;
    }

} // namespace micstat
