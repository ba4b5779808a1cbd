/**
 * @file threshold.cc
 * @brief Global threshold selection.
 * @version 0.1
 */
#include "micstat/threshold.hh"
#include "micstat/general.hh"
#include "micstat/histograms.hh"

namespace micstat {

    template <typename T>
    T otsu_value(const input_ndarray<T> &image, const int64_t bins) {
        std::vector<int64_t> hist = histogram(image, bins, false);
        auto [vmin, vmax] = min_max(image, false);

        double total = 0.0, total_intensity = 0.0;
        for (int64_t i = 0; i < bins; i++) {
            total += (double) hist[i];
            total_intensity += (double) i * (double) hist[i];
        }

        double
            best = 0.0,
            count_k = 0.0,
            intensity_k = 0.0;
        int64_t k_star = 0;
        for (int64_t i = 0; i < bins - 1; i++) {
            count_k += (double) hist[i];
            intensity_k += (double) i * (double) hist[i];

            double
                denominator = count_k * (total - count_k),
                between = 0.0;
            if (denominator != 0.0) {
                double numerator = (count_k / total) * total_intensity - intensity_k;
                between = (numerator * numerator) / denominator;
            }
            if (between >= best) {
                best = between;
                k_star = i;
            }
        }

        return histogram_bin_midpoint(k_star, vmin, vmax, bins);
    }

    template <typename T>
    ndarray<bool> otsu_mask(const input_ndarray<T> &image, const int64_t bins, const bool parallel) {
        T threshold = otsu_value(image, bins);
        return manual_mask(image, threshold, parallel);
    }

    #define INSTANTIATE_THRESHOLD(T) \
        template T otsu_value<T>(const input_ndarray<T> &, const int64_t); \
        template ndarray<bool> otsu_mask<T>(const input_ndarray<T> &, const int64_t, const bool);

    FOR_EACH_PIXEL_TYPE(INSTANTIATE_THRESHOLD)

} // namespace micstat
