/**
 * @file histograms.cc
 * @brief 1D intensity histograms of images.
 * @version 0.1
 */
#include "micstat/histograms.hh"
#include "micstat/boilerplate.hh"
#include "micstat/general.hh"

namespace micstat {

    static void check_bins(const int64_t bins) {
        if (bins <= 0) {
            throw invalid_parameter("bins", "the bin count must be positive, got " + std::to_string(bins));
        }
    }

    template <typename T>
    std::vector<int64_t> histogram(const input_ndarray<T> &image, const int64_t bins, const bool parallel) {
        check_bins(bins);
        auto [vmin, vmax] = min_max(image, parallel);

        UNPACK_NUMPY(image);
        const T *image_data = image.data;
        double
            dmin = (double) vmin,
            bin_width = ((double) vmax - dmin) / (double) bins;

        std::vector<int64_t> result(bins, 0);
        int64_t *result_data = result.data();

        // A constant image has no width to divide by.
        if (!(bin_width > 0.0)) {
            result[0] = image_length;
            return result;
        }

        #pragma omp parallel if(parallel)
        {
            std::vector<int64_t> local(bins, 0);

            #pragma omp for nowait
            for (int64_t i = 0; i < image_length; i++) {
                double offset = ((double) image_data[i] - dmin) / bin_width;
                int64_t index = offset > 0.0 ? std::min((int64_t) offset, bins - 1) : 0;
                local[index]++;
            }

            #pragma omp critical
            {
                for (int64_t i = 0; i < bins; i++) {
                    result_data[i] += local[i];
                }
            }
        }

        return result;
    }

    template <typename T>
    T histogram_bin_midpoint(const int64_t index, const T min, const T max, const int64_t bins) {
        check_bins(bins);
        double bin_width = ((double) max - (double) min) / (double) bins;
        return (T) ((double) min + ((double) index + 0.5) * bin_width);
    }

    template <typename T>
    std::pair<T, T> histogram_bin_range(const int64_t index, const T min, const T max, const int64_t bins) {
        check_bins(bins);
        double
            bin_width = ((double) max - (double) min) / (double) bins,
            start = (double) min + (double) index * bin_width;
        return { (T) start, (T) (start + bin_width) };
    }

    #define INSTANTIATE_HISTOGRAMS(T) \
        template std::vector<int64_t> histogram<T>(const input_ndarray<T> &, const int64_t, const bool); \
        template T histogram_bin_midpoint<T>(const int64_t, const T, const T, const int64_t); \
        template std::pair<T, T> histogram_bin_range<T>(const int64_t, const T, const T, const int64_t);

    FOR_EACH_PIXEL_TYPE(INSTANTIATE_HISTOGRAMS)

} // namespace micstat
