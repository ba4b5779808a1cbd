/**
 * @file histograms.hh
 * @brief 1D intensity histograms of images.
 * @version 0.1
 */
#ifndef histograms_h
#define histograms_h

#include "datatypes.hh"
#include "error.hh"

#include <utility>

namespace micstat {

    /**
     * Computes the intensity histogram of an image.
     * The `bins` equal-width bins span `[min, max]` of the image, where the maximum is counted in the last bin.
     * When the image is constant every element lands in the first bin.
     *
     * In parallel mode every thread fills a local histogram, which are summed after the loop.
     *
     * @param image The input image of any dimensionality.
     * @param bins The number of bins.
     * @param parallel Whether to use multiple threads.
     * @tparam T The internal datatype of the image.
     * @return The count of every bin.
     * @throws invalid_parameter if the image is empty or `bins == 0`.
     */
    template <typename T>
    std::vector<int64_t> histogram(const input_ndarray<T> &image, const int64_t bins, const bool parallel);

    /**
     * Computes the value at the center of a histogram bin.
     *
     * @param index The bin index.
     * @param min The minimum of the histogram range.
     * @param max The maximum of the histogram range.
     * @param bins The number of bins.
     * @tparam T The datatype of the histogram range, which is also the returned datatype.
     * @throws invalid_parameter if `bins == 0`.
     */
    template <typename T>
    T histogram_bin_midpoint(const int64_t index, const T min, const T max, const int64_t bins);

    /**
     * Computes the start and end value of a histogram bin.
     *
     * @param index The bin index.
     * @param min The minimum of the histogram range.
     * @param max The maximum of the histogram range.
     * @param bins The number of bins.
     * @tparam T The datatype of the histogram range, which is also the returned datatype.
     * @return The pair `(start, end)`.
     * @throws invalid_parameter if `bins == 0`.
     */
    template <typename T>
    std::pair<T, T> histogram_bin_range(const int64_t index, const T min, const T max, const int64_t bins);

} // namespace micstat

#endif // histograms_h
