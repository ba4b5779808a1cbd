/**
 * @file threshold.hh
 * @brief Global threshold selection.
 * @version 0.1
 */
#ifndef threshold_h
#define threshold_h

#include "datatypes.hh"
#include "error.hh"

namespace micstat {

    /**
     * Computes Otsu's threshold of an image, i.e. the midpoint of the histogram bin that maximizes the between-class variance.
     * Ties between bins are resolved towards the higher bin. The last bin is never a candidate.
     *
     * @param image The input image.
     * @param bins The number of histogram bins.
     * @tparam T The internal datatype of the image.
     * @return The threshold, in the datatype of the image.
     * @throws invalid_parameter if the image is empty or `bins == 0`.
     */
    template <typename T>
    T otsu_value(const input_ndarray<T> &image, const int64_t bins = DEFAULT_BINS);

    /**
     * Creates a boolean mask that is `true` where the image is at or above Otsu's threshold.
     *
     * @param image The input image.
     * @param bins The number of histogram bins.
     * @param parallel Whether to use multiple threads.
     * @tparam T The internal datatype of the image.
     * @throws invalid_parameter if the image is empty or `bins == 0`.
     */
    template <typename T>
    ndarray<bool> otsu_mask(const input_ndarray<T> &image, const int64_t bins, const bool parallel);

} // namespace micstat

#endif // threshold_h
