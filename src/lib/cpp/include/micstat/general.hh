/**
 * @file general.hh
 * @brief Generic functions that can be used in a variety of contexts. Mostly parallel implementations of common numpy functions.
 * @version 0.1
 */
#ifndef general_h
#define general_h

#include "boilerplate.hh"
#include "datatypes.hh"
#include "error.hh"

#include <algorithm>
#include <limits>
#include <utility>

namespace micstat {

    /**
     * Finds the minimum and maximum values in an array.
     *
     * @param in the input array.
     * @param parallel whether to use multiple threads.
     * @tparam T the internal datatype of the input array.
     * @return the pair `(min, max)`.
     * @throws invalid_parameter if `in` is empty.
     */
    template <typename T>
    inline std::pair<T, T> min_max(const input_ndarray<T> &in, const bool parallel) {
        UNPACK_NUMPY(in);
        if (in_length == 0) {
            throw invalid_parameter("data", "the array can not be empty");
        }

        const T *in_data = in.data;
        T vmin = in_data[0], vmax = in_data[0];
        FOR_FLAT_BEGIN(in_length, parallel, reduction(min:vmin) reduction(max:vmax)) {
            vmin = std::min(vmin, in_data[flat_index]);
            vmax = std::max(vmax, in_data[flat_index]);
        } FOR_FLAT_END();

        return { vmin, vmax };
    }

    /**
     * Sums the elements of an array in double precision.
     * The parallel reduction may associate the additions differently than the sequential one.
     *
     * @param in the input array.
     * @param parallel whether to use multiple threads.
     * @tparam T the internal datatype of the input array.
     */
    template <typename T>
    inline double sum(const input_ndarray<T> &in, const bool parallel) {
        UNPACK_NUMPY(in);
        const T *in_data = in.data;
        double total = 0.0;
        FOR_FLAT_BEGIN(in_length, parallel, reduction(+:total)) {
            total += (double) in_data[flat_index];
        } FOR_FLAT_END();
        return total;
    }

    /**
     * Kahan compensated summation. The running error residual is subtracted from every value before it is added.
     *
     * @param values pointer to the values.
     * @param n the number of values.
     * @tparam T the internal datatype of the values.
     */
    template <typename T>
    inline double kahan_sum(const T *values, const int64_t n) {
        double total = 0.0, compensation = 0.0;
        for (int64_t i = 0; i < n; i++) {
            double
                adjusted = (double) values[i] - compensation,
                next = total + adjusted;
            compensation = (next - total) - adjusted;
            total = next;
        }
        return total;
    }

    template <typename T>
    inline double kahan_sum(const std::vector<T> &values) {
        return kahan_sum(values.data(), (int64_t) values.size());
    }

    /**
     * Creates a boolean mask that is `true` where `in >= threshold`.
     *
     * @param in the input array.
     * @param threshold the pixel threshold value.
     * @param parallel whether to use multiple threads.
     * @tparam T the internal datatype of the input array.
     */
    template <typename T>
    inline ndarray<bool> manual_mask(const input_ndarray<T> &in, const T threshold, const bool parallel) {
        UNPACK_NUMPY(in);
        ndarray<bool> mask(in.shape);
        const T *in_data = in.data;
        mask_type *mask_data = mask.data.data();

        FOR_FLAT_BEGIN(in_length, parallel,) {
            mask_data[flat_index] = in_data[flat_index] >= threshold;
        } FOR_FLAT_END();

        return mask;
    }

} // namespace micstat

#endif // general_h
