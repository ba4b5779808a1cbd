/**
 * @file statistics.hh
 * @brief Rank and moment statistics: weighted merge sort, weighted Kendall's Tau-b, Pearson correlation and the effective sample size.
 * @version 0.1
 */
#ifndef statistics_h
#define statistics_h

#include "datatypes.hh"
#include "error.hh"

namespace micstat {

    /**
     * Bottom-up merge sort of `data` that applies the same permutation to `weights` and counts the weighted inversions.
     * A weighted inversion is a pair `i < j` with `data[i] > data[j]`, and it contributes `weights[i] * weights[j]` to the count.
     * The sort is stable, so equal elements are never counted as inversions.
     *
     * The merge passes alternate between the caller's arrays and the scratch buffers. The sorted result always ends up in `data` and `weights`.
     *
     * @param data The values to sort. Sorted in place.
     * @param weights The weights of the values. Permuted in place alongside `data`.
     * @param n The number of elements in both `data` and `weights`.
     * @param data_buffer Scratch memory for at least `n` elements of type `T`.
     * @param weights_buffer Scratch memory for at least `n` doubles.
     * @param cumulative_buffer Scratch memory for at least `n` doubles.
     * @tparam T The datatype of the values.
     * @return The weighted inversion count.
     */
    template <typename T>
    double weighted_merge_sort_mut(T *data, double *weights, const int64_t n, T *data_buffer, double *weights_buffer, double *cumulative_buffer);

    /**
     * Sorts `data` and `weights` in place, see the overload above. Allocates its own scratch memory.
     *
     * @param data The values to sort.
     * @param weights The weights of the values.
     * @tparam T The datatype of the values.
     * @return The weighted inversion count.
     * @throws mismatched_lengths if `data.size() != weights.size()`.
     */
    template <typename T>
    double weighted_merge_sort_mut(std::vector<T> &data, std::vector<double> &weights);

    /**
     * Reusable scratch memory for `weighted_kendall_tau_b_correlation`.
     * A workspace grows to the largest sample it has seen and is never shrunk, so it can be kept per thread and reused for every pixel.
     */
    struct kendall_workspace {
        std::vector<int64_t> order;
        std::vector<double> rank_a, rank_b, sorted_b, sorted_w, sort_data, sort_weights, sort_cumulative;

        void reserve(const int64_t n);
    };

    /**
     * Computes the weighted Kendall's Tau-b rank correlation coefficient
     *
     *     τ_b = (C - D) / √[(n₀ - n₁)(n₀ - n₂)]
     *
     * where `C` and `D` are the weighted concordant and discordant pair masses, `n₀ = (Σw)² - Σw²` is the total weighted pair mass and `n₁`, `n₂` are twice the weighted pair mass of the ties in `a` and `b` respectively.
     * The discordant mass is the weighted inversion count of the ranks of `b` ordered by the ranks of `a`.
     *
     * Degenerate samples do not throw:
     *
     * - fewer than two observations, or no pair mass (all weights zero): `0.0`.
     *
     * - both variables constant: `NaN`.
     *
     * - one variable constant, or a zero or `NaN` denominator for any other reason: `0.0`.
     *
     * - a `NaN` observation in `a` or `b`: `NaN`.
     *
     * The result is clamped to `[-1, 1]`.
     *
     * @param a The first variable.
     * @param b The second variable.
     * @param weights The non-negative weight of every observation.
     * @param n The number of observations.
     * @param workspace Scratch memory, resized on demand.
     * @tparam T The datatype of the observations.
     */
    template <typename T>
    double weighted_kendall_tau_b_correlation(const T *a, const T *b, const double *weights, const int64_t n, kendall_workspace &workspace);

    /**
     * Computes the weighted Kendall's Tau-b rank correlation coefficient, see the overload above.
     *
     * @throws mismatched_lengths if `a`, `b` and `weights` do not all have the same length.
     * @throws invalid_parameter if `a` or `b` contains `NaN`.
     */
    template <typename T>
    double weighted_kendall_tau_b_correlation(const std::vector<T> &a, const std::vector<T> &b, const std::vector<double> &weights);

    /**
     * Kish's effective sample size `(Σw)² / Σw²` of a set of weights. All-zero weights have an effective sample size of `0.0`.
     *
     * @param weights The weights.
     * @param n The number of weights.
     */
    double effective_sample_size(const double *weights, const int64_t n);

    double effective_sample_size(const std::vector<double> &weights);

    /**
     * Computes the Pearson correlation coefficient of two samples.
     *
     * @param a The first sample.
     * @param b The second sample.
     * @tparam T The datatype of the samples.
     * @return The correlation coefficient. `NaN` if either sample has zero variance.
     * @throws mismatched_lengths if `a.size() != b.size()`.
     * @throws invalid_parameter if the samples have fewer than two elements.
     */
    template <typename T>
    double pearson_correlation(const std::vector<T> &a, const std::vector<T> &b);

} // namespace micstat

#endif // statistics_h
