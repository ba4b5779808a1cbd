/**
 * @file statistics.cc
 * @brief Weighted rank correlation and supporting statistics.
 * @version 0.1
 */
#include "micstat/statistics.hh"
#include "micstat/general.hh"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

namespace micstat {

    template <typename T>
    double weighted_merge_sort_mut(T *data, double *weights, const int64_t n, T *data_buffer, double *weights_buffer, double *cumulative_buffer) {
        if (n < 2) {
            return 0.0;
        }

        double swaps = 0.0;

        // Ping-pong between the caller's arrays and the buffers, so no pass has to copy back.
        T *data_from = data, *data_to = data_buffer;
        double *weights_from = weights, *weights_to = weights_buffer;
        bool in_buffer = false;

        for (int64_t step = 1; step < n; step *= 2) {
            // Prefix sums of the weights, in the order of this pass' source.
            cumulative_buffer[0] = weights_from[0];
            for (int64_t i = 1; i < n; i++) {
                cumulative_buffer[i] = cumulative_buffer[i-1] + weights_from[i];
            }

            int64_t k = 0;
            for (int64_t left = 0; left < n; left += 2*step) {
                int64_t
                    right = std::min(left + step, n),
                    end   = std::min(left + 2*step, n),
                    l = left,
                    r = right;

                while (l < right && r < end) {
                    if (data_from[l] > data_from[r]) {
                        // data_from[r] is inverted with every element left in the left run.
                        double remaining = l == 0 ? cumulative_buffer[right-1] : cumulative_buffer[right-1] - cumulative_buffer[l-1];
                        swaps += weights_from[r] * remaining;
                        data_to[k] = data_from[r];
                        weights_to[k] = weights_from[r];
                        r++;
                    } else {
                        data_to[k] = data_from[l];
                        weights_to[k] = weights_from[l];
                        l++;
                    }
                    k++;
                }
                // Only one of these runs. When the array length is not a power of two, this also copies the unmerged tail.
                for (; l < right; l++, k++) {
                    data_to[k] = data_from[l];
                    weights_to[k] = weights_from[l];
                }
                for (; r < end; r++, k++) {
                    data_to[k] = data_from[r];
                    weights_to[k] = weights_from[r];
                }
            }

            std::swap(data_from, data_to);
            std::swap(weights_from, weights_to);
            in_buffer = !in_buffer;
        }

        if (in_buffer) {
            std::copy(data_from, data_from + n, data);
            std::copy(weights_from, weights_from + n, weights);
        }

        return swaps;
    }

    template <typename T>
    double weighted_merge_sort_mut(std::vector<T> &data, std::vector<double> &weights) {
        check_lengths("data", (int64_t) data.size(), "weights", (int64_t) weights.size());

        int64_t n = (int64_t) data.size();
        std::vector<T> data_buffer(n);
        std::vector<double> weights_buffer(n), cumulative_buffer(n);

        return weighted_merge_sort_mut(data.data(), weights.data(), n, data_buffer.data(), weights_buffer.data(), cumulative_buffer.data());
    }

    void kendall_workspace::reserve(const int64_t n) {
        if ((int64_t) order.size() >= n) {
            return;
        }
        order.resize(n);
        rank_a.resize(n);
        rank_b.resize(n);
        sorted_b.resize(n);
        sorted_w.resize(n);
        sort_data.resize(n);
        sort_weights.resize(n);
        sort_cumulative.resize(n);
    }

    /**
     * Assigns the average rank (1-based) to every value and computes the weighted tie correction, i.e. `Σ_groups (Σw)² - Σw²` over the groups of tied values.
     *
     * @param values The values to rank.
     * @param weights The weight of every value.
     * @param n The number of values.
     * @param order Scratch memory for `n` indices.
     * @param ranks Output, the rank of every value.
     * @return The tie correction.
     */
    template <typename T>
    static double rank_with_weights(const T *values, const double *weights, const int64_t n, int64_t *order, double *ranks) {
        std::iota(order, order + n, (int64_t) 0);
        std::sort(order, order + n, [values](const int64_t i, const int64_t j) { return values[i] < values[j]; });

        double tie_correction = 0.0;
        int64_t i = 0;
        while (i < n) {
            int64_t j = i;
            double group_sum = 0.0, group_sq = 0.0;
            // Equivalence under the sort order, so the group always holds at least element i.
            do {
                double w = weights[order[j]];
                group_sum += w;
                group_sq += w*w;
                j++;
            } while (j < n && !(values[order[i]] < values[order[j]]));

            // The group occupies the ranks i+1, ..., j.
            double average_rank = 0.5 * (double) (i + 1 + j);
            for (int64_t k = i; k < j; k++) {
                ranks[order[k]] = average_rank;
            }
            if (j - i > 1) {
                tie_correction += group_sum*group_sum - group_sq;
            }

            i = j;
        }

        return tie_correction;
    }

    // True for NaN only. Always false for integer types.
    template <typename T>
    static inline bool is_nan(const T v) {
        return v != v;
    }

    template <typename T>
    static bool contains_nan(const T *values, const int64_t n) {
        for (int64_t i = 0; i < n; i++) {
            if (is_nan(values[i])) {
                return true;
            }
        }
        return false;
    }

    template <typename T>
    double weighted_kendall_tau_b_correlation(const T *a, const T *b, const double *weights, const int64_t n, kendall_workspace &workspace) {
        if (n < 2) {
            return 0.0;
        }
        // NaN has no rank, and would break the strict weak ordering of the sorts below.
        if (contains_nan(a, n) || contains_nan(b, n)) {
            return std::numeric_limits<double>::quiet_NaN();
        }
        workspace.reserve(n);

        int64_t *order = workspace.order.data();
        double
            *rank_a = workspace.rank_a.data(),
            *rank_b = workspace.rank_b.data(),
            *sorted_b = workspace.sorted_b.data(),
            *sorted_w = workspace.sorted_w.data();

        double
            tie_a = rank_with_weights(a, weights, n, order, rank_a),
            tie_b = rank_with_weights(b, weights, n, order, rank_b);

        // Order the observations by the rank of a, breaking ties by the rank of b, so pairs tied in a are never counted as inversions.
        std::iota(order, order + n, (int64_t) 0);
        std::sort(order, order + n, [rank_a, rank_b](const int64_t i, const int64_t j) {
            return rank_a[i] < rank_a[j] || (rank_a[i] == rank_a[j] && rank_b[i] < rank_b[j]);
        });

        // Pairs tied in both variables, which the two tie corrections above subtract twice.
        double tie_ab = 0.0;
        int64_t i = 0;
        while (i < n) {
            int64_t j = i;
            double group_sum = 0.0, group_sq = 0.0;
            while (j < n && rank_a[order[j]] == rank_a[order[i]] && rank_b[order[j]] == rank_b[order[i]]) {
                double w = weights[order[j]];
                group_sum += w;
                group_sq += w*w;
                j++;
            }
            if (j - i > 1) {
                tie_ab += group_sum*group_sum - group_sq;
            }
            i = j;
        }

        for (int64_t k = 0; k < n; k++) {
            sorted_b[k] = rank_b[order[k]];
            sorted_w[k] = weights[order[k]];
        }

        double discordant = weighted_merge_sort_mut(sorted_b, sorted_w, n,
                                                    workspace.sort_data.data(),
                                                    workspace.sort_weights.data(),
                                                    workspace.sort_cumulative.data());

        double total_w = 0.0, total_w2 = 0.0;
        for (int64_t k = 0; k < n; k++) {
            total_w += weights[k];
            total_w2 += weights[k]*weights[k];
        }

        // All quantities below count ordered pairs, i.e. twice the unordered pair mass.
        double pairs = total_w*total_w - total_w2;
        if (!(pairs > 0.0)) {
            return 0.0;
        }

        double
            untied_a = pairs - tie_a,
            untied_b = pairs - tie_b,
            tolerance = 1e-12 * pairs;
        bool
            constant_a = untied_a <= tolerance,
            constant_b = untied_b <= tolerance;

        if (constant_a && constant_b) {
            return std::numeric_limits<double>::quiet_NaN();
        }
        if (constant_a || constant_b) {
            return 0.0;
        }

        double
            concordant = pairs - tie_a - tie_b + tie_ab - 2.0*discordant,
            numerator = concordant - 2.0*discordant,
            denominator = std::sqrt(untied_a * untied_b);

        if (denominator == 0.0 || std::isnan(denominator)) {
            return 0.0;
        }

        return std::clamp(numerator / denominator, -1.0, 1.0);
    }

    template <typename T>
    double weighted_kendall_tau_b_correlation(const std::vector<T> &a, const std::vector<T> &b, const std::vector<double> &weights) {
        check_lengths("a", (int64_t) a.size(), "b", (int64_t) b.size());
        check_lengths("a", (int64_t) a.size(), "weights", (int64_t) weights.size());
        if (contains_nan(a.data(), (int64_t) a.size())) {
            throw invalid_parameter("a", "the sample can not contain NaN");
        }
        if (contains_nan(b.data(), (int64_t) b.size())) {
            throw invalid_parameter("b", "the sample can not contain NaN");
        }

        kendall_workspace workspace;
        return weighted_kendall_tau_b_correlation(a.data(), b.data(), weights.data(), (int64_t) a.size(), workspace);
    }

    double effective_sample_size(const double *weights, const int64_t n) {
        double total = 0.0, total_sq = 0.0;
        for (int64_t i = 0; i < n; i++) {
            total += weights[i];
            total_sq += weights[i]*weights[i];
        }
        return total_sq > 0.0 ? (total*total) / total_sq : 0.0;
    }

    double effective_sample_size(const std::vector<double> &weights) {
        return effective_sample_size(weights.data(), (int64_t) weights.size());
    }

    template <typename T>
    double pearson_correlation(const std::vector<T> &a, const std::vector<T> &b) {
        check_lengths("a", (int64_t) a.size(), "b", (int64_t) b.size());
        int64_t n = (int64_t) a.size();
        if (n < 2) {
            throw invalid_parameter("a", "at least two samples are needed for a correlation");
        }

        double
            mean_a = kahan_sum(a) / (double) n,
            mean_b = kahan_sum(b) / (double) n,
            cross = 0.0, sq_a = 0.0, sq_b = 0.0;

        for (int64_t i = 0; i < n; i++) {
            double
                diff_a = (double) a[i] - mean_a,
                diff_b = (double) b[i] - mean_b;
            cross += diff_a * diff_b;
            sq_a += diff_a * diff_a;
            sq_b += diff_b * diff_b;
        }

        return cross / std::sqrt(sq_a * sq_b);
    }

    #define INSTANTIATE_STATISTICS(T) \
        template double weighted_merge_sort_mut<T>(T *, double *, const int64_t, T *, double *, double *); \
        template double weighted_merge_sort_mut<T>(std::vector<T> &, std::vector<double> &); \
        template double weighted_kendall_tau_b_correlation<T>(const T *, const T *, const double *, const int64_t, kendall_workspace &); \
        template double weighted_kendall_tau_b_correlation<T>(const std::vector<T> &, const std::vector<T> &, const std::vector<double> &); \
        template double pearson_correlation<T>(const std::vector<T> &, const std::vector<T> &);

    FOR_EACH_PIXEL_TYPE(INSTANTIATE_STATISTICS)
    INSTANTIATE_STATISTICS(int32_t)

} // namespace micstat
