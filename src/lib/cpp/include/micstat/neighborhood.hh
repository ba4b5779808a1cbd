/**
 * @file neighborhood.hh
 * @brief The adaptive neighborhood of a single pixel in the spatially adaptive colocalization analysis (SACA).
 *
 * The analysis grows a disk (2D) or ball (3D) shaped kernel around every pixel over a number of iterations.
 * Every sample inside the kernel is weighted by the product of
 *
 * - a location weight, decreasing with the distance to the center.
 *
 * - a separation weight, decreasing with the statistical distance between the previous estimates at the center and at the sample.
 *
 * Samples below the threshold of either channel get zero weight and are left out.
 * @version 0.1
 */
#ifndef neighborhood_h
#define neighborhood_h

#include "datatypes.hh"
#include "statistics.hh"

namespace micstat {

    /**
     * Profile of the location weight as a function of the normalized distance `u` to the kernel center.
     */
    enum class kernel_falloff {
        quadratic, // 1 - u²
        linear,    // 1 - u
        gaussian   // exp(-2u²)
    };

    /**
     * A single entry of the kernel offset table.
     */
    struct kernel_offset {
        int64_t dz, dy, dx;
        double weight;
    };

    /**
     * Computes the location weight of a sample at distance `distance` from the center of a kernel of size `size`.
     * The distance is normalized by `size + 1`, so samples on the kernel boundary keep a positive weight.
     *
     * @param distance The Euclidean distance to the kernel center.
     * @param size The kernel size.
     * @param falloff The weight profile.
     * @return The location weight in `(0, 1]` for `distance <= size`.
     */
    double location_weight(const double distance, const double size, const kernel_falloff falloff);

    /**
     * Builds the offset table of a kernel of size `size`: every integer offset within Euclidean distance `size` of the center, in row-major order, along with its location weight.
     *
     * @param size The kernel size. The kernel radius is `floor(size)`.
     * @param volumetric Whether the kernel is a ball (`true`) or a disk in the yx-plane (`false`).
     * @param falloff The weight profile.
     * @return The offset table.
     */
    std::vector<kernel_offset> build_kernel(const double size, const bool volumetric, const kernel_falloff falloff);

    /**
     * Computes the separation weight between the center of a neighborhood and one of its samples.
     * With `t = |tau_center - tau_sample| / (sigma_center * lambda)`, the weight is `(1 - t²)²` for `t < 1` and `0` otherwise.
     *
     * @param tau_center The previous correlation estimate at the center.
     * @param tau_sample The previous correlation estimate at the sample.
     * @param sigma_center The previous standard error at the center. `inf` before the first estimate, which makes every weight `1`.
     * @param lambda The separation bandwidth.
     */
    double separation_weight(const double tau_center, const double tau_sample, const double sigma_center, const double lambda);

    /**
     * The asymptotic variance `2(2n + 5) / (9n(n - 1))` of Kendall's Tau under independence, evaluated at the effective sample size `n`.
     *
     * @param n The effective sample size. Must be larger than 1.
     */
    double kendall_tau_variance(const double n);

    /**
     * Per-thread scratch memory for gathering and scoring neighborhoods.
     * Grows to the largest kernel it has seen, so a single instance serves every pixel a thread processes.
     *
     * @tparam T The pixel type of the images.
     */
    template <typename T>
    struct neighborhood_scratch {
        std::vector<T> a, b;
        std::vector<double> weights;
        kendall_workspace kendall;

        void reserve(const int64_t n) {
            if ((int64_t) weights.size() < n) {
                a.resize(n);
                b.resize(n);
                weights.resize(n);
            }
            kendall.reserve(n);
        }
    };

    /**
     * The estimate at a single pixel.
     *
     * It has four members:
     *
     * - `tau` : the weighted Kendall's Tau-b of the neighborhood. `NaN` if both channels are constant.
     *
     * - `sigma` : the standard error of `tau`. `inf` for degenerate neighborhoods.
     *
     * - `z` : the z-score `tau / sigma`.
     *
     * - `effective_samples` : Kish's effective sample size of the neighborhood weights.
     */
    struct pixel_estimate {
        double tau, sigma, z, effective_samples;
    };

    /**
     * The read-only state a pass of the analysis hands to every pixel.
     *
     * @tparam T The pixel type of the images.
     */
    template <typename T>
    struct neighborhood_context {
        const T *image_a, *image_b;
        shape_t shape;
        T threshold_a, threshold_b;
        const std::vector<kernel_offset> *kernel;
        // The estimates of the previous pass, indexed by flat pixel index.
        const double *tau_prev, *sigma_prev;
        double lambda, min_effective_samples;
    };

    /**
     * Gathers the weighted neighborhood of the pixel at `center` and scores it.
     * Neighbors outside the image are skipped. A neighborhood whose effective sample size is below `context.min_effective_samples` has `tau = z = 0` and `sigma = inf`.
     *
     * @param context The images, the kernel and the previous estimates.
     * @param center The pixel.
     * @param scratch Scratch memory of at least `context.kernel->size()` samples.
     * @tparam T The pixel type of the images.
     * @return The estimate at `center`.
     */
    template <typename T>
    pixel_estimate estimate_pixel(const neighborhood_context<T> &context, const idx3d &center, neighborhood_scratch<T> &scratch);

} // namespace micstat

#endif // neighborhood_h
