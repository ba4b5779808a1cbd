/**
 * @file colocalization.hh
 * @brief Colocalization analysis of two co-registered images.
 *
 * The main entry points are `saca_2d` and `saca_3d`, the spatially adaptive colocalization analysis (SACA) of Wang et al., DOI 10.1109/TIP.2019.2909194.
 * SACA produces a z-score field where every pixel scores the weighted Kendall's Tau-b of an adaptively grown neighborhood.
 * @version 0.1
 */
#ifndef colocalization_h
#define colocalization_h

#include "datatypes.hh"
#include "error.hh"
#include "neighborhood.hh"

#include <map>

namespace micstat {

    /**
     * Tuning of the SACA iterations. The defaults are usable for most images.
     */
    struct saca_params {
        // Kernel size of the first iteration.
        double initial_size = 1.0;
        // Multiplicative growth of the kernel size per iteration.
        double step_size = 1.15;
        // The estimate of this iteration becomes the anchor that later estimates are tested against.
        int64_t check_iteration = 8;
        // Number of iterations. The final kernel size is `initial_size * step_size^(max_iterations-1)`.
        int64_t max_iterations = 15;
        // Separation bandwidth in standard errors. Values <= 0 derive it from the image size as `sqrt(2 ln N)`, but at least 1.
        double lambda = 0.0;
        kernel_falloff falloff = kernel_falloff::quadratic;
        // Neighborhoods with a smaller effective sample size are degenerate and score 0. Must be at least 2.
        double min_effective_samples = 2.0;
        // 0 is silent, 1 prints progress and warnings, 2 also prints the radius, active pixels and timing of every iteration.
        int verbose = 0;
    };

    /**
     * Throws `invalid_parameter` if any field of `params` is out of range.
     */
    void validate(const saca_params &params);

    /**
     * Computes the SACA z-score field of two 2D images.
     *
     * Every iteration `s` grows the kernel to size `initial_size * step_size^s` and re-estimates every pixel that is still active.
     * From `check_iteration` on, a pixel whose estimate moves more than `lambda` anchor standard errors away from its anchor estimate is frozen at its previous estimate.
     *
     * Pixels at or above both thresholds take part in the neighborhoods. Pixels whose neighborhood is degenerate score `0`, and pixels whose neighborhood is constant in both channels score `NaN`.
     * Parallel and sequential execution give identical results.
     *
     * @param image_a The first image.
     * @param image_b The second image.
     * @param threshold_a The intensity threshold of `image_a`.
     * @param threshold_b The intensity threshold of `image_b`.
     * @param parallel Whether to use multiple threads.
     * @param params The iteration parameters.
     * @tparam T The internal datatype of the images.
     * @return The z-score field, with the shape of the images.
     * @throws mismatched_shapes if the images differ in shape.
     * @throws invalid_parameter if the images are not 2D or `params` is invalid.
     */
    template <typename T>
    ndarray<double> saca_2d(const input_ndarray<T> &image_a, const input_ndarray<T> &image_b, const T threshold_a, const T threshold_b, const bool parallel, const saca_params &params = saca_params());

    /**
     * Computes the SACA z-score field of two 3D images with a ball shaped kernel. See `saca_2d`.
     *
     * @throws mismatched_shapes if the images differ in shape.
     * @throws invalid_parameter if the images are not 3D or `params` is invalid.
     */
    template <typename T>
    ndarray<double> saca_3d(const input_ndarray<T> &image_a, const input_ndarray<T> &image_b, const T threshold_a, const T threshold_b, const bool parallel, const saca_params &params = saca_params());

    /**
     * Creates the mask of the pixels whose z-score is significant after Bonferroni correction for every pixel of the field,
     * i.e. `|z| > Φ⁻¹(1 - alpha / 2N)` for a field of `N` pixels. `NaN` z-scores are never significant.
     *
     * @param z_scores The z-score field.
     * @param alpha The family-wise significance level.
     * @param parallel Whether to use multiple threads.
     * @return The mask, with the shape of the field.
     * @throws invalid_parameter if `alpha` is not in `(0, 1)`.
     */
    ndarray<bool> saca_significance_mask(const input_ndarray<double> &z_scores, const double alpha, const bool parallel);

    // `saca_significance_mask` at the default significance level 0.05.
    ndarray<bool> saca_significance_mask(const input_ndarray<double> &z_scores, const bool parallel);

    // Regions of interest, as the `z,y,x` coordinates of their pixels, by label. 2D images use `z = 0`.
    typedef std::map<uint64_t, std::vector<idx3d>> roi_map;

    /**
     * Computes the Pearson correlation of two images within every region of interest.
     *
     * @param image_a The first image.
     * @param image_b The second image.
     * @param rois The regions of interest.
     * @param parallel Whether to process the regions with multiple threads.
     * @tparam T The internal datatype of the images.
     * @return The correlation coefficient of every region, by label. `NaN` for regions that are constant in either image.
     * @throws mismatched_shapes if the images differ in shape.
     * @throws invalid_parameter if a region has fewer than two pixels or a coordinate outside the images.
     */
    template <typename T>
    std::map<uint64_t, double> pearson_roi_coloc(const input_ndarray<T> &image_a, const input_ndarray<T> &image_b, const roi_map &rois, const bool parallel);

} // namespace micstat

#endif // colocalization_h
