/**
 * @file simulation.hh
 * @brief Synthetic blob images for testing and benchmarking.
 * @version 0.1
 */
#ifndef simulation_h
#define simulation_h

#include "datatypes.hh"
#include "error.hh"

namespace micstat {

    /**
     * Parameters of a set of blobs. Blob `i` is centered at `centers[i]`, which holds one coordinate per image dimension in the order of the image axes.
     */
    struct blob_params {
        std::vector<std::vector<double>> centers;
        std::vector<double> radii, intensities, falloffs;
    };

    /**
     * Renders an image of Gaussian metaballs. Every pixel is `background` plus the sum over all blobs of
     *
     *     intensity * exp(-d² / (falloff * radius²))
     *
     * where `d` is the distance from the pixel to the blob center. Overlapping blobs merge smoothly.
     *
     * @param blobs The blob parameters.
     * @param background The value of pixels far from every blob.
     * @param shape The shape of the output image.
     * @param parallel Whether to use multiple threads.
     * @return The rendered image.
     * @throws mismatched_lengths if the blob parameter arrays and the centers differ in length, or a center does not have one coordinate per dimension.
     */
    ndarray<double> gaussian_metaballs(const blob_params &blobs, const double background, const std::vector<ssize_t> &shape, const bool parallel);

    /**
     * Renders an image of logistic metaballs. Every pixel is the maximum of `background` and, over all blobs,
     *
     *     intensity / (1 + exp((d - radius) / falloff))
     *
     * giving flat-topped blobs whose edge sharpness is controlled by `falloff`.
     *
     * @param blobs The blob parameters.
     * @param background The value of pixels far from every blob.
     * @param shape The shape of the output image.
     * @param parallel Whether to use multiple threads.
     * @return The rendered image.
     * @throws mismatched_lengths if the blob parameter arrays and the centers differ in length, or a center does not have one coordinate per dimension.
     */
    ndarray<double> logistic_metaballs(const blob_params &blobs, const double background, const std::vector<ssize_t> &shape, const bool parallel);

} // namespace micstat

#endif // simulation_h
