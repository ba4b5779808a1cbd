/**
 * @file simulation.cc
 * @brief Synthetic blob images for testing and benchmarking.
 * @version 0.1
 */
#include "micstat/simulation.hh"
#include "micstat/boilerplate.hh"

#include <algorithm>
#include <cmath>

namespace micstat {

    static void check_blobs(const blob_params &blobs, const std::vector<ssize_t> &shape) {
        int64_t n_blobs = (int64_t) blobs.centers.size();
        check_lengths("centers", n_blobs, "radii", (int64_t) blobs.radii.size());
        check_lengths("centers", n_blobs, "intensities", (int64_t) blobs.intensities.size());
        check_lengths("centers", n_blobs, "falloffs", (int64_t) blobs.falloffs.size());
        for (auto &center : blobs.centers) {
            check_lengths("center", (int64_t) center.size(), "shape", (int64_t) shape.size());
        }
        if (shape.empty() || shape.size() > 3) {
            throw invalid_parameter("shape", "only 1D, 2D and 3D images are supported");
        }
        for (ssize_t s : shape) {
            if (s < 0) {
                throw invalid_parameter("shape", "negative extents are not allowed");
            }
        }
    }

    // Squared distance from the pixel at `(z,y,x)` to a center given in the axis order of an image with `ndim` dimensions.
    static double distance_squared(const std::vector<double> &center, const size_t ndim, const int64_t z, const int64_t y, const int64_t x) {
        const int64_t position[3] = { z, y, x };
        double d2 = 0.0;
        for (size_t i = 0; i < ndim; i++) {
            double diff = (double) position[3 - ndim + i] - center[i];
            d2 += diff * diff;
        }
        return d2;
    }

    ndarray<double> gaussian_metaballs(const blob_params &blobs, const double background, const std::vector<ssize_t> &shape, const bool parallel) {
        check_blobs(blobs, shape);

        ndarray<double> result(shape, background);
        UNPACK_NUMPY(result);
        double *result_data = result.data.data();
        const size_t ndim = shape.size();
        const int64_t n_blobs = (int64_t) blobs.centers.size();

        FOR_3D_BEGIN(result, parallel,) {
            double value = background;
            for (int64_t i = 0; i < n_blobs; i++) {
                double
                    d2 = distance_squared(blobs.centers[i], ndim, z, y, x),
                    r2 = blobs.radii[i] * blobs.radii[i];
                value += blobs.intensities[i] * std::exp(-d2 / (blobs.falloffs[i] * r2));
            }
            result_data[flat_index] = value;
        } FOR_3D_END();

        return result;
    }

    ndarray<double> logistic_metaballs(const blob_params &blobs, const double background, const std::vector<ssize_t> &shape, const bool parallel) {
        check_blobs(blobs, shape);

        ndarray<double> result(shape, background);
        UNPACK_NUMPY(result);
        double *result_data = result.data.data();
        const size_t ndim = shape.size();
        const int64_t n_blobs = (int64_t) blobs.centers.size();

        FOR_3D_BEGIN(result, parallel,) {
            double value = background;
            for (int64_t i = 0; i < n_blobs; i++) {
                double
                    d = std::sqrt(distance_squared(blobs.centers[i], ndim, z, y, x)),
                    k = std::max(blobs.falloffs[i], 1e-12);
                value = std::max(value, blobs.intensities[i] / (1.0 + std::exp((d - blobs.radii[i]) / k)));
            }
            result_data[flat_index] = value;
        } FOR_3D_END();

        return result;
    }

} // namespace micstat
