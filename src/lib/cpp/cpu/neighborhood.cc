/**
 * @file neighborhood.cc
 * @brief The adaptive neighborhood of a single pixel in the spatially adaptive colocalization analysis (SACA).
 * @version 0.1
 */
#include "micstat/neighborhood.hh"

#include <cmath>
#include <limits>

namespace micstat {

    double location_weight(const double distance, const double size, const kernel_falloff falloff) {
        double u = distance / (size + 1.0);
        switch (falloff) {
            case kernel_falloff::quadratic: return 1.0 - u*u;
            case kernel_falloff::linear:    return 1.0 - u;
            case kernel_falloff::gaussian:  return std::exp(-2.0 * u*u);
        }
        throw invalid_parameter("falloff", "unknown kernel falloff");
    }

    std::vector<kernel_offset> build_kernel(const double size, const bool volumetric, const kernel_falloff falloff) {
        int64_t
            radius = (int64_t) std::floor(size),
            z_radius = volumetric ? radius : 0;
        double size_sq = size * size;

        std::vector<kernel_offset> kernel;
        for (int64_t dz = -z_radius; dz <= z_radius; dz++) {
            for (int64_t dy = -radius; dy <= radius; dy++) {
                for (int64_t dx = -radius; dx <= radius; dx++) {
                    double d2 = (double) (dz*dz + dy*dy + dx*dx);
                    if (d2 <= size_sq) {
                        kernel.push_back({ dz, dy, dx, location_weight(std::sqrt(d2), size, falloff) });
                    }
                }
            }
        }

        return kernel;
    }

    double separation_weight(const double tau_center, const double tau_sample, const double sigma_center, const double lambda) {
        double t = std::fabs(tau_center - tau_sample) / (sigma_center * lambda);
        if (!(t < 1.0)) {
            return 0.0;
        }
        double s = 1.0 - t*t;
        return s * s;
    }

    double kendall_tau_variance(const double n) {
        return 2.0 * (2.0*n + 5.0) / (9.0 * n * (n - 1.0));
    }

    template <typename T>
    pixel_estimate estimate_pixel(const neighborhood_context<T> &context, const idx3d &center, neighborhood_scratch<T> &scratch) {
        auto [Nz, Ny, Nx] = context.shape;
        const std::vector<kernel_offset> &kernel = *context.kernel;

        int64_t center_index = center.z*Ny*Nx + center.y*Nx + center.x;
        double
            tau_center = context.tau_prev[center_index],
            sigma_center = context.sigma_prev[center_index];

        T *sample_a = scratch.a.data(), *sample_b = scratch.b.data();
        double *sample_w = scratch.weights.data();

        int64_t n = 0;
        for (const kernel_offset &offset : kernel) {
            int64_t
                z = center.z + offset.dz,
                y = center.y + offset.dy,
                x = center.x + offset.dx;
            if (z < 0 || z >= Nz || y < 0 || y >= Ny || x < 0 || x >= Nx) {
                continue;
            }

            int64_t index = z*Ny*Nx + y*Nx + x;
            T a = context.image_a[index], b = context.image_b[index];
            // Written negated so NaN samples fail the threshold as well.
            if (!(a >= context.threshold_a) || !(b >= context.threshold_b)) {
                continue;
            }

            double w = offset.weight * separation_weight(tau_center, context.tau_prev[index], sigma_center, context.lambda);
            if (w <= 0.0) {
                continue;
            }

            sample_a[n] = a;
            sample_b[n] = b;
            sample_w[n] = w;
            n++;
        }

        pixel_estimate estimate;
        estimate.effective_samples = effective_sample_size(sample_w, n);
        if (n < 2 || estimate.effective_samples < context.min_effective_samples) {
            estimate.tau = 0.0;
            estimate.z = 0.0;
            estimate.sigma = std::numeric_limits<double>::infinity();
            return estimate;
        }

        estimate.tau = weighted_kendall_tau_b_correlation(sample_a, sample_b, sample_w, n, scratch.kendall);
        estimate.sigma = std::sqrt(kendall_tau_variance(estimate.effective_samples));
        estimate.z = estimate.tau / estimate.sigma;

        return estimate;
    }

    #define INSTANTIATE_NEIGHBORHOOD(T) \
        template pixel_estimate estimate_pixel<T>(const neighborhood_context<T> &, const idx3d &, neighborhood_scratch<T> &);

    FOR_EACH_PIXEL_TYPE(INSTANTIATE_NEIGHBORHOOD)

} // namespace micstat
