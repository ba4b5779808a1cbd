/**
 * @file colocalization.cc
 * @brief Colocalization analysis of two co-registered images.
 * @version 0.1
 */
#include "micstat/colocalization.hh"
#include "micstat/boilerplate.hh"
#include "micstat/distribution.hh"
#include "micstat/statistics.hh"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <iostream>
#include <limits>

namespace micstat {

    void validate(const saca_params &params) {
        if (!(params.initial_size > 0.0)) {
            throw invalid_parameter("initial_size", "the initial kernel size must be positive");
        }
        if (!(params.step_size > 1.0)) {
            throw invalid_parameter("step_size", "the kernel must grow, i.e. the step size must be larger than 1");
        }
        if (params.max_iterations < 1) {
            throw invalid_parameter("max_iterations", "at least one iteration is needed");
        }
        if (params.check_iteration < 0 || params.check_iteration >= params.max_iterations) {
            throw invalid_parameter("check_iteration", "the check iteration must lie in [0, max_iterations)");
        }
        // The Kendall variance divides by n(n - 1).
        if (!(params.min_effective_samples >= 2.0)) {
            throw invalid_parameter("min_effective_samples", "the minimum effective sample size must be at least 2");
        }
    }

    /**
     * The iterations shared by `saca_2d` and `saca_3d`. The inputs have been validated by the caller.
     *
     * The estimates of the previous iteration are only read during an iteration, and every pixel writes only its own cells of the next estimates, so the pixels can be processed in any order.
     *
     * @param image_a The first image.
     * @param image_b The second image.
     * @param threshold_a The intensity threshold of `image_a`.
     * @param threshold_b The intensity threshold of `image_b`.
     * @param volumetric Whether to grow a ball (`true`) or a disk (`false`).
     * @param parallel Whether to use multiple threads.
     * @param params The iteration parameters.
     * @tparam T The internal datatype of the images.
     * @return The z-score field.
     */
    template <typename T>
    static ndarray<double> saca(const input_ndarray<T> &image_a, const input_ndarray<T> &image_b, const T threshold_a, const T threshold_b, const bool volumetric, const bool parallel, const saca_params &params) {
        UNPACK_NUMPY(image_a);
        const int64_t N = image_a_length;

        ndarray<double> z_scores(image_a.shape, 0.0);
        if (N == 0) {
            return z_scores;
        }

        double lambda = params.lambda;
        if (!(lambda > 0.0)) {
            lambda = std::max(std::sqrt(2.0 * std::log((double) N)), 1.0);
            if (params.verbose >= 1) {
                fprintf(stderr, "SACA: no separation bandwidth given, using lambda = %g for %ld pixels\n", lambda, (long) N);
            }
        }

        const double inf = std::numeric_limits<double>::infinity();
        std::vector<double>
            tau_prev(N, 0.0), sigma_prev(N, inf),
            tau_next(N, 0.0), sigma_next(N, inf),
            tau_anchor(N, 0.0), sigma_anchor(N, inf);
        std::vector<mask_type> frozen(N, 0);

        double
            *z_data = z_scores.data.data(),
            *tau_anchor_data = tau_anchor.data(),
            *sigma_anchor_data = sigma_anchor.data();
        mask_type *frozen_data = frozen.data();

        auto saca_start = std::chrono::high_resolution_clock::now();

        for (int64_t s = 0; s < params.max_iterations; s++) {
            auto iteration_start = std::chrono::high_resolution_clock::now();

            double size = params.initial_size * std::pow(params.step_size, (double) s);
            std::vector<kernel_offset> kernel = build_kernel(size, volumetric, params.falloff);
            const int64_t kernel_size = (int64_t) kernel.size();

            if (DEBUG) {
                printf("SACA iteration %ld: kernel of size %g has %ld offsets\n", (long) s, size, (long) kernel_size);
            }

            const neighborhood_context<T> context = {
                image_a.data, image_b.data,
                { image_a_Nz, image_a_Ny, image_a_Nx },
                threshold_a, threshold_b,
                &kernel,
                tau_prev.data(), sigma_prev.data(),
                lambda, params.min_effective_samples
            };

            const bool
                anchor_pass = s == params.check_iteration,
                test_pass = s > params.check_iteration;

            const double
                *tau_prev_data = tau_prev.data(),
                *sigma_prev_data = sigma_prev.data();
            double
                *tau_next_data = tau_next.data(),
                *sigma_next_data = sigma_next.data();

            int64_t active = 0;

            #pragma omp parallel if(parallel)
            {
                neighborhood_scratch<T> scratch;
                scratch.reserve(kernel_size);

                #pragma omp for schedule(dynamic, 64) reduction(+:active)
                for (int64_t i = 0; i < N; i++) {
                    if (frozen_data[i]) {
                        tau_next_data[i] = tau_prev_data[i];
                        sigma_next_data[i] = sigma_prev_data[i];
                        continue;
                    }
                    active++;

                    idx3d center = { i / (image_a_Ny*image_a_Nx), (i / image_a_Nx) % image_a_Ny, i % image_a_Nx };
                    pixel_estimate estimate = estimate_pixel(context, center, scratch);

                    // Constant neighborhoods keep their NaN in the z-scores, but must not poison the separation weights of the next iteration.
                    double tau = std::isnan(estimate.tau) ? 0.0 : estimate.tau;

                    if (test_pass && std::fabs(tau - tau_anchor_data[i]) / sigma_anchor_data[i] > lambda) {
                        frozen_data[i] = 1;
                        tau_next_data[i] = tau_prev_data[i];
                        sigma_next_data[i] = sigma_prev_data[i];
                        continue;
                    }

                    tau_next_data[i] = tau;
                    sigma_next_data[i] = estimate.sigma;
                    z_data[i] = estimate.z;

                    if (anchor_pass) {
                        tau_anchor_data[i] = tau;
                        sigma_anchor_data[i] = estimate.sigma;
                    }
                }
            }

            std::swap(tau_prev, tau_next);
            std::swap(sigma_prev, sigma_next);

            if (params.verbose >= 1) {
                printf("\rSACA iteration %ld/%ld", (long) (s + 1), (long) params.max_iterations);
                fflush(stdout);
            }
            if (params.verbose >= 2) {
                auto iteration_end = std::chrono::high_resolution_clock::now();
                std::chrono::duration<double> elapsed = iteration_end - iteration_start;
                std::cout << std::endl << "size: " << size << ", radius: " << (int64_t) std::floor(size)
                          << ", offsets: " << kernel_size << ", active pixels: " << active << "/" << N
                          << ", time: " << elapsed.count() << " s" << std::endl;
            }
        }

        if (params.verbose >= 1) {
            printf("\n");
            fflush(stdout);
        }

        if (PROFILE) {
            auto saca_end = std::chrono::high_resolution_clock::now();
            std::chrono::duration<double> elapsed = saca_end - saca_start;
            std::cout << "saca: " << elapsed.count() << " s, " << (double) N / elapsed.count() / 1e6 << " Mpixels/s" << std::endl;
        }

        return z_scores;
    }

    template <typename T>
    ndarray<double> saca_2d(const input_ndarray<T> &image_a, const input_ndarray<T> &image_b, const T threshold_a, const T threshold_b, const bool parallel, const saca_params &params) {
        if (image_a.shape.size() != 2) {
            throw invalid_parameter("image_a", "expected a 2D image, got " + std::to_string(image_a.shape.size()) + " dimensions");
        }
        check_shapes("image_a", image_a.shape, "image_b", image_b.shape);
        validate(params);

        return saca(image_a, image_b, threshold_a, threshold_b, false, parallel, params);
    }

    template <typename T>
    ndarray<double> saca_3d(const input_ndarray<T> &image_a, const input_ndarray<T> &image_b, const T threshold_a, const T threshold_b, const bool parallel, const saca_params &params) {
        if (image_a.shape.size() != 3) {
            throw invalid_parameter("image_a", "expected a 3D image, got " + std::to_string(image_a.shape.size()) + " dimensions");
        }
        check_shapes("image_a", image_a.shape, "image_b", image_b.shape);
        validate(params);

        return saca(image_a, image_b, threshold_a, threshold_b, true, parallel, params);
    }

    ndarray<bool> saca_significance_mask(const input_ndarray<double> &z_scores, const double alpha, const bool parallel) {
        if (!(alpha > 0.0 && alpha < 1.0)) {
            throw invalid_parameter("alpha", "the significance level must lie in (0, 1)");
        }

        UNPACK_NUMPY(z_scores);
        ndarray<bool> mask(z_scores.shape);
        if (z_scores_length == 0) {
            return mask;
        }

        // Φ⁻¹(1 - p) = -Φ⁻¹(p), which keeps the precision of tiny tail probabilities.
        const double z_critical = -inverse_normal_cdf(alpha / (2.0 * (double) z_scores_length));

        const double *z_data = z_scores.data;
        mask_type *mask_data = mask.data.data();
        FOR_FLAT_BEGIN(z_scores_length, parallel,) {
            mask_data[flat_index] = std::fabs(z_data[flat_index]) > z_critical;
        } FOR_FLAT_END();

        return mask;
    }

    ndarray<bool> saca_significance_mask(const input_ndarray<double> &z_scores, const bool parallel) {
        return saca_significance_mask(z_scores, DEFAULT_ALPHA, parallel);
    }

    template <typename T>
    std::map<uint64_t, double> pearson_roi_coloc(const input_ndarray<T> &image_a, const input_ndarray<T> &image_b, const roi_map &rois, const bool parallel) {
        check_shapes("image_a", image_a.shape, "image_b", image_b.shape);
        UNPACK_NUMPY(image_a);

        std::vector<const roi_map::value_type *> entries;
        for (auto &entry : rois) {
            const std::vector<idx3d> &coords = entry.second;
            if (coords.size() < 2) {
                throw invalid_parameter("rois", "region " + std::to_string(entry.first) + " has fewer than two pixels");
            }
            for (const idx3d &p : coords) {
                if (p.z < 0 || p.z >= image_a_Nz || p.y < 0 || p.y >= image_a_Ny || p.x < 0 || p.x >= image_a_Nx) {
                    throw invalid_parameter("rois", "region " + std::to_string(entry.first) + " has the coordinate (" +
                                            std::to_string(p.z) + ", " + std::to_string(p.y) + ", " + std::to_string(p.x) + ") outside the image");
                }
            }
            entries.push_back(&entry);
        }

        const int64_t n_rois = (int64_t) entries.size();
        std::vector<double> correlations(n_rois);

        #pragma omp parallel for if(parallel) schedule(dynamic)
        for (int64_t r = 0; r < n_rois; r++) {
            const std::vector<idx3d> &coords = entries[r]->second;
            std::vector<T> values_a, values_b;
            values_a.reserve(coords.size());
            values_b.reserve(coords.size());
            for (const idx3d &p : coords) {
                int64_t index = p.z*image_a_Ny*image_a_Nx + p.y*image_a_Nx + p.x;
                values_a.push_back(image_a.data[index]);
                values_b.push_back(image_b.data[index]);
            }
            correlations[r] = pearson_correlation(values_a, values_b);
        }

        std::map<uint64_t, double> result;
        for (int64_t r = 0; r < n_rois; r++) {
            result[entries[r]->first] = correlations[r];
        }

        return result;
    }

    #define INSTANTIATE_COLOCALIZATION(T) \
        template ndarray<double> saca_2d<T>(const input_ndarray<T> &, const input_ndarray<T> &, const T, const T, const bool, const saca_params &); \
        template ndarray<double> saca_3d<T>(const input_ndarray<T> &, const input_ndarray<T> &, const T, const T, const bool, const saca_params &); \
        template std::map<uint64_t, double> pearson_roi_coloc<T>(const input_ndarray<T> &, const input_ndarray<T> &, const roi_map &, const bool);

    FOR_EACH_PIXEL_TYPE(INSTANTIATE_COLOCALIZATION)

} // namespace micstat
