#include <gtest/gtest.h>

#include "micstat/colocalization.hh"
#include "micstat/simulation.hh"

#include <cmath>
#include <limits>
#include <string>

using namespace micstat;

static ndarray<double> blob_image(const double cy, const double cx, const double radius, const std::vector<ssize_t> &shape) {
    blob_params blobs;
    blobs.centers = { { cy, cx } };
    blobs.radii = { radius };
    blobs.intensities = { 100.0 };
    blobs.falloffs = { 1.0 };
    return gaussian_metaballs(blobs, 1.0, shape, false);
}

// A single row where b falls inside every block of three pixels, but rises from block to block.
// Small neighborhoods centred on a block are anti-correlated, larger ones are positively correlated.
static void sawtooth_row(const int64_t n, ndarray<double> &a, ndarray<double> &b) {
    a = ndarray<double>({ 1, n });
    b = ndarray<double>({ 1, n });
    for (int64_t x = 0; x < n; x++) {
        a.data[x] = (double) x;
        b.data[x] = (double) (4*(x/3) + 2 - x%3);
    }
}

static bool same_field(const ndarray<double> &x, const ndarray<double> &y) {
    if (x.shape != y.shape) return false;
    for (int64_t i = 0; i < x.size(); i++) {
        bool both_nan = std::isnan(x.data[i]) && std::isnan(y.data[i]);
        if (!both_nan && x.data[i] != y.data[i]) return false;
    }
    return true;
}

TEST(Saca, MismatchedShapes) {
    ndarray<double>
        a({ 10, 10 }, 1.0),
        b({ 10, 12 }, 1.0);
    EXPECT_THROW(saca_2d(a.input(), b.input(), 0.0, 0.0, false), mismatched_shapes);
}

TEST(Saca, WrongDimensionality) {
    ndarray<float>
        volume({ 3, 4, 5 }, 1.0f),
        image({ 4, 5 }, 1.0f);
    EXPECT_THROW(saca_2d(volume.input(), volume.input(), 0.0f, 0.0f, false), invalid_parameter);
    EXPECT_THROW(saca_3d(image.input(), image.input(), 0.0f, 0.0f, false), invalid_parameter);
}

TEST(Saca, InvalidParameters) {
    ndarray<double> a({ 8, 8 }, 1.0);
    saca_params params;

    params.step_size = 1.0;
    EXPECT_THROW(saca_2d(a.input(), a.input(), 0.0, 0.0, false, params), invalid_parameter);

    params = saca_params();
    params.check_iteration = params.max_iterations;
    EXPECT_THROW(saca_2d(a.input(), a.input(), 0.0, 0.0, false, params), invalid_parameter);

    params = saca_params();
    params.initial_size = 0.0;
    EXPECT_THROW(saca_2d(a.input(), a.input(), 0.0, 0.0, false, params), invalid_parameter);

    params = saca_params();
    params.max_iterations = 0;
    EXPECT_THROW(saca_2d(a.input(), a.input(), 0.0, 0.0, false, params), invalid_parameter);

    params = saca_params();
    params.min_effective_samples = 1.0;
    EXPECT_THROW(saca_2d(a.input(), a.input(), 0.0, 0.0, false, params), invalid_parameter);

    params.min_effective_samples = std::numeric_limits<double>::quiet_NaN();
    EXPECT_THROW(saca_2d(a.input(), a.input(), 0.0, 0.0, false, params), invalid_parameter);
}

TEST(Saca, ParallelMatchesSequential) {
    std::vector<ssize_t> shape = { 32, 32 };
    ndarray<double>
        a = blob_image(14, 14, 5, shape),
        b = blob_image(18, 18, 5, shape);

    ndarray<double>
        sequential = saca_2d(a.input(), b.input(), 2.0, 2.0, false),
        parallel = saca_2d(a.input(), b.input(), 2.0, 2.0, true);

    ASSERT_EQ(sequential.shape, shape);
    EXPECT_TRUE(same_field(sequential, parallel));
}

TEST(Saca, IdenticalBlobsColocalize) {
    std::vector<ssize_t> shape = { 32, 32 };
    ndarray<double> a = blob_image(16, 16, 4, shape);

    ndarray<double> z = saca_2d(a.input(), a.input(), 2.0, 2.0, true);

    EXPECT_GT(z.data[16*32 + 16], 3.0);
    EXPECT_GT(z.data[15*32 + 17], 3.0);
    // Far from the blob both channels are below their thresholds.
    EXPECT_EQ(z.data[0], 0.0);
}

TEST(Saca, DisjointBlobsDoNotColocalize) {
    std::vector<ssize_t> shape = { 32, 32 };
    ndarray<double>
        a = blob_image(8, 8, 3, shape),
        b = blob_image(24, 24, 3, shape);

    ndarray<double> z = saca_2d(a.input(), b.input(), 2.0, 2.0, false);

    EXPECT_LT(std::fabs(z.data[8*32 + 8]), 1.0);
    EXPECT_LT(std::fabs(z.data[24*32 + 24]), 1.0);
}

TEST(Saca, AntiCorrelatedImages) {
    const int64_t n = 32;
    ndarray<double> a({ n, n }), b({ n, n });
    for (int64_t i = 0; i < n*n; i++) {
        a.data[i] = (double) i;
        b.data[i] = 5000.0 - (double) i;
    }

    ndarray<double> z = saca_2d(a.input(), b.input(), 0.0, 0.0, true);

    EXPECT_LT(z.data[16*n + 16], -3.0);
}

TEST(Saca, ConstantImagesAreUndefined) {
    ndarray<uint16_t> a({ 6, 6 }, 5);

    saca_params params;
    params.max_iterations = 4;
    params.check_iteration = 2;
    ndarray<double> z = saca_2d(a.input(), a.input(), (uint16_t) 1, (uint16_t) 1, false, params);

    for (int64_t i = 0; i < z.size(); i++) {
        EXPECT_TRUE(std::isnan(z.data[i])) << "pixel " << i;
    }

    ndarray<bool> mask = saca_significance_mask(z.input(), false);
    for (int64_t i = 0; i < mask.size(); i++) {
        EXPECT_FALSE(mask[i]);
    }
}

TEST(Saca, Volumes) {
    const int64_t n = 6;
    ndarray<uint8_t> a({ n, n, n });
    for (int64_t i = 0; i < n*n*n; i++) {
        a.data[i] = (uint8_t) i;
    }

    saca_params params;
    params.max_iterations = 6;
    params.check_iteration = 3;
    params.falloff = kernel_falloff::gaussian;

    ndarray<double>
        sequential = saca_3d(a.input(), a.input(), (uint8_t) 0, (uint8_t) 0, false, params),
        parallel = saca_3d(a.input(), a.input(), (uint8_t) 0, (uint8_t) 0, true, params);

    ASSERT_EQ(sequential.shape, std::vector<ssize_t>({ n, n, n }));
    EXPECT_TRUE(same_field(sequential, parallel));
    EXPECT_GT(sequential.data[3*n*n + 3*n + 3], 0.0);
}

TEST(Saca, VerboseLogging) {
    const int64_t n = 8;
    ndarray<double> a({ n, n });
    for (int64_t i = 0; i < n*n; i++) {
        a.data[i] = (double) i;
    }

    saca_params params;
    params.max_iterations = 3;
    params.check_iteration = 1;
    params.verbose = 2;

    testing::internal::CaptureStdout();
    testing::internal::CaptureStderr();
    saca_2d(a.input(), a.input(), 0.0, 0.0, false, params);
    std::string
        out = testing::internal::GetCapturedStdout(),
        err = testing::internal::GetCapturedStderr();

    EXPECT_NE(out.find("SACA iteration 1/3"), std::string::npos);
    EXPECT_NE(out.find("SACA iteration 3/3"), std::string::npos);
    EXPECT_NE(out.find("active pixels: "), std::string::npos);
    EXPECT_NE(out.find("offsets: "), std::string::npos);
    EXPECT_NE(err.find("lambda ="), std::string::npos);

    // An explicit bandwidth is not reported, and level 1 leaves out the per-iteration details.
    params.verbose = 1;
    params.lambda = 2.5;
    testing::internal::CaptureStdout();
    testing::internal::CaptureStderr();
    saca_2d(a.input(), a.input(), 0.0, 0.0, false, params);
    out = testing::internal::GetCapturedStdout();
    err = testing::internal::GetCapturedStderr();

    EXPECT_NE(out.find("SACA iteration 3/3"), std::string::npos);
    EXPECT_EQ(out.find("active pixels"), std::string::npos);
    EXPECT_EQ(err.find("lambda ="), std::string::npos);

    params.verbose = 0;
    params.lambda = 0.0;
    testing::internal::CaptureStdout();
    testing::internal::CaptureStderr();
    saca_2d(a.input(), a.input(), 0.0, 0.0, false, params);
    out = testing::internal::GetCapturedStdout();
    err = testing::internal::GetCapturedStderr();

    EXPECT_TRUE(out.empty());
    EXPECT_TRUE(err.empty());
}

TEST(Saca, LinearFalloff) {
    const int64_t n = 32;
    ndarray<double> a({ n, n }), b({ n, n });
    for (int64_t i = 0; i < n*n; i++) {
        a.data[i] = (double) i;
        b.data[i] = 5000.0 - (double) i;
    }

    saca_params params;
    params.lambda = 3.0;
    ndarray<double> quadratic = saca_2d(a.input(), b.input(), 0.0, 0.0, false, params);

    params.falloff = kernel_falloff::linear;
    ndarray<double> linear = saca_2d(a.input(), b.input(), 0.0, 0.0, false, params);

    // Every neighborhood has tau = -1, so only the effective sample size differs between the profiles.
    EXPECT_LT(linear.data[16*n + 16], -3.0);
    EXPECT_NE(linear.data[16*n + 16], quadratic.data[16*n + 16]);
}

TEST(Saca, MinEffectiveSamples) {
    std::vector<ssize_t> shape = { 16, 16 };
    ndarray<double> a = blob_image(8, 8, 4, shape);

    saca_params params;
    params.max_iterations = 6;
    params.check_iteration = 3;
    params.min_effective_samples = 1e6;
    ndarray<double> z = saca_2d(a.input(), a.input(), 0.0, 0.0, false, params);

    for (int64_t i = 0; i < z.size(); i++) {
        EXPECT_EQ(z.data[i], 0.0) << "pixel " << i;
    }
}

TEST(Saca, SharpBoundaryFreezesPixels) {
    const int64_t n = 30, x = 13;
    ndarray<double> a, b;
    sawtooth_row(n, a, b);

    saca_params params;
    params.initial_size = 1.0;
    params.step_size = 2.0;
    params.max_iterations = 5;
    params.lambda = 1.0;

    // The first iteration alone: pixel x sees only its own block, where b falls.
    params.max_iterations = 1;
    params.check_iteration = 0;
    ndarray<double> first = saca_2d(a.input(), b.input(), 0.0, 0.0, false, params);
    ASSERT_LT(first.data[x], -1.0);

    // Anchored at the first iteration, the estimate of pixel x jumps away from the anchor and the pixel keeps its first score.
    params.max_iterations = 5;
    params.check_iteration = 0;
    ndarray<double> frozen = saca_2d(a.input(), b.input(), 0.0, 0.0, false, params);
    EXPECT_EQ(frozen.data[x], first.data[x]);

    // Anchored at the last iteration, nothing is tested and every pixel keeps adapting.
    params.check_iteration = params.max_iterations - 1;
    ndarray<double> adapted = saca_2d(a.input(), b.input(), 0.0, 0.0, false, params);
    EXPECT_NE(adapted.data[x], first.data[x]);
    EXPECT_FALSE(same_field(frozen, adapted));
}

TEST(Saca, ExplicitLambda) {
    const int64_t n = 30, x = 13;
    ndarray<double> a, b;
    sawtooth_row(n, a, b);

    saca_params params;
    params.step_size = 2.0;
    params.max_iterations = 5;
    params.check_iteration = 0;

    params.lambda = 1.0;
    ndarray<double> narrow = saca_2d(a.input(), b.input(), 0.0, 0.0, false, params);

    // A wide bandwidth neither separates nor freezes any pixel.
    params.lambda = 100.0;
    ndarray<double> wide = saca_2d(a.input(), b.input(), 0.0, 0.0, false, params);

    EXPECT_NE(narrow.data[x], wide.data[x]);
    EXPECT_FALSE(same_field(narrow, wide));
}

TEST(SignificanceMask, SingleExtremeCell) {
    ndarray<double> z({ 10, 10 }, 0.0);
    z.data[42] = 10.0;
    z.data[7] = std::numeric_limits<double>::quiet_NaN();

    ndarray<bool>
        sequential = saca_significance_mask(z.input(), 0.05, false),
        parallel = saca_significance_mask(z.input(), true);

    ASSERT_EQ(sequential.shape, z.shape);
    for (int64_t i = 0; i < sequential.size(); i++) {
        EXPECT_EQ(sequential[i], i == 42) << "pixel " << i;
        EXPECT_EQ(parallel[i], i == 42) << "pixel " << i;
    }
}

TEST(SignificanceMask, CriticalValue) {
    // A single test at alpha = 0.05 is two-sided with a critical value of 1.96.
    ndarray<double> above({ 1 }, 2.0), below({ 1 }, -1.9), negative({ 1 }, -2.0);
    EXPECT_TRUE(saca_significance_mask(above.input(), 0.05, false)[0]);
    EXPECT_FALSE(saca_significance_mask(below.input(), 0.05, false)[0]);
    EXPECT_TRUE(saca_significance_mask(negative.input(), 0.05, false)[0]);
}

TEST(SignificanceMask, InvalidAlpha) {
    ndarray<double> z({ 4 }, 0.0);
    EXPECT_THROW(saca_significance_mask(z.input(), 0.0, false), invalid_parameter);
    EXPECT_THROW(saca_significance_mask(z.input(), 1.0, false), invalid_parameter);
}

TEST(PearsonRoiColoc, PerRegionCorrelation) {
    ndarray<int64_t> a({ 4, 4 }), b({ 4, 4 });
    for (int64_t i = 0; i < 16; i++) {
        a.data[i] = i;
        b.data[i] = i < 8 ? 2*i : 15 - i;
    }

    roi_map rois;
    rois[1] = { { 0, 0, 0 }, { 0, 0, 1 }, { 0, 0, 2 }, { 0, 0, 3 } };
    rois[7] = { { 0, 3, 0 }, { 0, 3, 1 }, { 0, 3, 2 }, { 0, 3, 3 } };

    std::map<uint64_t, double>
        sequential = pearson_roi_coloc(a.input(), b.input(), rois, false),
        parallel = pearson_roi_coloc(a.input(), b.input(), rois, true);

    ASSERT_EQ(sequential.size(), 2u);
    EXPECT_NEAR(sequential[1], 1.0, 1e-12);
    EXPECT_NEAR(sequential[7], -1.0, 1e-12);
    EXPECT_EQ(sequential, parallel);
}

TEST(PearsonRoiColoc, InvalidRegions) {
    ndarray<float> a({ 4, 4 }, 1.0f);

    roi_map outside;
    outside[1] = { { 0, 0, 0 }, { 0, 4, 0 } };
    EXPECT_THROW(pearson_roi_coloc(a.input(), a.input(), outside, false), invalid_parameter);

    roi_map single;
    single[1] = { { 0, 1, 1 } };
    EXPECT_THROW(pearson_roi_coloc(a.input(), a.input(), single, false), invalid_parameter);

    ndarray<float> b({ 4, 5 }, 1.0f);
    roi_map fine;
    fine[1] = { { 0, 0, 0 }, { 0, 1, 1 } };
    EXPECT_THROW(pearson_roi_coloc(a.input(), b.input(), fine, false), mismatched_shapes);
}
