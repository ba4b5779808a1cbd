#include <gtest/gtest.h>

#include "micstat/simulation.hh"

#include <algorithm>
#include <cmath>

using namespace micstat;

static blob_params single_blob(const std::vector<double> &center, const double radius, const double intensity, const double falloff) {
    blob_params blobs;
    blobs.centers = { center };
    blobs.radii = { radius };
    blobs.intensities = { intensity };
    blobs.falloffs = { falloff };
    return blobs;
}

TEST(GaussianMetaballs, SingleBlob) {
    ndarray<double> image = gaussian_metaballs(single_blob({ 5, 5 }, 2.0, 10.0, 1.0), 1.0, { 11, 11 }, false);

    ASSERT_EQ(image.shape, std::vector<ssize_t>({ 11, 11 }));
    EXPECT_DOUBLE_EQ(image.data[5*11 + 5], 11.0);
    EXPECT_NEAR(image.data[5*11 + 7], 1.0 + 10.0 * std::exp(-1.0), 1e-12);
    EXPECT_EQ(std::max_element(image.data.begin(), image.data.end()) - image.data.begin(), 5*11 + 5);
    EXPECT_NEAR(image.data[0], 1.0, 1e-3);
}

TEST(GaussianMetaballs, OverlappingBlobsAdd) {
    blob_params blobs;
    blobs.centers = { { 2, 2 }, { 2, 2 } };
    blobs.radii = { 1.0, 1.0 };
    blobs.intensities = { 3.0, 4.0 };
    blobs.falloffs = { 1.0, 1.0 };

    ndarray<double> image = gaussian_metaballs(blobs, 0.0, { 5, 5 }, true);
    EXPECT_DOUBLE_EQ(image.data[2*5 + 2], 7.0);
}

TEST(LogisticMetaballs, FlatTopAndBackground) {
    ndarray<double> image = logistic_metaballs(single_blob({ 5, 5 }, 2.0, 10.0, 0.5), 1.0, { 11, 11 }, false);

    EXPECT_NEAR(image.data[5*11 + 5], 10.0 / (1.0 + std::exp(-4.0)), 1e-12);
    EXPECT_DOUBLE_EQ(image.data[0], 1.0);
}

TEST(Metaballs, VolumesAndParallelism) {
    blob_params blobs = single_blob({ 3, 4, 5 }, 2.0, 50.0, 1.0);
    std::vector<ssize_t> shape = { 7, 8, 9 };

    ndarray<double>
        sequential = gaussian_metaballs(blobs, 2.0, shape, false),
        parallel = gaussian_metaballs(blobs, 2.0, shape, true);

    ASSERT_EQ(sequential.size(), 7*8*9);
    EXPECT_EQ(sequential.data, parallel.data);
    EXPECT_DOUBLE_EQ(sequential.data[3*8*9 + 4*9 + 5], 52.0);

    EXPECT_EQ(logistic_metaballs(blobs, 2.0, shape, false).data, logistic_metaballs(blobs, 2.0, shape, true).data);
}

TEST(Metaballs, MismatchedParameters) {
    blob_params blobs = single_blob({ 5, 5 }, 2.0, 10.0, 1.0);
    blobs.radii.push_back(3.0);
    EXPECT_THROW(gaussian_metaballs(blobs, 0.0, { 11, 11 }, false), mismatched_lengths);

    blob_params wrong_dims = single_blob({ 5, 5, 5 }, 2.0, 10.0, 1.0);
    EXPECT_THROW(logistic_metaballs(wrong_dims, 0.0, { 11, 11 }, false), mismatched_lengths);
}
