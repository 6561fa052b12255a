/**
 * @file test_capability_detector.cpp
 * @brief Unit tests for durable storage area detection
 * @date 2025-10-27
 */

#include <gtest/gtest.h>
#include <sys/stat.h>
#include "CCapabilityDetector.hpp"
#include "TestDoubles.hpp"
#include <lap/core/CPath.hpp>

using namespace lap::geo;
using namespace lap::core;
using namespace geotest;

class CapabilityDetectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        removeTree("/tmp/test_geo_detector");
    }

    void TearDown() override {
        SetUp();
    }
};

TEST_F(CapabilityDetectorTest, ExistingWritableRoot) {
    ASSERT_TRUE(Path::createDirectory(String("/tmp/test_geo_detector")));

    StoreConfig config;
    config.storageRoot = "/tmp/test_geo_detector";
    CapabilityDetector detector(config);

    EXPECT_TRUE(detector.IsDurableAreaAvailable());
}

TEST_F(CapabilityDetectorTest, MissingRootUsesNearestAncestor) {
    StoreConfig config;
    config.storageRoot = "/tmp/test_geo_detector/not/yet/created";
    CapabilityDetector detector(config);

    EXPECT_TRUE(detector.IsDurableAreaAvailable());
    // the probe never creates anything
    EXPECT_FALSE(Path::isDirectory("/tmp/test_geo_detector"));
}

TEST_F(CapabilityDetectorTest, DisabledByConfiguration) {
    StoreConfig config;
    config.storageRoot = "/tmp";
    config.durableAreaEnabled = false;
    CapabilityDetector detector(config);

    EXPECT_FALSE(detector.IsDurableAreaAvailable());
}

TEST_F(CapabilityDetectorTest, ResultIsCachedUntilReset) {
    StoreConfig config;
    UnavailableDetector detector(config);

    EXPECT_FALSE(detector.IsDurableAreaAvailable());
    EXPECT_FALSE(detector.IsDurableAreaAvailable());
    EXPECT_EQ(detector.probes.load(), 1);

    detector.Reset();
    EXPECT_FALSE(detector.IsDurableAreaAvailable());
    EXPECT_EQ(detector.probes.load(), 2);
}
