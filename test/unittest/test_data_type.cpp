/**
 * @file test_data_type.cpp
 * @brief Unit tests for CDataType enumerations and outcomes
 * @date 2025-10-27
 */

#include <gtest/gtest.h>
#include <string>
#include "CDataType.hpp"

using namespace lap::geo;
using namespace lap::core;

class DataTypeTest : public ::testing::Test {
};

TEST_F(DataTypeTest, AnalysisMode_ToString) {
    EXPECT_STREQ(ToString(AnalysisMode::kBasic), "basic");
    EXPECT_STREQ(ToString(AnalysisMode::kFunction), "function");
    EXPECT_STREQ(ToString(AnalysisMode::kGrounding), "grounding");
    EXPECT_STREQ(ToString(AnalysisMode::kImageSearch), "image-search");
}

TEST_F(DataTypeTest, AnalysisMode_FromString) {
    for (auto mode : { AnalysisMode::kBasic, AnalysisMode::kFunction,
                       AnalysisMode::kGrounding, AnalysisMode::kImageSearch }) {
        auto parsed = AnalysisModeFromString(ToString(mode));
        ASSERT_TRUE(parsed.HasValue());
        EXPECT_EQ(parsed.Value(), mode);
    }
}

TEST_F(DataTypeTest, AnalysisMode_FromString_Invalid) {
    auto parsed = AnalysisModeFromString("image_search");
    ASSERT_FALSE(parsed.HasValue());
    EXPECT_TRUE(IsGeoError(parsed.Error(), GeoErrc::kInvalidRecord));

    EXPECT_FALSE(AnalysisModeFromString("").HasValue());
    EXPECT_FALSE(AnalysisModeFromString("BASIC").HasValue());
}

TEST_F(DataTypeTest, RecordSource_Conversions) {
    EXPECT_STREQ(ToString(RecordSource::kCamera), "camera");
    EXPECT_STREQ(ToString(RecordSource::kUpload), "upload");

    auto camera = RecordSourceFromString("camera");
    ASSERT_TRUE(camera.HasValue());
    EXPECT_EQ(camera.Value(), RecordSource::kCamera);

    auto upload = RecordSourceFromString("upload");
    ASSERT_TRUE(upload.HasValue());
    EXPECT_EQ(upload.Value(), RecordSource::kUpload);

    auto invalid = RecordSourceFromString("gallery");
    ASSERT_FALSE(invalid.HasValue());
    EXPECT_TRUE(IsGeoError(invalid.Error(), GeoErrc::kInvalidRecord));
}

TEST_F(DataTypeTest, LimitFromString) {
    auto fifty = LimitFromString("50");
    ASSERT_TRUE(fifty.HasValue());
    EXPECT_EQ(fifty.Value(), 50u);

    auto zero = LimitFromString("0");
    ASSERT_TRUE(zero.HasValue());
    EXPECT_EQ(zero.Value(), 0u);

    auto largest = LimitFromString("4294967295");
    ASSERT_TRUE(largest.HasValue());
    EXPECT_EQ(largest.Value(), 4294967295u);

    for (const char* bad : { "4294967296", "99999999999999999999999", "-1", "+5", "", "10x", " 7" }) {
        auto parsed = LimitFromString(bad);
        ASSERT_FALSE(parsed.HasValue()) << bad;
        EXPECT_TRUE(IsGeoError(parsed.Error(), GeoErrc::kInvalidArgument)) << bad;
    }
}

TEST_F(DataTypeTest, SessionAndStrategy_ToString) {
    EXPECT_STREQ(ToString(SessionState::kReady), "Ready");
    EXPECT_STREQ(ToString(SessionState::kFailed), "Failed");
    EXPECT_STREQ(ToString(StrategyType::kDurableFile), "durable-file");
    EXPECT_STREQ(ToString(StrategyType::kVolatileBackup), "volatile-backup");
}

TEST_F(DataTypeTest, MutationOutcome_DefaultIsDurable) {
    MutationOutcome outcome;
    EXPECT_EQ(outcome.affectedRows, 0);
    EXPECT_TRUE(outcome.IsDurable());

    outcome.status = DurabilityStatus::kBackupFailed;
    EXPECT_FALSE(outcome.IsDurable());
}

TEST_F(DataTypeTest, StoreConfig_Defaults) {
    StoreConfig config;
    EXPECT_EQ(config.storageRoot, LAP_GEO_DEFAULT_STORAGE_ROOT);
    EXPECT_EQ(config.databaseFile, LAP_GEO_DEFAULT_DATABASE_FILE);
    EXPECT_TRUE(config.durableAreaEnabled);
    EXPECT_TRUE(config.backupRoot.empty());
    EXPECT_TRUE(config.enforceBounds);
    EXPECT_EQ(config.recentWindowDays, 7U);
}
