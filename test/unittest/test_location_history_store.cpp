/**
 * @file test_location_history_store.cpp
 * @brief Unit tests for the location history store session
 * @date 2025-10-27
 */

#include <gtest/gtest.h>
#include "CLocationHistoryStore.hpp"
#include "CStoragePathManager.hpp"
#include "TestDoubles.hpp"
#include <lap/core/CFile.hpp>
#include <thread>
#include <vector>

using namespace lap::geo;
using namespace lap::core;
using namespace geotest;

namespace
{
    const char* kStoreRoot = "/tmp/test_geo_history_store";
}

class LocationHistoryStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        removeTree(kStoreRoot);
        config_ = StoreConfig();
        config_.storageRoot = kStoreRoot;
        config_.backupTimeoutMs = 1000;
    }

    void TearDown() override {
        removeTree(kStoreRoot);
    }

    StoreConfig config_;
};

// ============================================================================
// Initialization
// ============================================================================

TEST_F(LocationHistoryStoreTest, InitializeSelectsDurableStrategy) {
    LocationHistoryStore store(config_);
    EXPECT_EQ(store.GetState(), SessionState::kUninitialized);

    ASSERT_TRUE(store.Initialize().HasValue());
    EXPECT_EQ(store.GetState(), SessionState::kReady);
    EXPECT_EQ(store.GetActiveStrategy(), StrategyType::kDurableFile);
    EXPECT_EQ(store.GetEngineInstantiationCount(), 1u);
    EXPECT_TRUE(File::Util::exists(CStoragePathManager::getDatabasePath(config_)));

    // a second call is a no-op
    ASSERT_TRUE(store.Initialize().HasValue());
    EXPECT_EQ(store.GetEngineInstantiationCount(), 1u);
}

TEST_F(LocationHistoryStoreTest, OperationsInitializeOnDemand) {
    LocationHistoryStore store(config_);

    auto summaries = store.List();
    ASSERT_TRUE(summaries.HasValue());
    EXPECT_TRUE(summaries.Value().empty());
    EXPECT_EQ(store.GetState(), SessionState::kReady);
}

TEST_F(LocationHistoryStoreTest, ConcurrentInitializeSharesOneBootstrap) {
    auto detector = std::make_shared<SlowDetector>(config_);
    LocationHistoryStore store(config_, detector, nullptr);

    std::atomic<int> succeeded{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&store, &succeeded]() {
            if (store.Initialize().HasValue()) ++succeeded;
        });
    }
    for (auto& thread : threads) thread.join();

    EXPECT_EQ(succeeded.load(), 8);
    EXPECT_EQ(store.GetEngineInstantiationCount(), 1u);
    EXPECT_EQ(store.GetState(), SessionState::kReady);
}

TEST_F(LocationHistoryStoreTest, CloseAllowsReinitialize) {
    LocationHistoryStore store(config_);
    ASSERT_TRUE(store.Save(makeRecord("keep", 100, "kept across sessions")).HasValue());

    store.Close();
    EXPECT_EQ(store.GetState(), SessionState::kClosed);
    EXPECT_EQ(store.GetActiveStrategy(), StrategyType::kNone);

    auto record = store.GetById("keep");
    ASSERT_TRUE(record.HasValue());
    ASSERT_TRUE(record.Value().has_value());
    EXPECT_EQ(record.Value()->description, "kept across sessions");
    EXPECT_EQ(store.GetState(), SessionState::kReady);
    EXPECT_EQ(store.GetEngineInstantiationCount(), 2u);
}

TEST_F(LocationHistoryStoreTest, FailedSessionRecoversAfterClose) {
    auto factory = std::make_shared<SwitchableStrategyFactory>();
    auto area = std::make_shared<MemoryBackupArea>();
    LocationHistoryStore store(config_, nullptr, area, factory);

    auto first = store.Initialize();
    ASSERT_FALSE(first.HasValue());
    EXPECT_TRUE(IsGeoError(first.Error(), GeoErrc::kInitializationFailed));
    EXPECT_EQ(store.GetState(), SessionState::kFailed);
    EXPECT_EQ(store.GetActiveStrategy(), StrategyType::kNone);
    EXPECT_EQ(store.GetEngineInstantiationCount(), 2u);     // durable, then volatile

    // stays failed without another bootstrap attempt
    factory->broken = false;
    auto again = store.Initialize();
    ASSERT_FALSE(again.HasValue());
    EXPECT_TRUE(IsGeoError(again.Error(), GeoErrc::kInitializationFailed));

    auto saved = store.Save(makeRecord("a", 1, "x"));
    ASSERT_FALSE(saved.HasValue());
    EXPECT_TRUE(IsGeoError(saved.Error(), GeoErrc::kInitializationFailed));
    EXPECT_EQ(store.GetEngineInstantiationCount(), 2u);
    EXPECT_EQ(factory->created.load(), 2);

    store.Close();
    EXPECT_EQ(store.GetState(), SessionState::kClosed);

    ASSERT_TRUE(store.Initialize().HasValue());
    EXPECT_EQ(store.GetState(), SessionState::kReady);
    EXPECT_EQ(store.GetActiveStrategy(), StrategyType::kDurableFile);
    EXPECT_EQ(store.GetEngineInstantiationCount(), 3u);
    EXPECT_TRUE(store.Save(makeRecord("a", 1, "x")).HasValue());
}

TEST_F(LocationHistoryStoreTest, DurableRecordsSurviveNewSession) {
    {
        LocationHistoryStore store(config_);
        ASSERT_TRUE(store.Save(makeRecord("a", 1000, "first")).HasValue());
        ASSERT_TRUE(store.Save(makeRecord("b", 2000, "second")).HasValue());
    }

    LocationHistoryStore reopened(config_);
    auto summaries = reopened.List();
    ASSERT_TRUE(summaries.HasValue());
    ASSERT_EQ(summaries.Value().size(), 2u);
    EXPECT_EQ(summaries.Value()[0].id, "b");
    EXPECT_EQ(summaries.Value()[1].id, "a");
}

// ============================================================================
// Save / Get
// ============================================================================

TEST_F(LocationHistoryStoreTest, SaveAndGetRoundTrip) {
    LocationHistoryStore store(config_);

    LocationRecord record = makeRecord("full", 1700000000123LL, "Tokyo Station, Japan");
    record.imageData = "data:image/jpeg;base64,/9j/4AAQSkZJRg==";
    record.analysisMode = AnalysisMode::kGrounding;
    record.confidenceScore = 0.87;
    record.source = RecordSource::kUpload;
    record.weatherData = { {"temperature", 21.5}, {"condition", "clear"} };
    record.nearbyPlaces = nlohmann::json::array({ { {"name", "Marunouchi"}, {"distance", 120} } });

    auto saved = store.Save(record);
    ASSERT_TRUE(saved.HasValue());
    EXPECT_TRUE(saved.Value().IsDurable());
    EXPECT_EQ(saved.Value().affectedRows, 1);

    auto loaded = store.GetById("full");
    ASSERT_TRUE(loaded.HasValue());
    ASSERT_TRUE(loaded.Value().has_value());
    EXPECT_EQ(*loaded.Value(), record);
}

TEST_F(LocationHistoryStoreTest, GetUnknownIdReturnsEmpty) {
    LocationHistoryStore store(config_);
    auto loaded = store.GetById("missing");
    ASSERT_TRUE(loaded.HasValue());
    EXPECT_FALSE(loaded.Value().has_value());
}

TEST_F(LocationHistoryStoreTest, AdversarialDescriptionsStoredVerbatim) {
    LocationHistoryStore store(config_);

    const std::vector<String> descriptions = {
        "O'Brien's \"corner\" cafe",
        "back\\slash \\' \\\" end\\",
        "'); DROP TABLE location_history; --",
        "{\"id\":\"x\",\"nested\":[1,2,{\"a\":null}]}",
        "100% off_sale",
        "\xE6\x9D\xB1\xE4\xBA\xAC\xE9\xA7\x85 \xF0\x9F\x97\xBC",
        "line one\nline two\ttab",
    };

    for (size_t i = 0; i < descriptions.size(); ++i) {
        auto saved = store.Save(makeRecord("fuzz" + std::to_string(i), 10 + static_cast<Int64>(i), descriptions[i]));
        ASSERT_TRUE(saved.HasValue()) << descriptions[i];
    }

    for (size_t i = 0; i < descriptions.size(); ++i) {
        auto loaded = store.GetById("fuzz" + std::to_string(i));
        ASSERT_TRUE(loaded.HasValue());
        ASSERT_TRUE(loaded.Value().has_value());
        EXPECT_EQ(loaded.Value()->description, descriptions[i]);
    }

    auto stats = store.GetStatistics();
    ASSERT_TRUE(stats.HasValue());
    EXPECT_EQ(stats.Value().totalLocations, descriptions.size());
}

TEST_F(LocationHistoryStoreTest, DuplicateIdIsRejected) {
    LocationHistoryStore store(config_);
    ASSERT_TRUE(store.Save(makeRecord("dup", 1, "first write")).HasValue());

    auto again = store.Save(makeRecord("dup", 2, "replacement"));
    ASSERT_FALSE(again.HasValue());
    EXPECT_TRUE(IsGeoError(again.Error(), GeoErrc::kDuplicateKey));

    auto loaded = store.GetById("dup");
    ASSERT_TRUE(loaded.HasValue());
    ASSERT_TRUE(loaded.Value().has_value());
    EXPECT_EQ(loaded.Value()->description, "first write");
}

TEST_F(LocationHistoryStoreTest, InvalidRecordIsRejected) {
    LocationHistoryStore store(config_);

    auto badLatitude = makeRecord("bad-lat", 1, "x");
    badLatitude.latitude = 91.0;
    auto saved = store.Save(badLatitude);
    ASSERT_FALSE(saved.HasValue());
    EXPECT_TRUE(IsGeoError(saved.Error(), GeoErrc::kInvalidRecord));

    auto emptyId = makeRecord("", 1, "x");
    saved = store.Save(emptyId);
    ASSERT_FALSE(saved.HasValue());
    EXPECT_TRUE(IsGeoError(saved.Error(), GeoErrc::kInvalidRecord));

    auto stats = store.GetStatistics();
    ASSERT_TRUE(stats.HasValue());
    EXPECT_EQ(stats.Value().totalLocations, 0u);
}

TEST_F(LocationHistoryStoreTest, ScalarPayloadsAreRejected) {
    LocationHistoryStore store(config_);

    auto numeric = makeRecord("num", 1, "x");
    numeric.weatherData = 12345678901234567890ULL;
    auto saved = store.Save(numeric);
    ASSERT_FALSE(saved.HasValue());
    EXPECT_TRUE(IsGeoError(saved.Error(), GeoErrc::kInvalidRecord));

    auto text = makeRecord("txt", 1, "x");
    text.nearbyPlaces = "1.0";
    saved = store.Save(text);
    ASSERT_FALSE(saved.HasValue());
    EXPECT_TRUE(IsGeoError(saved.Error(), GeoErrc::kInvalidRecord));

    // numeric-looking members inside structured payloads come back unchanged
    auto nested = makeRecord("nested", 1, "x");
    nested.weatherData = { {"pressure", 12345678901234567890ULL}, {"code", "1.0"} };
    nested.nearbyPlaces = nlohmann::json::array({ "1.0", 42 });
    ASSERT_TRUE(store.Save(nested).HasValue());

    auto loaded = store.GetById("nested");
    ASSERT_TRUE(loaded.HasValue());
    ASSERT_TRUE(loaded.Value().has_value());
    EXPECT_EQ(loaded.Value()->weatherData, nested.weatherData);
    EXPECT_EQ(loaded.Value()->nearbyPlaces, nested.nearbyPlaces);
}

TEST_F(LocationHistoryStoreTest, UnsafeValueIsRejected) {
    LocationHistoryStore store(config_);

    auto record = makeRecord("nul", 1, String("before\0after", 12));
    auto saved = store.Save(record);
    ASSERT_FALSE(saved.HasValue());
    EXPECT_TRUE(IsGeoError(saved.Error(), GeoErrc::kUnsafeValue));

    auto search = store.Search(String("x\0y", 3));
    ASSERT_FALSE(search.HasValue());
    EXPECT_TRUE(IsGeoError(search.Error(), GeoErrc::kUnsafeValue));
}

// ============================================================================
// List / Search
// ============================================================================

TEST_F(LocationHistoryStoreTest, ListIsNewestFirstAndLimited) {
    LocationHistoryStore store(config_);
    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(store.Save(makeRecord("r" + std::to_string(i), 1000 * (i + 1), "entry")).HasValue());
    }

    auto summaries = store.List(3);
    ASSERT_TRUE(summaries.HasValue());
    ASSERT_EQ(summaries.Value().size(), 3u);
    EXPECT_EQ(summaries.Value()[0].id, "r4");
    EXPECT_EQ(summaries.Value()[1].id, "r3");
    EXPECT_EQ(summaries.Value()[2].id, "r2");

    auto none = store.List(0);
    ASSERT_TRUE(none.HasValue());
    EXPECT_TRUE(none.Value().empty());
}

TEST_F(LocationHistoryStoreTest, SearchIsCaseInsensitiveSubstring) {
    LocationHistoryStore store(config_);
    ASSERT_TRUE(store.Save(makeRecord("tokyo", 2, "Tokyo Station, Japan")).HasValue());
    ASSERT_TRUE(store.Save(makeRecord("osaka", 1, "Osaka Castle")).HasValue());

    auto lower = store.Search("station");
    ASSERT_TRUE(lower.HasValue());
    ASSERT_EQ(lower.Value().size(), 1u);
    EXPECT_EQ(lower.Value()[0].id, "tokyo");

    auto upper = store.Search("STATION");
    ASSERT_TRUE(upper.HasValue());
    ASSERT_EQ(upper.Value().size(), 1u);

    auto nothing = store.Search("kyoto");
    ASSERT_TRUE(nothing.HasValue());
    EXPECT_TRUE(nothing.Value().empty());
}

TEST_F(LocationHistoryStoreTest, SearchFoldsNonAsciiCase) {
    LocationHistoryStore store(config_);
    ASSERT_TRUE(store.Save(makeRecord("ecole", 2, "\xC3\x89" "cole Militaire, Paris")).HasValue());
    ASSERT_TRUE(store.Save(makeRecord("moscow", 1, "\xD0\x9C\xD0\x9E\xD0\xA1\xD0\x9A\xD0\x92\xD0\x90 centre")).HasValue());

    auto lower = store.Search("\xC3\xA9" "cole");
    ASSERT_TRUE(lower.HasValue());
    ASSERT_EQ(lower.Value().size(), 1u);
    EXPECT_EQ(lower.Value()[0].id, "ecole");

    auto upper = store.Search("\xC3\x89" "COLE");
    ASSERT_TRUE(upper.HasValue());
    ASSERT_EQ(upper.Value().size(), 1u);

    auto cyrillic = store.Search("\xD0\xBC\xD0\xBE\xD1\x81\xD0\xBA\xD0\xB2\xD0\xB0");
    ASSERT_TRUE(cyrillic.HasValue());
    ASSERT_EQ(cyrillic.Value().size(), 1u);
    EXPECT_EQ(cyrillic.Value()[0].id, "moscow");
}

TEST_F(LocationHistoryStoreTest, SearchTreatsWildcardsLiterally) {
    LocationHistoryStore store(config_);
    ASSERT_TRUE(store.Save(makeRecord("pct", 2, "100% match")).HasValue());
    ASSERT_TRUE(store.Save(makeRecord("plain", 1, "1000 match")).HasValue());

    auto percent = store.Search("0%");
    ASSERT_TRUE(percent.HasValue());
    ASSERT_EQ(percent.Value().size(), 1u);
    EXPECT_EQ(percent.Value()[0].id, "pct");

    auto underscore = store.Search("_");
    ASSERT_TRUE(underscore.HasValue());
    EXPECT_TRUE(underscore.Value().empty());
}

// ============================================================================
// Delete / Clear / Statistics
// ============================================================================

TEST_F(LocationHistoryStoreTest, DeleteRemovesOneRecord) {
    LocationHistoryStore store(config_);
    ASSERT_TRUE(store.Save(makeRecord("a", 1, "first")).HasValue());
    ASSERT_TRUE(store.Save(makeRecord("b", 2, "second")).HasValue());

    auto deleted = store.Delete("a");
    ASSERT_TRUE(deleted.HasValue());
    EXPECT_EQ(deleted.Value().affectedRows, 1);

    auto summaries = store.List();
    ASSERT_TRUE(summaries.HasValue());
    ASSERT_EQ(summaries.Value().size(), 1u);
    EXPECT_EQ(summaries.Value()[0].id, "b");

    auto absent = store.Delete("a");
    ASSERT_TRUE(absent.HasValue());
    EXPECT_EQ(absent.Value().affectedRows, 0);
    EXPECT_TRUE(absent.Value().IsDurable());
}

TEST_F(LocationHistoryStoreTest, ClearAllEmptiesStore) {
    LocationHistoryStore store(config_);
    ASSERT_TRUE(store.Save(makeRecord("a", 1, "first")).HasValue());
    ASSERT_TRUE(store.Save(makeRecord("b", 2, "second")).HasValue());

    auto cleared = store.ClearAll();
    ASSERT_TRUE(cleared.HasValue());
    EXPECT_EQ(cleared.Value().affectedRows, 2);

    auto summaries = store.List();
    ASSERT_TRUE(summaries.HasValue());
    EXPECT_TRUE(summaries.Value().empty());

    auto stats = store.GetStatistics();
    ASSERT_TRUE(stats.HasValue());
    EXPECT_EQ(stats.Value().totalLocations, 0u);
    EXPECT_EQ(stats.Value().recentLocations, 0u);
}

TEST_F(LocationHistoryStoreTest, StatisticsCountSourcesAndRecentWindow) {
    LocationHistoryStore store(config_);
    const Int64 now = nowMs();
    const Int64 day = 86400000LL;

    auto uploaded = makeRecord("up", now - day, "uploaded");
    uploaded.source = RecordSource::kUpload;
    ASSERT_TRUE(store.Save(uploaded).HasValue());
    ASSERT_TRUE(store.Save(makeRecord("cam1", now - 2 * day, "camera")).HasValue());
    ASSERT_TRUE(store.Save(makeRecord("old", now - 30 * day, "old camera")).HasValue());

    auto stats = store.GetStatistics();
    ASSERT_TRUE(stats.HasValue());
    EXPECT_EQ(stats.Value().totalLocations, 3u);
    EXPECT_EQ(stats.Value().cameraLocations, 2u);
    EXPECT_EQ(stats.Value().uploadedLocations, 1u);
    EXPECT_EQ(stats.Value().recentLocations, 2u);
}

TEST_F(LocationHistoryStoreTest, ExportAllIsNewestFirst) {
    LocationHistoryStore store(config_);
    ASSERT_TRUE(store.Save(makeRecord("a", 1, "first")).HasValue());
    ASSERT_TRUE(store.Save(makeRecord("c", 3, "third")).HasValue());
    ASSERT_TRUE(store.Save(makeRecord("b", 2, "second")).HasValue());

    auto records = store.ExportAll();
    ASSERT_TRUE(records.HasValue());
    ASSERT_EQ(records.Value().size(), 3u);
    EXPECT_EQ(records.Value()[0].id, "c");
    EXPECT_EQ(records.Value()[1].id, "b");
    EXPECT_EQ(records.Value()[2].id, "a");
}

// ============================================================================
// Volatile fallback
// ============================================================================

TEST_F(LocationHistoryStoreTest, FallsBackWhenDurableAreaMissing) {
    auto detector = std::make_shared<UnavailableDetector>(config_);
    auto area = std::make_shared<MemoryBackupArea>();
    LocationHistoryStore store(config_, detector, area);

    ASSERT_TRUE(store.Initialize().HasValue());
    EXPECT_EQ(store.GetActiveStrategy(), StrategyType::kVolatileBackup);
    EXPECT_EQ(detector->probes.load(), 1);
    EXPECT_FALSE(File::Util::exists(CStoragePathManager::getDatabasePath(config_)));

    auto saved = store.Save(makeRecord("v1", 5, "volatile"));
    ASSERT_TRUE(saved.HasValue());
    EXPECT_TRUE(saved.Value().IsDurable());
    EXPECT_TRUE(area->Has(config_.backupCollection, config_.backupKey));
}

TEST_F(LocationHistoryStoreTest, VolatileRecordsReplayedInNewSession) {
    auto area = std::make_shared<MemoryBackupArea>();

    LocationRecord record = makeRecord("v1", 5, "Tokyo Station, Japan");
    record.confidenceScore = 0.5;
    record.weatherData = { {"condition", "rain"} };

    {
        LocationHistoryStore store(config_, std::make_shared<UnavailableDetector>(config_), area);
        ASSERT_TRUE(store.Save(record).HasValue());
        ASSERT_TRUE(store.Save(makeRecord("v2", 6, "second")).HasValue());
        ASSERT_TRUE(store.Delete("v2").HasValue());
    }

    LocationHistoryStore reopened(config_, std::make_shared<UnavailableDetector>(config_), area);
    auto records = reopened.ExportAll();
    ASSERT_TRUE(records.HasValue());
    ASSERT_EQ(records.Value().size(), 1u);
    EXPECT_EQ(records.Value()[0], record);

    auto found = reopened.Search("station");
    ASSERT_TRUE(found.HasValue());
    EXPECT_EQ(found.Value().size(), 1u);
}

TEST_F(LocationHistoryStoreTest, VolatileBackupFailureIsSoft) {
    auto area = std::make_shared<FailingBackupArea>();
    LocationHistoryStore store(config_, std::make_shared<UnavailableDetector>(config_), area);

    auto saved = store.Save(makeRecord("soft", 1, "kept in memory"));
    ASSERT_TRUE(saved.HasValue());
    EXPECT_EQ(saved.Value().status, DurabilityStatus::kBackupFailed);
    EXPECT_EQ(store.GetDurabilityFailureCount(), 1u);

    auto loaded = store.GetById("soft");
    ASSERT_TRUE(loaded.HasValue());
    EXPECT_TRUE(loaded.Value().has_value());
}

TEST_F(LocationHistoryStoreTest, FallsBackWhenDatabaseUnusable) {
    // a directory where the database file belongs makes the durable open fail
    ASSERT_TRUE(Path::createDirectory(CStoragePathManager::getDatabasePath(config_)));

    auto area = std::make_shared<MemoryBackupArea>();
    LocationHistoryStore store(config_, nullptr, area);

    ASSERT_TRUE(store.Initialize().HasValue());
    EXPECT_EQ(store.GetActiveStrategy(), StrategyType::kVolatileBackup);
    EXPECT_EQ(store.GetEngineInstantiationCount(), 2u);
}
