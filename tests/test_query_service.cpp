#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "QueryService.hpp"
#include "ErrorHandler.hpp"
#include "mocks/FakeSchemaProber.hpp"
#include <filesystem>
#include <fstream>

using namespace querymind;
using namespace querymind::fakes;
using ::testing::HasSubstr;
using ::testing::Not;

class QueryServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir_ = std::filesystem::temp_directory_path() /
                   (std::string("querymind_service_") +
                    ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::remove_all(tempDir_);
        std::filesystem::create_directories(tempDir_);

        session_.connection.database = "shop";
        session_.cacheFile = tempDir_ / "metadata.json";

        executor_.canned.columns = {"count"};
        SampleRow row = SampleRow::object();
        row["count"] = 1500;
        executor_.canned.rows = {row};
        executor_.canned.rowCount = 1;
    }

    void TearDown() override {
        std::filesystem::remove_all(tempDir_);
    }

    std::filesystem::path tempDir_;
    Session session_;
    FakeCatalog catalog_ = shopCatalog();
    FakeSqlGenerator generator_;
    FakeQueryExecutor executor_;
};

TEST_F(QueryServiceTest, AskRunsCleanedSql) {
    FakeProberFactory factory(catalog_);
    CacheManager cache(session_.cacheFile);
    QueryService service(session_, factory, cache, generator_, executor_);

    generator_.reply = "```sql\nSELECT COUNT(*) FROM users;\n```";
    auto result = service.ask("How many users are there?");

    EXPECT_EQ(generator_.lastQuestion, "How many users are there?");
    EXPECT_THAT(generator_.lastSchema, HasSubstr("TABLE: users"));
    ASSERT_EQ(executor_.executed.size(), 1u);
    EXPECT_EQ(executor_.executed[0], "SELECT COUNT(*) FROM users");
    EXPECT_EQ(executor_.lastConnection.database, "shop");
    EXPECT_EQ(result.sql, "SELECT COUNT(*) FROM users");
    EXPECT_EQ(result.rowCount, 1u);
    EXPECT_EQ(result.rows[0]["count"], 1500);
}

TEST_F(QueryServiceTest, SchemaTextOmitsSamplesAndStatistics) {
    FakeProberFactory factory(catalog_);
    CacheManager cache(session_.cacheFile);
    QueryService service(session_, factory, cache, generator_, executor_);

    auto text = service.schemaText();

    EXPECT_THAT(text, HasSubstr("DATABASE: shop"));
    EXPECT_THAT(text, Not(HasSubstr("SAMPLE DATA")));
    EXPECT_THAT(text, Not(HasSubstr("[Nulls:")));
}

TEST_F(QueryServiceTest, SchemaTextUsesCache) {
    FakeProberFactory factory(catalog_);
    CacheManager cache(session_.cacheFile);
    QueryService service(session_, factory, cache, generator_, executor_);

    auto first = service.schemaText();
    auto second = service.schemaText();

    EXPECT_EQ(factory.opens, 1);
    EXPECT_EQ(first, second);
}

TEST_F(QueryServiceTest, DisabledCacheIsNeverTouched) {
    FakeProberFactory factory(catalog_);
    CacheManager cache(session_.cacheFile);
    QueryService service(session_, factory, cache, generator_, executor_, false);

    service.schemaText();
    service.metadata(ExtractOptions{});
    service.refresh();

    EXPECT_EQ(factory.opens, 3);
    EXPECT_FALSE(std::filesystem::exists(session_.cacheFile));
}

TEST_F(QueryServiceTest, UnsafeSqlIsNotExecuted) {
    FakeProberFactory factory(catalog_);
    CacheManager cache(session_.cacheFile);
    QueryService service(session_, factory, cache, generator_, executor_);

    generator_.reply = "DELETE FROM users";
    EXPECT_THROW(service.ask("Remove every user"), UnsafeQueryError);

    generator_.reply = "SELECT 1; DROP TABLE users";
    EXPECT_THROW(service.ask("Anything"), UnsafeQueryError);

    EXPECT_TRUE(executor_.executed.empty());
}

TEST_F(QueryServiceTest, EmptyQuestionRejected) {
    FakeProberFactory factory(catalog_);
    CacheManager cache(session_.cacheFile);
    QueryService service(session_, factory, cache, generator_, executor_);

    EXPECT_THROW(service.ask(""), GenerationError);
    EXPECT_EQ(generator_.calls, 0);
    EXPECT_EQ(factory.opens, 0);
}

TEST_F(QueryServiceTest, UnreachableDatabaseSurfacesAsConnectionError) {
    FakeProberFactory factory(catalog_);
    factory.unreachable = true;
    CacheManager cache(session_.cacheFile);
    QueryService service(session_, factory, cache, generator_, executor_);

    try {
        service.ask("How many users?");
        FAIL() << "expected ConnectionError";
    } catch (const ConnectionError& e) {
        EXPECT_THAT(e.what(), HasSubstr("Connection refused"));
    }
    EXPECT_EQ(generator_.calls, 0);
    EXPECT_THROW(service.metadata(ExtractOptions{}), ConnectionError);
}

TEST_F(QueryServiceTest, RefreshReplacesCache) {
    FakeProberFactory factory(catalog_);
    CacheManager cache(session_.cacheFile);
    QueryService service(session_, factory, cache, generator_, executor_);

    service.schemaText();
    ASSERT_TRUE(cache.get().has_value());
    EXPECT_FALSE(cache.get()->snapshot.tables.at("users").sampleData.has_value());

    auto snapshot = service.refresh();
    EXPECT_EQ(factory.opens, 2);
    EXPECT_TRUE(snapshot.tables.at("users").sampleData.has_value());

    auto cached = cache.get();
    ASSERT_TRUE(cached.has_value());
    EXPECT_TRUE(cached->snapshot.tables.at("users").sampleData.has_value());
}

TEST_F(QueryServiceTest, RefreshWithFailedListingLeavesCacheEmpty) {
    FakeProberFactory factory(catalog_);
    CacheManager cache(session_.cacheFile);
    QueryService service(session_, factory, cache, generator_, executor_);

    service.schemaText();
    ASSERT_TRUE(cache.get().has_value());

    catalog_.failListing = true;
    auto snapshot = service.refresh();
    EXPECT_TRUE(snapshot.tables.empty());
    ASSERT_EQ(snapshot.warnings.size(), 1u);
    EXPECT_EQ(snapshot.warnings[0].step, "relations");
    EXPECT_FALSE(cache.get().has_value());
    EXPECT_FALSE(std::filesystem::exists(session_.cacheFile));

    // Once the listing works again the schema is read from the database
    catalog_.failListing = false;
    auto text = service.schemaText();
    EXPECT_EQ(factory.opens, 3);
    EXPECT_THAT(text, HasSubstr("Total Tables: 2"));
    EXPECT_THAT(text, HasSubstr("TABLE: users"));
}

TEST_F(QueryServiceTest, RefreshSurvivesUnwritableCache) {
    // A regular file where the cache directory should be
    std::ofstream(tempDir_ / "blocker") << "x";
    session_.cacheFile = tempDir_ / "blocker" / "metadata.json";

    FakeProberFactory factory(catalog_);
    CacheManager cache(session_.cacheFile);
    QueryService service(session_, factory, cache, generator_, executor_);

    Snapshot snapshot;
    EXPECT_NO_THROW(snapshot = service.refresh());
    EXPECT_EQ(snapshot.totalTables(), 2u);
    EXPECT_TRUE(snapshot.tables.at("users").sampleData.has_value());
    EXPECT_FALSE(cache.get().has_value());
}

TEST_F(QueryServiceTest, ClearCacheRemovesFile) {
    FakeProberFactory factory(catalog_);
    CacheManager cache(session_.cacheFile);
    QueryService service(session_, factory, cache, generator_, executor_);

    service.schemaText();
    EXPECT_TRUE(std::filesystem::exists(session_.cacheFile));

    service.clearCache();
    EXPECT_FALSE(std::filesystem::exists(session_.cacheFile));

    // Clearing twice is fine
    EXPECT_NO_THROW(service.clearCache());
}

// Session resolution
class SessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir_ = std::filesystem::temp_directory_path() /
                   (std::string("querymind_session_") +
                    ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::remove_all(tempDir_);
        config_.profiles.file = tempDir_ / "connections.json";
        config_.cache.directory = tempDir_ / "cache";
    }

    void TearDown() override {
        std::filesystem::remove_all(tempDir_);
    }

    void addProfile(ConnectionProfileStore& store, const std::string& name, const std::string& db) {
        ConnectionConfig conn;
        conn.host = name + ".internal";
        conn.database = db;
        store.add(ConnectionProfile::fromConnectionConfig(name, conn));
    }

    std::filesystem::path tempDir_;
    Config config_;
};

TEST_F(SessionTest, PlainConnectionOptions) {
    ConnectionProfileStore store(config_.profiles.file);
    config_.connection.database = "shop";

    auto session = Session::resolve(config_, store);

    EXPECT_TRUE(session.profile.empty());
    EXPECT_EQ(session.connection.database, "shop");
    EXPECT_EQ(session.cacheFile, config_.cacheFileFor(config_.connection));
}

TEST_F(SessionTest, ExplicitProfileWins) {
    ConnectionProfileStore store(config_.profiles.file);
    addProfile(store, "reporting", "sales");
    addProfile(store, "staging", "app");
    store.setActive("staging");
    config_.profile = "reporting";
    config_.connection.database = "ignored";

    auto session = Session::resolve(config_, store);

    EXPECT_EQ(session.profile, "reporting");
    EXPECT_EQ(session.connection.host, "reporting.internal");
    EXPECT_EQ(session.connection.database, "sales");
    EXPECT_TRUE(store.get("reporting")->lastUsed.has_value());
}

TEST_F(SessionTest, ActiveProfileWhenNoDatabaseGiven) {
    ConnectionProfileStore store(config_.profiles.file);
    addProfile(store, "staging", "app");
    store.setActive("staging");

    auto session = Session::resolve(config_, store);

    EXPECT_EQ(session.profile, "staging");
    EXPECT_EQ(session.connection.database, "app");
}

TEST_F(SessionTest, DatabaseOptionOverridesActiveProfile) {
    ConnectionProfileStore store(config_.profiles.file);
    addProfile(store, "staging", "app");
    store.setActive("staging");
    config_.connection.database = "shop";

    auto session = Session::resolve(config_, store);

    EXPECT_TRUE(session.profile.empty());
    EXPECT_EQ(session.connection.database, "shop");
}

TEST_F(SessionTest, UnknownProfileFails) {
    ConnectionProfileStore store(config_.profiles.file);
    config_.profile = "missing";

    EXPECT_THROW(Session::resolve(config_, store), ProfileError);
}

TEST_F(SessionTest, CacheFilePerDatabase) {
    ConnectionProfileStore store(config_.profiles.file);
    addProfile(store, "reporting", "sales");
    addProfile(store, "staging", "app");

    config_.profile = "reporting";
    auto reporting = Session::resolve(config_, store);
    config_.profile = "staging";
    auto staging = Session::resolve(config_, store);

    EXPECT_NE(reporting.cacheFile, staging.cacheFile);
    EXPECT_EQ(reporting.cacheFile.parent_path(), config_.cache.directory);
}
