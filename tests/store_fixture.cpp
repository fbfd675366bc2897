#include "store_fixture.hpp"
#include <catch2/catch.hpp>
#include <cstdlib>

namespace wordbase {
namespace test {

namespace {

std::string envOr(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    return value && *value ? value : fallback;
}

const char* const kCleanup[] = {
    "TRUNCATE users RESTART IDENTITY CASCADE",
    "DO $$ BEGIN "
    "IF to_regclass('message_queue') IS NOT NULL THEN TRUNCATE message_queue RESTART IDENTITY; END IF; "
    "END $$",
};

} // namespace

std::optional<DatabaseSettings> testDatabaseSettings() {
    const std::string host = envOr("WORDBASE_TEST_DB_HOST", "");
    if (host.empty()) {
        return std::nullopt;
    }

    DatabaseSettings settings;
    settings.host = host;
    settings.port = envOr("WORDBASE_TEST_DB_PORT", "5432");
    settings.dbname = envOr("WORDBASE_TEST_DB_NAME", "wordbase_test");
    settings.user = envOr("WORDBASE_TEST_DB_USER", "wordbase");
    settings.password = envOr("WORDBASE_TEST_DB_PASSWORD", "");
    settings.pool_min_size = 2;
    settings.pool_max_size = 10;
    settings.pool_timeout = std::chrono::seconds(10);
    return settings;
}

StoreFixture::StoreFixture() {
    const auto settings = testDatabaseSettings();
    if (!settings) {
        WARN("WORDBASE_TEST_DB_HOST is not set, skipping store test");
        return;
    }

    ConnectionPool::Options options;
    options.min_size = settings->pool_min_size;
    options.max_size = settings->pool_max_size;
    options.acquire_timeout = settings->pool_timeout;
    pool_ = std::make_unique<ConnectionPool>(ConnectionPool::makePostgresFactory(*settings), options);
    pool_->initialize();

    auto db = std::make_unique<DatabaseManager>(*pool_, locks_);
    db->initialize();
    for (const char* statement : kCleanup) {
        execute(statement);
    }
    db_ = std::move(db);
}

StoreFixture::~StoreFixture() {
    db_.reset();
    if (pool_) {
        pool_->close();
    }
}

void StoreFixture::execute(const std::string& sql) {
    PooledConnection conn = pool_->acquire();
    conn->executeQuery(sql);
}

int64_t StoreFixture::countRows(const std::string& table) {
    PooledConnection conn = pool_->acquire();
    PgResult res = conn->executeQuery("SELECT COUNT(*) FROM " + table);
    return std::strtoll(PQgetvalue(res.get(), 0, 0), nullptr, 10);
}

void StoreFixture::setWordCreatedAt(int64_t user_id, const std::string& word, TimePoint at) {
    const std::string uid = std::to_string(user_id);
    const std::string ts = formatTimestamp(at);
    const char* params[3] = {uid.c_str(), word.c_str(), ts.c_str()};

    PooledConnection conn = pool_->acquire();
    conn->executeParams("UPDATE words SET created_at = $3::timestamptz WHERE user_id = $1 AND word = $2",
                        3, params);
}

void StoreFixture::setWordState(int64_t user_id, const std::string& word, WordState state) {
    const std::string uid = std::to_string(user_id);
    const char* params[3] = {uid.c_str(), word.c_str(), wordStateToString(state)};

    PooledConnection conn = pool_->acquire();
    conn->executeParams("UPDATE words SET word_state = $3 WHERE user_id = $1 AND word = $2", 3, params);
}

User sampleUser(int64_t user_id) {
    User user;
    user.user_id = user_id;
    user.username = "user" + std::to_string(user_id);
    user.first_name = "Tester";
    user.source = "tests";
    user.language = "en";
    user.fluency = 2;
    user.topics = {"travel", "music"};
    user.lang_code = "ru";
    return user;
}

Profile sampleProfile(int64_t user_id, const std::string& nickname) {
    Profile profile;
    profile.user_id = user_id;
    profile.nickname = nickname;
    profile.email = nickname + "@example.com";
    profile.birthday = "03.01.2002";
    return profile;
}

NewWord sampleWord(int64_t user_id, const std::string& word, std::vector<Translation> translations) {
    NewWord entry;
    entry.user_id = user_id;
    entry.word = word;
    entry.translations = std::move(translations);
    return entry;
}

} // namespace test
} // namespace wordbase
