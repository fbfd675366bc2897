#include "database/db_manager.hpp"
#include "utils/errors.hpp"
#include "utils/json_parser.hpp"
#include "utils/logger.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <sstream>

namespace wordbase {

namespace {

constexpr int kMaxReviewAttempts = 5;

struct StatementDef {
    const char* name;
    const char* sql;
};

// users columns in the order readUser() expects
#define WORDBASE_USER_COLUMNS \
    "u.user_id, u.username, u.first_name, u.source, u.language, u.fluency, " \
    "array_to_json(u.topics)::text, u.lang_code, u.is_active, u.blocked, " \
    "floor(EXTRACT(EPOCH FROM u.last_notified))::bigint"
constexpr int kUserColumnCount = 11;

#define WORDBASE_PROFILE_COLUMNS \
    "p.user_id, p.nickname, p.email, to_char(p.birthday, 'YYYY-MM-DD'), " \
    "COALESCE(p.gender, ''), COALESCE(p.intro, ''), p.dating, p.status"

const StatementDef kStatements[] = {
    // users
    {"upsert_user",
     "INSERT INTO users (user_id, username, first_name, source, language, fluency, topics, lang_code) "
     "VALUES ($1, $2, $3, $4, $5, $6, $7::text[], $8) "
     "ON CONFLICT (user_id) DO UPDATE SET "
     "username = EXCLUDED.username, first_name = EXCLUDED.first_name, source = EXCLUDED.source, "
     "language = EXCLUDED.language, fluency = EXCLUDED.fluency, topics = EXCLUDED.topics, "
     "lang_code = EXCLUDED.lang_code"},
    {"user_exists", "SELECT 1 FROM users WHERE user_id = $1"},
    {"get_user", "SELECT " WORDBASE_USER_COLUMNS " FROM users u WHERE u.user_id = $1"},
    {"get_user_with_profile",
     "SELECT " WORDBASE_USER_COLUMNS ", " WORDBASE_PROFILE_COLUMNS " "
     "FROM users u LEFT JOIN profiles p ON p.user_id = u.user_id WHERE u.user_id = $1"},
    {"get_user_active", "SELECT is_active FROM users WHERE user_id = $1"},

    // profiles
    {"upsert_profile",
     "INSERT INTO profiles (user_id, nickname, email, birthday, dating, gender, intro, status) "
     "VALUES ($1, $2, $3, $4::date, $5::boolean, $6, $7, $8) "
     "ON CONFLICT (user_id) DO UPDATE SET "
     "nickname = EXCLUDED.nickname, email = EXCLUDED.email, birthday = EXCLUDED.birthday, "
     "dating = EXCLUDED.dating, gender = EXCLUDED.gender, intro = EXCLUDED.intro, "
     "status = EXCLUDED.status"},
    {"profile_exists", "SELECT 1 FROM profiles WHERE user_id = $1"},
    {"nickname_exists", "SELECT 1 FROM profiles WHERE nickname = $1"},
    {"get_profile", "SELECT " WORDBASE_PROFILE_COLUMNS " FROM profiles p WHERE p.user_id = $1"},

    // locations
    {"upsert_location",
     "INSERT INTO locations (user_id, latitude, longitude, city, country, timezone) "
     "VALUES ($1, $2, $3, $4, $5, $6) "
     "ON CONFLICT (user_id) DO UPDATE SET "
     "latitude = EXCLUDED.latitude, longitude = EXCLUDED.longitude, city = EXCLUDED.city, "
     "country = EXCLUDED.country, timezone = EXCLUDED.timezone"},
    {"location_exists", "SELECT 1 FROM locations WHERE user_id = $1"},
    {"get_location",
     "SELECT latitude, longitude, city, country, timezone FROM locations WHERE user_id = $1"},

    // payments
    {"insert_trial_payment",
     "INSERT INTO payments (user_id, amount, currency, period, trial, is_active, until) "
     "VALUES ($1, $2::numeric, $3, $4, TRUE, TRUE, now() + make_interval(days => $5::int)) "
     "ON CONFLICT (user_id) WHERE trial DO NOTHING"},
    {"insert_payment",
     "INSERT INTO payments (user_id, amount, currency, period, trial, is_active, until) "
     "VALUES ($1, $2::numeric, $3, $4, $5::boolean, $6::boolean, $7::timestamptz)"},
    {"get_latest_payment",
     "SELECT user_id, amount::text, currency, period, trial, is_active, "
     "floor(EXTRACT(EPOCH FROM until))::bigint "
     "FROM payments WHERE user_id = $1 ORDER BY created_at DESC, id DESC LIMIT 1"},

    // words
    {"word_exists", "SELECT 1 FROM words WHERE user_id = $1 AND word = $2"},
    {"insert_word",
     "INSERT INTO words (user_id, word, is_public) VALUES ($1, $2, $3::boolean) RETURNING id"},
    {"insert_translation",
     "INSERT INTO translations (word_id, translation, part_of_speech) VALUES ($1, $2, $3) "
     "ON CONFLICT (word_id, translation, part_of_speech) DO NOTHING"},
    {"upsert_context",
     "INSERT INTO contexts (user_id, word_id, context) VALUES ($1, $2, $3) "
     "ON CONFLICT (user_id, word_id) DO UPDATE SET context = EXCLUDED.context"},
    {"upsert_audio",
     "INSERT INTO audios (user_id, word_id, audio_url) VALUES ($1, $2, $3) "
     "ON CONFLICT (user_id, word_id) DO UPDATE SET audio_url = EXCLUDED.audio_url"},
    {"delete_word", "DELETE FROM words WHERE user_id = $1 AND id = $2"},
    {"get_words_by_user",
     "SELECT w.id, w.user_id, p.nickname, w.word, w.is_public, w.word_state, "
     "floor(EXTRACT(EPOCH FROM w.created_at))::bigint, c.context, a.audio_url "
     "FROM words w "
     "LEFT JOIN profiles p ON p.user_id = w.user_id "
     "LEFT JOIN contexts c ON c.word_id = w.id "
     "LEFT JOIN audios a ON a.word_id = w.id "
     "WHERE w.user_id = $1 ORDER BY w.word"},
    {"search_public_word",
     "SELECT w.id, w.user_id, p.nickname, w.word, floor(EXTRACT(EPOCH FROM w.created_at))::bigint "
     "FROM words w JOIN profiles p ON p.user_id = w.user_id "
     "WHERE w.word = $1 AND w.is_public ORDER BY p.nickname"},
    {"get_word_translations",
     "SELECT translation, part_of_speech FROM translations WHERE word_id = $1 ORDER BY id"},

    // rename, run inside one transaction
    {"lock_word", "SELECT id FROM words WHERE user_id = $1 AND word = $2 FOR UPDATE"},
    {"merge_renamed_word",
     "INSERT INTO words (user_id, word, is_public, word_state, created_at) "
     "SELECT user_id, $2::varchar, is_public, word_state, created_at FROM words WHERE id = $1 "
     "ON CONFLICT (user_id, word) DO UPDATE SET is_public = words.is_public OR EXCLUDED.is_public "
     "RETURNING id"},
    {"move_translations",
     "INSERT INTO translations (word_id, translation, part_of_speech) "
     "SELECT $2::bigint, translation, part_of_speech FROM translations WHERE word_id = $1 "
     "ON CONFLICT (word_id, translation, part_of_speech) DO NOTHING"},
    {"move_context",
     "INSERT INTO contexts (user_id, word_id, context) "
     "SELECT user_id, $2::bigint, context FROM contexts WHERE word_id = $1 "
     "ON CONFLICT (user_id, word_id) DO NOTHING"},
    {"move_audio",
     "INSERT INTO audios (user_id, word_id, audio_url) "
     "SELECT user_id, $2::bigint, audio_url FROM audios WHERE word_id = $1 "
     "ON CONFLICT (user_id, word_id) DO NOTHING"},
    {"delete_word_by_id", "DELETE FROM words WHERE id = $1"},

    // review ladder
    {"get_word_state", "SELECT word_state FROM words WHERE user_id = $1 AND word = $2"},
    {"cas_word_state",
     "UPDATE words SET word_state = $4 WHERE user_id = $1 AND word = $2 AND word_state = $3"},
    {"mark_repeated_words",
     "UPDATE words SET word_state = 'REPEATED' "
     "WHERE user_id = (SELECT user_id FROM profiles WHERE nickname = $1) "
     "AND word_state = 'NEW' "
     "AND LOWER(word) IN (SELECT LOWER(m) FROM unnest($2::text[]) AS m)"},
    {"get_due_words",
     "SELECT user_id, array_to_json(ARRAY_AGG(DISTINCT word ORDER BY word))::text "
     "FROM words "
     "WHERE word_state <> 'LEARNED' "
     "AND $1::timestamptz - created_at >= CASE word_state "
     "WHEN 'NEW' THEN INTERVAL '1 day' "
     "WHEN 'REPEATED' THEN INTERVAL '5 days' "
     "WHEN 'REINFORCED' THEN INTERVAL '14 days' END "
     "GROUP BY user_id ORDER BY user_id"},

    // statistics
    {"get_user_stats",
     "SELECT "
     "COUNT(DISTINCT w.id) FILTER (WHERE t.part_of_speech = 'noun'), "
     "COUNT(DISTINCT w.id) FILTER (WHERE t.part_of_speech = 'verb'), "
     "COUNT(DISTINCT w.id) FILTER (WHERE t.part_of_speech = 'adjective'), "
     "COUNT(DISTINCT w.id) FILTER (WHERE t.part_of_speech = 'adverb'), "
     "COUNT(DISTINCT w.id) FILTER (WHERE t.part_of_speech NOT IN ('noun', 'verb', 'adjective', 'adverb')) "
     "FROM words w JOIN translations t ON t.word_id = w.id WHERE w.user_id = $1"},
    {"get_user_stats_last_week",
     "SELECT COUNT(*) FROM words "
     "WHERE user_id = $1 AND created_at >= $2::timestamptz - INTERVAL '7 days'"},

    // notifications
    {"get_users_for_notification",
     "SELECT user_id, floor(EXTRACT(EPOCH FROM last_notified))::bigint "
     "FROM users WHERE NOT blocked ORDER BY user_id"},
    {"update_notified_time", "UPDATE users SET last_notified = $2::timestamptz WHERE user_id = $1"},
    {"is_user_blocked", "SELECT blocked FROM users WHERE user_id = $1"},
    {"mark_user_blocked", "UPDATE users SET is_active = FALSE, blocked = TRUE WHERE user_id = $1"},
};

#undef WORDBASE_USER_COLUMNS
#undef WORDBASE_PROFILE_COLUMNS

const char* const kSchema[] = {
    "CREATE TABLE IF NOT EXISTS users ("
    "  user_id BIGINT PRIMARY KEY,"
    "  username VARCHAR(50) NOT NULL,"
    "  first_name VARCHAR(100) NOT NULL,"
    "  source VARCHAR(50) NOT NULL,"
    "  language VARCHAR(20) NOT NULL,"
    "  fluency SMALLINT NOT NULL,"
    "  topics TEXT[] NOT NULL DEFAULT '{}',"
    "  lang_code TEXT NOT NULL,"
    "  is_active BOOLEAN NOT NULL DEFAULT TRUE,"
    "  blocked BOOLEAN NOT NULL DEFAULT FALSE,"
    "  last_notified TIMESTAMPTZ NOT NULL DEFAULT now()"
    ")",

    "CREATE TABLE IF NOT EXISTS profiles ("
    "  user_id BIGINT PRIMARY KEY REFERENCES users(user_id) ON DELETE CASCADE,"
    "  nickname VARCHAR(50) NOT NULL UNIQUE,"
    "  email VARCHAR(50) NOT NULL,"
    "  birthday DATE NOT NULL,"
    "  dating BOOLEAN NOT NULL DEFAULT FALSE,"
    "  gender VARCHAR(50),"
    "  intro TEXT,"
    "  status VARCHAR(50) NOT NULL DEFAULT 'rookie'"
    ")",

    "CREATE TABLE IF NOT EXISTS locations ("
    "  user_id BIGINT PRIMARY KEY REFERENCES users(user_id) ON DELETE CASCADE,"
    "  latitude TEXT,"
    "  longitude TEXT,"
    "  city TEXT,"
    "  country TEXT,"
    "  timezone TEXT"
    ")",

    "CREATE TABLE IF NOT EXISTS words ("
    "  id BIGSERIAL PRIMARY KEY,"
    "  user_id BIGINT NOT NULL REFERENCES users(user_id) ON DELETE CASCADE,"
    "  word VARCHAR(100) NOT NULL,"
    "  is_public BOOLEAN NOT NULL DEFAULT FALSE,"
    "  word_state VARCHAR(20) NOT NULL DEFAULT 'NEW'"
    "    CHECK (word_state IN ('NEW', 'REPEATED', 'REINFORCED', 'LEARNED')),"
    "  created_at TIMESTAMPTZ NOT NULL DEFAULT now(),"
    "  UNIQUE (user_id, word)"
    ")",

    "CREATE TABLE IF NOT EXISTS translations ("
    "  id BIGSERIAL PRIMARY KEY,"
    "  word_id BIGINT NOT NULL REFERENCES words(id) ON DELETE CASCADE,"
    "  translation VARCHAR(255) NOT NULL,"
    "  part_of_speech VARCHAR(50) NOT NULL,"
    "  UNIQUE (word_id, translation, part_of_speech)"
    ")",

    "CREATE TABLE IF NOT EXISTS contexts ("
    "  id BIGSERIAL PRIMARY KEY,"
    "  user_id BIGINT NOT NULL REFERENCES users(user_id) ON DELETE CASCADE,"
    "  word_id BIGINT NOT NULL REFERENCES words(id) ON DELETE CASCADE,"
    "  context TEXT NOT NULL,"
    "  created_at TIMESTAMPTZ NOT NULL DEFAULT now(),"
    "  UNIQUE (user_id, word_id)"
    ")",

    "CREATE TABLE IF NOT EXISTS audios ("
    "  id BIGSERIAL PRIMARY KEY,"
    "  user_id BIGINT NOT NULL REFERENCES users(user_id) ON DELETE CASCADE,"
    "  word_id BIGINT NOT NULL REFERENCES words(id) ON DELETE CASCADE,"
    "  audio_url TEXT NOT NULL,"
    "  created_at TIMESTAMPTZ NOT NULL DEFAULT now(),"
    "  UNIQUE (user_id, word_id)"
    ")",

    "CREATE TABLE IF NOT EXISTS payments ("
    "  id BIGSERIAL PRIMARY KEY,"
    "  user_id BIGINT NOT NULL REFERENCES users(user_id) ON DELETE CASCADE,"
    "  amount NUMERIC(10, 2) NOT NULL,"
    "  currency VARCHAR(3) NOT NULL DEFAULT 'RUB',"
    "  period VARCHAR(20) NOT NULL,"
    "  trial BOOLEAN NOT NULL DEFAULT FALSE,"
    "  is_active BOOLEAN NOT NULL DEFAULT TRUE,"
    "  until TIMESTAMPTZ NOT NULL,"
    "  created_at TIMESTAMPTZ NOT NULL DEFAULT now()"
    ")",

    // At most one trial per user, also under concurrent ADD_USER deliveries
    "CREATE UNIQUE INDEX IF NOT EXISTS payments_one_trial_per_user ON payments (user_id) WHERE trial",
    "CREATE INDEX IF NOT EXISTS idx_words_state_created ON words (word_state, created_at)",
    "CREATE INDEX IF NOT EXISTS idx_payments_user ON payments (user_id, created_at DESC)",
};

bool isTrue(const char* value) {
    return value && std::strcmp(value, "t") == 0;
}

int64_t toInt64(const char* value) {
    return std::strtoll(value, nullptr, 10);
}

std::optional<std::string> optionalText(PGresult* res, int row, int col) {
    if (PQgetisnull(res, row, col)) {
        return std::nullopt;
    }
    return std::string(PQgetvalue(res, row, col));
}

const char* optionalParam(const std::optional<std::string>& value) {
    return value ? value->c_str() : nullptr;
}

size_t affectedRows(PGresult* res) {
    const char* count = PQcmdTuples(res);
    if (!count || *count == '\0') {
        return 0;
    }
    return static_cast<size_t>(std::strtoull(count, nullptr, 10));
}

// {"a","b"} literal for a text[] parameter
std::string toPgTextArray(const std::vector<std::string>& values) {
    std::string out = "{";
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) out += ',';
        out += '"';
        for (char c : values[i]) {
            if (c == '"' || c == '\\') out += '\\';
            out += c;
        }
        out += '"';
    }
    out += '}';
    return out;
}

std::vector<std::string> splitWords(const std::string& message) {
    std::vector<std::string> words;
    std::istringstream in(message);
    std::string token;
    while (in >> token) {
        if (std::find(words.begin(), words.end(), token) == words.end()) {
            words.push_back(token);
        }
    }
    return words;
}

bool allDigits(const std::string& value) {
    return !value.empty() &&
           std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

User readUser(PGresult* res, int row) {
    User user;
    user.user_id = toInt64(PQgetvalue(res, row, 0));
    user.username = PQgetvalue(res, row, 1);
    user.first_name = PQgetvalue(res, row, 2);
    user.source = PQgetvalue(res, row, 3);
    user.language = PQgetvalue(res, row, 4);
    user.fluency = std::atoi(PQgetvalue(res, row, 5));
    user.topics = JsonParser::parseStringArray(PQgetvalue(res, row, 6));
    user.lang_code = PQgetvalue(res, row, 7);
    user.is_active = isTrue(PQgetvalue(res, row, 8));
    user.blocked = isTrue(PQgetvalue(res, row, 9));
    user.last_notified = fromUnixSeconds(toInt64(PQgetvalue(res, row, 10)));
    return user;
}

Profile readProfile(PGresult* res, int row, int offset) {
    Profile profile;
    profile.user_id = toInt64(PQgetvalue(res, row, offset));
    profile.nickname = PQgetvalue(res, row, offset + 1);
    profile.email = PQgetvalue(res, row, offset + 2);
    profile.birthday = PQgetvalue(res, row, offset + 3);
    profile.gender = PQgetvalue(res, row, offset + 4);
    profile.intro = PQgetvalue(res, row, offset + 5);
    profile.dating = isTrue(PQgetvalue(res, row, offset + 6));
    profile.status = PQgetvalue(res, row, offset + 7);
    return profile;
}

} // namespace

DatabaseManager::DatabaseManager(ConnectionPool& pool, UserLockTable& locks)
    : pool_(pool), locks_(locks) {
}

void DatabaseManager::initialize() {
    {
        PooledConnection conn = pool_.acquire();
        createSchema(*conn);
    }

    pool_.setInitializer(&DatabaseManager::prepareStatements);

    // First lease runs the initializer, so a bad statement fails startup
    PooledConnection conn = pool_.acquire();
    Logger::getInstance().info("Database initialized successfully");
}

void DatabaseManager::createSchema(DatabaseConnection& conn) {
    for (const char* statement : kSchema) {
        conn.executeQuery(statement);
    }
    Logger::getInstance().debug("Schema ensured");
}

void DatabaseManager::prepareStatements(DatabaseConnection& conn) {
    // A reused connection may still carry statements from an earlier initializer
    conn.executeQuery("DEALLOCATE ALL");

    for (const auto& def : kStatements) {
        if (!conn.prepareStatement(def.name, def.sql)) {
            throw StorageError(std::string("Failed to prepare statement ") + def.name + ": " +
                               conn.getLastError());
        }
    }

    for (const auto& info : allUserFields()) {
        const std::string get_name = userFieldGetStatement(info.field);
        const std::string set_name = userFieldSetStatement(info.field);
        if (!conn.prepareStatement(get_name, buildUserFieldSelect(info)) ||
            !conn.prepareStatement(set_name, buildUserFieldUpdate(info))) {
            throw StorageError(std::string("Failed to prepare field statements for ") + info.name +
                               ": " + conn.getLastError());
        }
    }
}

// ---------------------------------------------------------------- users

void DatabaseManager::saveUser(const User& user) {
    const std::string user_id = std::to_string(user.user_id);
    const std::string fluency = std::to_string(user.fluency);
    const std::string topics = toPgTextArray(user.topics);
    const char* param_values[8] = {
        user_id.c_str(),
        user.username.c_str(),
        user.first_name.c_str(),
        user.source.c_str(),
        user.language.c_str(),
        fluency.c_str(),
        topics.c_str(),
        user.lang_code.c_str()
    };

    PooledConnection conn = pool_.acquire();
    conn->executePrepared("upsert_user", 8, param_values);
    Logger::getInstance().info("User " + user_id + " created/updated");
}

bool DatabaseManager::userExists(int64_t user_id) {
    const std::string id = std::to_string(user_id);
    const char* param_values[1] = {id.c_str()};

    PooledConnection conn = pool_.acquire();
    PgResult res = conn->executePrepared("user_exists", 1, param_values);
    return PQntuples(res.get()) > 0;
}

std::optional<User> DatabaseManager::getUserInfo(int64_t user_id) {
    const std::string id = std::to_string(user_id);
    const char* param_values[1] = {id.c_str()};

    PooledConnection conn = pool_.acquire();
    PgResult res = conn->executePrepared("get_user", 1, param_values);
    if (PQntuples(res.get()) == 0) {
        return std::nullopt;
    }
    return readUser(res.get(), 0);
}

std::optional<UserInfo> DatabaseManager::getAllUserInfo(int64_t user_id) {
    const std::string id = std::to_string(user_id);
    const char* param_values[1] = {id.c_str()};

    PooledConnection conn = pool_.acquire();
    PgResult res = conn->executePrepared("get_user_with_profile", 1, param_values);
    if (PQntuples(res.get()) == 0) {
        return std::nullopt;
    }

    UserInfo info;
    info.user = readUser(res.get(), 0);
    if (!PQgetisnull(res.get(), 0, kUserColumnCount)) {
        info.profile = readProfile(res.get(), 0, kUserColumnCount);
    }
    return info;
}

// ---------------------------------------------------------------- profiles

void DatabaseManager::saveProfile(const Profile& profile) {
    const auto birthday = normalizeDate(profile.birthday);
    if (!birthday) {
        throw ValidationError("Unrecognized birthday format: " + profile.birthday);
    }

    const std::string user_id = std::to_string(profile.user_id);
    const char* param_values[8] = {
        user_id.c_str(),
        profile.nickname.c_str(),
        profile.email.c_str(),
        birthday->c_str(),
        profile.dating ? "true" : "false",
        profile.gender.empty() ? nullptr : profile.gender.c_str(),
        profile.intro.empty() ? nullptr : profile.intro.c_str(),
        profile.status.empty() ? "rookie" : profile.status.c_str()
    };

    PooledConnection conn = pool_.acquire();
    conn->executePrepared("upsert_profile", 8, param_values);
    Logger::getInstance().debug("Profile of user " + user_id + " saved, nickname " + profile.nickname);
}

bool DatabaseManager::profileExists(int64_t user_id) {
    const std::string id = std::to_string(user_id);
    const char* param_values[1] = {id.c_str()};

    PooledConnection conn = pool_.acquire();
    PgResult res = conn->executePrepared("profile_exists", 1, param_values);
    return PQntuples(res.get()) > 0;
}

bool DatabaseManager::nicknameExists(const std::string& nickname) {
    const char* param_values[1] = {nickname.c_str()};

    PooledConnection conn = pool_.acquire();
    PgResult res = conn->executePrepared("nickname_exists", 1, param_values);
    return PQntuples(res.get()) > 0;
}

std::optional<Profile> DatabaseManager::getUserProfile(int64_t user_id) {
    const std::string id = std::to_string(user_id);
    const char* param_values[1] = {id.c_str()};

    PooledConnection conn = pool_.acquire();
    PgResult res = conn->executePrepared("get_profile", 1, param_values);
    if (PQntuples(res.get()) == 0) {
        return std::nullopt;
    }
    return readProfile(res.get(), 0, 0);
}

// ---------------------------------------------------------------- locations

void DatabaseManager::saveLocation(const Location& location) {
    const std::string user_id = std::to_string(location.user_id);
    const char* param_values[6] = {
        user_id.c_str(),
        optionalParam(location.latitude),
        optionalParam(location.longitude),
        optionalParam(location.city),
        optionalParam(location.country),
        optionalParam(location.timezone)
    };

    PooledConnection conn = pool_.acquire();
    conn->executePrepared("upsert_location", 6, param_values);
    Logger::getInstance().info("Location of user " + user_id + " saved: " +
                               location.city.value_or("?") + ", " + location.country.value_or("?"));
}

bool DatabaseManager::locationExists(int64_t user_id) {
    const std::string id = std::to_string(user_id);
    const char* param_values[1] = {id.c_str()};

    PooledConnection conn = pool_.acquire();
    PgResult res = conn->executePrepared("location_exists", 1, param_values);
    return PQntuples(res.get()) > 0;
}

std::optional<Location> DatabaseManager::getLocation(int64_t user_id) {
    const std::string id = std::to_string(user_id);
    const char* param_values[1] = {id.c_str()};

    PooledConnection conn = pool_.acquire();
    PgResult res = conn->executePrepared("get_location", 1, param_values);
    if (PQntuples(res.get()) == 0) {
        return std::nullopt;
    }

    Location location;
    location.user_id = user_id;
    location.latitude = optionalText(res.get(), 0, 0);
    location.longitude = optionalText(res.get(), 0, 1);
    location.city = optionalText(res.get(), 0, 2);
    location.country = optionalText(res.get(), 0, 3);
    location.timezone = optionalText(res.get(), 0, 4);
    return location;
}

// ---------------------------------------------------------------- payments

bool DatabaseManager::createTrialPayment(int64_t user_id, const TrialPolicy& policy) {
    const std::string id = std::to_string(user_id);
    const std::string days = std::to_string(policy.days);
    const char* param_values[5] = {
        id.c_str(),
        policy.amount.c_str(),
        policy.currency.c_str(),
        policy.period.c_str(),
        days.c_str()
    };

    PooledConnection conn = pool_.acquire();
    PgResult res = conn->executePrepared("insert_trial_payment", 5, param_values);
    const bool created = affectedRows(res.get()) > 0;
    if (created) {
        Logger::getInstance().info("Trial payment created for user " + id + " (" + days + " days)");
    } else {
        Logger::getInstance().debug("User " + id + " already has a trial payment");
    }
    return created;
}

void DatabaseManager::createPayment(const Payment& payment) {
    const std::string user_id = std::to_string(payment.user_id);
    const std::string until = formatTimestamp(payment.until);
    const char* param_values[7] = {
        user_id.c_str(),
        payment.amount.c_str(),
        payment.currency.c_str(),
        payment.period.c_str(),
        payment.trial ? "true" : "false",
        payment.is_active ? "true" : "false",
        until.c_str()
    };

    PooledConnection conn = pool_.acquire();
    conn->executePrepared("insert_payment", 7, param_values);
    Logger::getInstance().info("Payment of " + payment.amount + " " + payment.currency + " recorded for user " +
                               user_id + " until " + until);
}

std::optional<Payment> DatabaseManager::getLatestPayment(int64_t user_id) {
    const std::string id = std::to_string(user_id);
    const char* param_values[1] = {id.c_str()};

    PooledConnection conn = pool_.acquire();
    PgResult res = conn->executePrepared("get_latest_payment", 1, param_values);
    if (PQntuples(res.get()) == 0) {
        return std::nullopt;
    }

    PGresult* r = res.get();
    Payment payment;
    payment.user_id = toInt64(PQgetvalue(r, 0, 0));
    payment.amount = PQgetvalue(r, 0, 1);
    payment.currency = PQgetvalue(r, 0, 2);
    payment.period = PQgetvalue(r, 0, 3);
    payment.trial = isTrue(PQgetvalue(r, 0, 4));
    payment.is_active = isTrue(PQgetvalue(r, 0, 5));
    payment.until = fromUnixSeconds(toInt64(PQgetvalue(r, 0, 6)));
    return payment;
}

// ---------------------------------------------------------------- words

bool DatabaseManager::wordExists(int64_t user_id, const std::string& word) {
    const std::string id = std::to_string(user_id);
    const char* param_values[2] = {id.c_str(), word.c_str()};

    PooledConnection conn = pool_.acquire();
    PgResult res = conn->executePrepared("word_exists", 2, param_values);
    return PQntuples(res.get()) > 0;
}

int64_t DatabaseManager::addWord(const NewWord& word) {
    const std::string user_id = std::to_string(word.user_id);
    PooledConnection conn = pool_.acquire();

    {
        const char* param_values[1] = {user_id.c_str()};
        PgResult res = conn->executePrepared("get_user_active", 1, param_values);
        if (PQntuples(res.get()) == 0 || !isTrue(PQgetvalue(res.get(), 0, 0))) {
            throw PaymentRequiredError("User " + user_id + " has no active subscription");
        }
    }

    std::string word_id;
    {
        const char* param_values[3] = {user_id.c_str(), word.word.c_str(), word.is_public ? "true" : "false"};
        PgResult res = conn->executePrepared("insert_word", 3, param_values);
        word_id = PQgetvalue(res.get(), 0, 0);
    }

    // Child rows go in one by one outside a transaction; the word row stays if one fails
    try {
        for (const auto& translation : word.translations) {
            const char* param_values[3] = {
                word_id.c_str(),
                translation.translation.c_str(),
                translation.part_of_speech.c_str()
            };
            conn->executePrepared("insert_translation", 3, param_values);
        }
        if (word.context) {
            const char* param_values[3] = {user_id.c_str(), word_id.c_str(), word.context->c_str()};
            conn->executePrepared("upsert_context", 3, param_values);
        }
        if (word.audio_url) {
            const char* param_values[3] = {user_id.c_str(), word_id.c_str(), word.audio_url->c_str()};
            conn->executePrepared("upsert_audio", 3, param_values);
        }
    } catch (const Error& e) {
        Logger::getInstance().error("Word " + word_id + " of user " + user_id +
                                    " stored without all of its details: " + e.what());
        throw;
    }

    Logger::getInstance().debug("Word '" + word.word + "' added for user " + user_id + " as id " + word_id);
    return toInt64(word_id.c_str());
}

bool DatabaseManager::deleteWord(int64_t user_id, int64_t word_id) {
    const std::string uid = std::to_string(user_id);
    const std::string wid = std::to_string(word_id);
    const char* param_values[2] = {uid.c_str(), wid.c_str()};

    PooledConnection conn = pool_.acquire();
    PgResult res = conn->executePrepared("delete_word", 2, param_values);
    return affectedRows(res.get()) > 0;
}

std::optional<int64_t> DatabaseManager::renameWord(int64_t user_id,
                                                   const std::string& old_word,
                                                   const std::string& new_word) {
    const std::string uid = std::to_string(user_id);

    // Held across the whole transaction, not just the statements
    UserLockTable::Guard user_lock = locks_.lockUser(user_id);
    PooledConnection conn = pool_.acquire();
    TransactionGuard tx(*conn);

    std::string old_id;
    {
        const char* param_values[2] = {uid.c_str(), old_word.c_str()};
        PgResult res = conn->executePrepared("lock_word", 2, param_values);
        if (PQntuples(res.get()) == 0) {
            return std::nullopt;
        }
        old_id = PQgetvalue(res.get(), 0, 0);
    }

    if (old_word == new_word) {
        tx.commit();
        return toInt64(old_id.c_str());
    }

    std::string new_id;
    {
        const char* param_values[2] = {old_id.c_str(), new_word.c_str()};
        PgResult res = conn->executePrepared("merge_renamed_word", 2, param_values);
        new_id = PQgetvalue(res.get(), 0, 0);
    }

    const char* move_params[2] = {old_id.c_str(), new_id.c_str()};
    conn->executePrepared("move_translations", 2, move_params);
    conn->executePrepared("move_context", 2, move_params);
    conn->executePrepared("move_audio", 2, move_params);

    const char* delete_params[1] = {old_id.c_str()};
    conn->executePrepared("delete_word_by_id", 1, delete_params);

    tx.commit();
    Logger::getInstance().debug("User " + uid + " renamed '" + old_word + "' to '" + new_word + "'");
    return toInt64(new_id.c_str());
}

std::vector<Translation> DatabaseManager::readTranslations(DatabaseConnection& conn, const std::string& word_id) {
    const char* param_values[1] = {word_id.c_str()};
    PgResult res = conn.executePrepared("get_word_translations", 1, param_values);

    std::vector<Translation> translations;
    const int rows = PQntuples(res.get());
    translations.reserve(rows);
    for (int i = 0; i < rows; ++i) {
        translations.push_back(Translation{PQgetvalue(res.get(), i, 0), PQgetvalue(res.get(), i, 1)});
    }
    return translations;
}

std::vector<Word> DatabaseManager::queryWordsByUser(int64_t user_id) {
    const std::string id = std::to_string(user_id);
    const char* param_values[1] = {id.c_str()};

    PooledConnection conn = pool_.acquire();
    PgResult res = conn->executePrepared("get_words_by_user", 1, param_values);

    std::vector<Word> words;
    const int rows = PQntuples(res.get());
    for (int i = 0; i < rows; ++i) {
        PGresult* r = res.get();
        Word word;
        word.id = toInt64(PQgetvalue(r, i, 0));
        word.user_id = toInt64(PQgetvalue(r, i, 1));
        word.nickname = optionalText(r, i, 2);
        word.word = PQgetvalue(r, i, 3);
        word.is_public = isTrue(PQgetvalue(r, i, 4));
        word.state = wordStateFromString(PQgetvalue(r, i, 5));
        word.created_at = fromUnixSeconds(toInt64(PQgetvalue(r, i, 6)));
        word.context = optionalText(r, i, 7);
        word.audio_url = optionalText(r, i, 8);
        word.translations = readTranslations(*conn, PQgetvalue(r, i, 0));
        words.push_back(std::move(word));
    }
    return words;
}

std::vector<PublicWord> DatabaseManager::searchPublicWord(const std::string& word) {
    const char* param_values[1] = {word.c_str()};

    PooledConnection conn = pool_.acquire();
    PgResult res = conn->executePrepared("search_public_word", 1, param_values);

    std::vector<PublicWord> found;
    const int rows = PQntuples(res.get());
    for (int i = 0; i < rows; ++i) {
        PGresult* r = res.get();
        PublicWord entry;
        entry.word_id = toInt64(PQgetvalue(r, i, 0));
        entry.user_id = toInt64(PQgetvalue(r, i, 1));
        entry.nickname = PQgetvalue(r, i, 2);
        entry.word = PQgetvalue(r, i, 3);
        entry.created_at = fromUnixSeconds(toInt64(PQgetvalue(r, i, 4)));
        entry.translations = readTranslations(*conn, PQgetvalue(r, i, 0));
        found.push_back(std::move(entry));
    }
    return found;
}

std::vector<Translation> DatabaseManager::getWordTranslations(int64_t word_id) {
    PooledConnection conn = pool_.acquire();
    return readTranslations(*conn, std::to_string(word_id));
}

// ---------------------------------------------------------------- review ladder

std::optional<WordState> DatabaseManager::reviewOutcome(int64_t user_id, const std::string& word, bool correct) {
    const std::string uid = std::to_string(user_id);
    PooledConnection conn = pool_.acquire();

    for (int attempt = 0; attempt < kMaxReviewAttempts; ++attempt) {
        WordState current = WordState::New;
        {
            const char* param_values[2] = {uid.c_str(), word.c_str()};
            PgResult res = conn->executePrepared("get_word_state", 2, param_values);
            if (PQntuples(res.get()) == 0) {
                return std::nullopt;
            }
            current = wordStateFromString(PQgetvalue(res.get(), 0, 0));
        }

        const WordState next = nextState(current, correct);
        if (next == current) {
            return current;
        }

        const char* param_values[4] = {
            uid.c_str(),
            word.c_str(),
            wordStateToString(current),
            wordStateToString(next)
        };
        PgResult res = conn->executePrepared("cas_word_state", 4, param_values);
        if (affectedRows(res.get()) > 0) {
            Logger::getInstance().debug("Word '" + word + "' of user " + uid + ": " +
                                        wordStateToString(current) + " -> " + wordStateToString(next));
            return next;
        }
        // Another review moved the state between the read and the update
    }

    throw ConflictError("Word '" + word + "' of user " + uid + " kept changing during review");
}

size_t DatabaseManager::markRepeatedWords(const std::string& nickname, const std::string& message) {
    const std::vector<std::string> words = splitWords(message);
    if (words.empty()) {
        return 0;
    }

    const std::string array = toPgTextArray(words);
    const char* param_values[2] = {nickname.c_str(), array.c_str()};

    PooledConnection conn = pool_.acquire();
    PgResult res = conn->executePrepared("mark_repeated_words", 2, param_values);
    return affectedRows(res.get());
}

std::vector<DueWords> DatabaseManager::getDueWords(TimePoint now) {
    const std::string at = formatTimestamp(now);
    const char* param_values[1] = {at.c_str()};

    PooledConnection conn = pool_.acquire();
    PgResult res = conn->executePrepared("get_due_words", 1, param_values);

    std::vector<DueWords> due;
    const int rows = PQntuples(res.get());
    due.reserve(rows);
    for (int i = 0; i < rows; ++i) {
        DueWords entry;
        entry.user_id = toInt64(PQgetvalue(res.get(), i, 0));
        entry.words = JsonParser::parseStringArray(PQgetvalue(res.get(), i, 1));
        due.push_back(std::move(entry));
    }
    return due;
}

// ---------------------------------------------------------------- statistics

WordStats DatabaseManager::getUserStats(int64_t user_id) {
    const std::string id = std::to_string(user_id);
    const char* param_values[1] = {id.c_str()};

    std::unique_lock<std::mutex> stats_lock = locks_.lockStats();
    PooledConnection conn = pool_.acquire();
    PgResult res = conn->executePrepared("get_user_stats", 1, param_values);

    WordStats stats;
    if (PQntuples(res.get()) == 0) {
        return stats;
    }
    stats.nouns = toInt64(PQgetvalue(res.get(), 0, 0));
    stats.verbs = toInt64(PQgetvalue(res.get(), 0, 1));
    stats.adjectives = toInt64(PQgetvalue(res.get(), 0, 2));
    stats.adverbs = toInt64(PQgetvalue(res.get(), 0, 3));
    stats.others = toInt64(PQgetvalue(res.get(), 0, 4));
    return stats;
}

int64_t DatabaseManager::getUserStatsLastWeek(int64_t user_id, TimePoint now) {
    const std::string id = std::to_string(user_id);
    const std::string at = formatTimestamp(now);
    const char* param_values[2] = {id.c_str(), at.c_str()};

    std::unique_lock<std::mutex> stats_lock = locks_.lockStats();
    PooledConnection conn = pool_.acquire();
    PgResult res = conn->executePrepared("get_user_stats_last_week", 2, param_values);
    if (PQntuples(res.get()) == 0) {
        return 0;
    }
    return toInt64(PQgetvalue(res.get(), 0, 0));
}

// ---------------------------------------------------------------- single fields

std::optional<std::string> DatabaseManager::getUserField(int64_t user_id, UserField field) {
    const std::string id = std::to_string(user_id);
    const char* param_values[1] = {id.c_str()};

    PooledConnection conn = pool_.acquire();
    PgResult res = conn->executePrepared(userFieldGetStatement(field), 1, param_values);
    if (PQntuples(res.get()) == 0) {
        return std::nullopt;
    }
    return optionalText(res.get(), 0, 0);
}

bool DatabaseManager::setUserField(int64_t user_id, UserField field, const std::string& value) {
    std::string bound = value;
    switch (field) {
        case UserField::Topics:
            bound = toPgTextArray(JsonParser::parseStringArray(value));
            break;
        case UserField::Birthday: {
            const auto date = normalizeDate(value);
            if (!date) {
                throw ValidationError("Unrecognized birthday format: " + value);
            }
            bound = *date;
            break;
        }
        case UserField::Dating: {
            const std::string lowered = toLower(value);
            if (lowered != "true" && lowered != "false") {
                throw ValidationError("dating must be true or false, got: " + value);
            }
            bound = lowered;
            break;
        }
        case UserField::Fluency:
            if (!allDigits(value)) {
                throw ValidationError("fluency must be a non-negative integer, got: " + value);
            }
            break;
        default:
            break;
    }

    const std::string id = std::to_string(user_id);
    const char* param_values[2] = {id.c_str(), bound.c_str()};

    PooledConnection conn = pool_.acquire();
    PgResult res = conn->executePrepared(userFieldSetStatement(field), 2, param_values);
    return affectedRows(res.get()) > 0;
}

// ---------------------------------------------------------------- notifications

std::vector<NotificationTarget> DatabaseManager::getUsersForNotification() {
    PooledConnection conn = pool_.acquire();
    PgResult res = conn->executePrepared("get_users_for_notification", 0, nullptr);

    std::vector<NotificationTarget> targets;
    const int rows = PQntuples(res.get());
    targets.reserve(rows);
    for (int i = 0; i < rows; ++i) {
        targets.push_back(NotificationTarget{
            toInt64(PQgetvalue(res.get(), i, 0)),
            fromUnixSeconds(toInt64(PQgetvalue(res.get(), i, 1)))
        });
    }
    return targets;
}

void DatabaseManager::updateNotifiedTime(int64_t user_id, TimePoint now) {
    const std::string id = std::to_string(user_id);
    const std::string at = formatTimestamp(now);
    const char* param_values[2] = {id.c_str(), at.c_str()};

    PooledConnection conn = pool_.acquire();
    conn->executePrepared("update_notified_time", 2, param_values);
}

bool DatabaseManager::isUserBlocked(int64_t user_id) {
    const std::string id = std::to_string(user_id);
    const char* param_values[1] = {id.c_str()};

    PooledConnection conn = pool_.acquire();
    PgResult res = conn->executePrepared("is_user_blocked", 1, param_values);
    return PQntuples(res.get()) > 0 && isTrue(PQgetvalue(res.get(), 0, 0));
}

void DatabaseManager::markUserAsBlocked(int64_t user_id) {
    const std::string id = std::to_string(user_id);
    const char* param_values[1] = {id.c_str()};

    PooledConnection conn = pool_.acquire();
    conn->executePrepared("mark_user_blocked", 1, param_values);
    Logger::getInstance().info("User " + id + " marked as blocked");
}

} // namespace wordbase
