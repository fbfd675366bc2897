#ifndef WORDBASE_DB_MANAGER_HPP
#define WORDBASE_DB_MANAGER_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "concurrency/user_lock_table.hpp"
#include "config/app_config.hpp"
#include "database/connection_pool.hpp"
#include "database/user_fields.hpp"
#include "domain/models.hpp"

namespace wordbase {

/**
 * Fixed set of store operations over the words schema.
 *
 * Every call leases one pooled connection for its own duration. Writes are
 * upserts keyed on the natural key; reads return an empty optional on a miss.
 * Store failures surface as the exceptions from utils/errors.hpp.
 */
class DatabaseManager {
public:
    DatabaseManager(ConnectionPool& pool, UserLockTable& locks);

    DatabaseManager(const DatabaseManager&) = delete;
    DatabaseManager& operator=(const DatabaseManager&) = delete;

    // Creates the schema and installs statement preparation on the pool
    void initialize();

    // Users
    void saveUser(const User& user);
    bool userExists(int64_t user_id);
    std::optional<User> getUserInfo(int64_t user_id);
    std::optional<UserInfo> getAllUserInfo(int64_t user_id);

    // Profiles
    void saveProfile(const Profile& profile);
    bool profileExists(int64_t user_id);
    bool nicknameExists(const std::string& nickname);
    std::optional<Profile> getUserProfile(int64_t user_id);

    // Locations
    void saveLocation(const Location& location);
    bool locationExists(int64_t user_id);
    std::optional<Location> getLocation(int64_t user_id);

    // Payments. createTrialPayment returns false when the user already has a trial.
    bool createTrialPayment(int64_t user_id, const TrialPolicy& policy);
    void createPayment(const Payment& payment);
    std::optional<Payment> getLatestPayment(int64_t user_id);

    // Words
    bool wordExists(int64_t user_id, const std::string& word);
    int64_t addWord(const NewWord& word);
    bool deleteWord(int64_t user_id, int64_t word_id);
    std::optional<int64_t> renameWord(int64_t user_id,
                                      const std::string& old_word,
                                      const std::string& new_word);
    std::vector<Word> queryWordsByUser(int64_t user_id);
    std::vector<PublicWord> searchPublicWord(const std::string& word);
    std::vector<Translation> getWordTranslations(int64_t word_id);

    // Review ladder
    std::optional<WordState> reviewOutcome(int64_t user_id, const std::string& word, bool correct);
    size_t markRepeatedWords(const std::string& nickname, const std::string& message);
    std::vector<DueWords> getDueWords(TimePoint now);

    // Statistics
    WordStats getUserStats(int64_t user_id);
    int64_t getUserStatsLastWeek(int64_t user_id, TimePoint now);

    // Single fields
    std::optional<std::string> getUserField(int64_t user_id, UserField field);
    bool setUserField(int64_t user_id, UserField field, const std::string& value);

    // Notifications
    std::vector<NotificationTarget> getUsersForNotification();
    void updateNotifiedTime(int64_t user_id, TimePoint now);
    bool isUserBlocked(int64_t user_id);
    void markUserAsBlocked(int64_t user_id);

private:
    void createSchema(DatabaseConnection& conn);
    static void prepareStatements(DatabaseConnection& conn);

    std::vector<Translation> readTranslations(DatabaseConnection& conn, const std::string& word_id);

    ConnectionPool& pool_;
    UserLockTable& locks_;
};

} // namespace wordbase

#endif // WORDBASE_DB_MANAGER_HPP
