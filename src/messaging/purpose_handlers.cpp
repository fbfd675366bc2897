#include "messaging/purpose_handlers.hpp"
#include "messaging/envelope.hpp"
#include "messaging/payload_codec.hpp"
#include "utils/logger.hpp"

namespace wordbase {

namespace {

PurposeRoute makeRoute(Purpose purpose, PurposeHandler handler) {
    return PurposeRoute{purposeToString(purpose), payloadKey(purpose), std::move(handler)};
}

} // namespace

std::vector<PurposeRoute> defaultRoutes(DatabaseManager& db, const TrialPolicy& trial) {
    std::vector<PurposeRoute> routes;

    routes.push_back(makeRoute(Purpose::AddUser, [&db, trial](const std::string& payload) {
        const User user = decodeUser(payload);
        db.saveUser(user);
        db.createTrialPayment(user.user_id, trial);
    }));

    routes.push_back(makeRoute(Purpose::AddProfile, [&db](const std::string& payload) {
        db.saveProfile(decodeProfile(payload));
    }));

    routes.push_back(makeRoute(Purpose::AddLocation, [&db](const std::string& payload) {
        db.saveLocation(decodeLocation(payload));
    }));

    routes.push_back(makeRoute(Purpose::AddWord, [&db](const std::string& payload) {
        const int64_t word_id = db.addWord(decodeWord(payload));
        Logger::getInstance().debug("ADD_WORD stored word " + std::to_string(word_id));
    }));

    routes.push_back(makeRoute(Purpose::CreatePayment, [&db](const std::string& payload) {
        db.createPayment(decodePayment(payload));
    }));

    return routes;
}

DispatchRegistry buildDispatchRegistry(DatabaseManager& db, const TrialPolicy& trial) {
    DispatchRegistry registry(defaultRoutes(db, trial));
    Logger::getInstance().info("Dispatch registry ready with " + std::to_string(registry.size()) + " purposes");
    return registry;
}

} // namespace wordbase
