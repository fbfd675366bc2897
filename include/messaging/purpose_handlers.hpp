#ifndef WORDBASE_PURPOSE_HANDLERS_HPP
#define WORDBASE_PURPOSE_HANDLERS_HPP

#include <vector>
#include "config/app_config.hpp"
#include "database/db_manager.hpp"
#include "messaging/dispatch_registry.hpp"

namespace wordbase {

// ADD_USER, ADD_PROFILE, ADD_LOCATION, ADD_WORD and CREATE_PAYMENT_PURPOSE
std::vector<PurposeRoute> defaultRoutes(DatabaseManager& db, const TrialPolicy& trial);

DispatchRegistry buildDispatchRegistry(DatabaseManager& db, const TrialPolicy& trial);

} // namespace wordbase

#endif // WORDBASE_PURPOSE_HANDLERS_HPP
