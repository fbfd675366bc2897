#include "utils/errors.hpp"

namespace wordbase {

const char* errorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Connectivity: return "Connectivity";
        case ErrorKind::Conflict: return "Conflict";
        case ErrorKind::PaymentRequired: return "PaymentRequired";
        case ErrorKind::Validation: return "Validation";
        case ErrorKind::Storage: return "Storage";
        case ErrorKind::Configuration: return "Configuration";
        default: return "Unknown";
    }
}

} // namespace wordbase
