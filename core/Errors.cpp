#include "Errors.hpp"

namespace geotrack {

std::string errorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::ConfigInvalid: return "config_invalid";
        case ErrorKind::ProviderUnavailable: return "provider_unavailable";
        case ErrorKind::PermissionDenied: return "permission_denied";
        case ErrorKind::FilterRejected: return "filter_rejected";
        case ErrorKind::StoreError: return "store_error";
        case ErrorKind::SyncRetryable: return "sync_retryable";
        case ErrorKind::SyncTerminal: return "sync_terminal";
        case ErrorKind::Timeout: return "timeout";
        default: return "unknown";
    }
}

} // namespace geotrack
