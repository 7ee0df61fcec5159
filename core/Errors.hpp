#pragma once

#include <stdexcept>
#include <string>

namespace geotrack {

enum class ErrorKind {
    ConfigInvalid,
    ProviderUnavailable,
    PermissionDenied,
    FilterRejected,
    StoreError,
    SyncRetryable,
    SyncTerminal,
    Timeout
};

std::string errorKindToString(ErrorKind kind);

class TrackingError : public std::runtime_error {
public:
    TrackingError(ErrorKind kind, const std::string& detail)
        : std::runtime_error(errorKindToString(kind) + ": " + detail), kind_(kind), detail_(detail) {}

    ErrorKind kind() const { return kind_; }
    const std::string& detail() const { return detail_; }

private:
    ErrorKind kind_;
    std::string detail_;
};

} // namespace geotrack
