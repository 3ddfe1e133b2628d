#ifndef PLATFORM_ERRORS_HPP
#define PLATFORM_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace GiftSniper {
namespace API {

// Remote call failed: network error, protocol error or an error reported by the service.
class PlatformError : public std::runtime_error {
public:
    explicit PlatformError(const std::string& message, const std::string& remote_error_value = "")
        : std::runtime_error(message), remote_error(remote_error_value) {}

    // Error message reported by the service itself (e.g. "FLOOD_WAIT_30"), empty for local failures.
    const std::string& get_remote_error() const { return remote_error; }

private:
    std::string remote_error;
};

// The service rejected the session; an out-of-band login is required.
class AuthRequiredError : public PlatformError {
public:
    explicit AuthRequiredError(const std::string& message, const std::string& remote_error_value = "")
        : PlatformError(message, remote_error_value) {}
};

// A cancellable call was abandoned because the run was asked to stop.
class OperationCancelledError : public PlatformError {
public:
    explicit OperationCancelledError(const std::string& message)
        : PlatformError(message) {}
};

} // namespace API
} // namespace GiftSniper

#endif // PLATFORM_ERRORS_HPP
