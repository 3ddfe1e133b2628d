#ifndef PLATFORM_CLIENT_INTERFACE_HPP
#define PLATFORM_CLIENT_INTERFACE_HPP

#include "api/general/platform_errors.hpp"
#include "trader/acquisition/cancellation_signal.hpp"
#include "trader/data_structures/data_structures.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace GiftSniper {
namespace API {

enum class SessionStatus {
    OPENED,
    AUTH_REQUIRED
};

/**
 * Call contract of the remote store.
 *
 * One instance is one session. Calls throw PlatformError on failure and
 * AuthRequiredError when the service rejects the session. Once the session's
 * cancellation signal is set, every call except submit_payment_form gives up
 * with OperationCancelledError instead of running to completion.
 */
class PlatformClientInterface {
public:
    virtual ~PlatformClientInterface() = default;

    // Never starts an interactive login; AUTH_REQUIRED means login must happen out-of-band.
    virtual SessionStatus try_open() = 0;
    virtual void close() = 0;

    virtual Core::StarsAmount get_balance(const Core::PeerRef& peer) = 0;
    virtual Core::PeerRef resolve_recipient(const std::string& recipient) = 0;
    virtual Core::CatalogResponse get_catalog(std::int64_t continuation_hash) = 0;
    virtual Core::PaymentForm create_payment_form(const Core::PeerRef& recipient, std::int64_t offer_id) = 0;
    virtual Core::SubmissionResult submit_payment_form(const Core::PaymentForm& payment_form) = 0;
};

using PlatformClientPtr = std::unique_ptr<PlatformClientInterface>;

// Creates a fresh client bound to the given session name. A null signal
// means the client's calls cannot be cancelled.
using PlatformClientFactory = std::function<PlatformClientPtr(const std::string& session,
                                                              Core::CancellationSignal* cancellation_signal)>;

} // namespace API
} // namespace GiftSniper

#endif // PLATFORM_CLIENT_INTERFACE_HPP
