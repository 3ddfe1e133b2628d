#ifndef GATEWAY_PLATFORM_CLIENT_HPP
#define GATEWAY_PLATFORM_CLIENT_HPP

#include "api/gateway/gateway_transport.hpp"
#include "api/general/platform_client_interface.hpp"
#include "configs/api_config.hpp"
#include <string>

namespace GiftSniper {
namespace API {

/**
 * Platform client backed by the HTTP/JSON gateway. The gateway keeps the
 * authorization state of each named session. Payment submission always runs
 * to completion; every other call is abandoned when the signal is set.
 */
class GatewayPlatformClient : public PlatformClientInterface {
public:
    GatewayPlatformClient(const Config::ApiConfig& api_config, const std::string& session_name,
                          Core::CancellationSignal* cancellation_signal = nullptr);
    ~GatewayPlatformClient() override;

    SessionStatus try_open() override;
    void close() override;

    Core::StarsAmount get_balance(const Core::PeerRef& peer) override;
    Core::PeerRef resolve_recipient(const std::string& recipient) override;
    Core::CatalogResponse get_catalog(std::int64_t continuation_hash) override;
    Core::PaymentForm create_payment_form(const Core::PeerRef& recipient, std::int64_t offer_id) override;
    Core::SubmissionResult submit_payment_form(const Core::PaymentForm& payment_form) override;

    bool is_open() const { return opened; }

private:
    GatewayTransport transport;
    bool opened;

    void require_open(const char* operation_name) const;
};

// Factory handed to the run controller and the balance check.
PlatformClientFactory make_gateway_client_factory(const Config::ApiConfig& api_config);

} // namespace API
} // namespace GiftSniper

#endif // GATEWAY_PLATFORM_CLIENT_HPP
