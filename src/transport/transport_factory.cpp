#include "retrochat/transport/transport_factory.hpp"
#include "retrochat/transport/mock_transport.hpp"

namespace retrochat::vault::transport {
    using FactoryResult = Result<std::shared_ptr<interfaces::ITransport>, VaultFailure>;

    std::optional<TransportKind> TransportKindFromString(const std::string_view name) noexcept {
        if (name == "mock") {
            return TransportKind::Mock;
        }
        if (name == "relay") {
            return TransportKind::Relay;
        }
        if (name == "webrtc") {
            return TransportKind::WebRtc;
        }
        return std::nullopt;
    }

    FactoryResult TransportFactory::Create(const TransportKind kind, const RelayTransportOptions& relay_options) {
        switch (kind) {
            case TransportKind::Mock:
                return FactoryResult::Ok(std::make_shared<MockTransport>());
            case TransportKind::Relay:
                if (relay_options.host.empty() || relay_options.port == 0) {
                    return FactoryResult::Err(VaultFailure::Validation("Relay transport requires a host and port."));
                }
                return FactoryResult::Ok(std::make_shared<RelayTransport>(relay_options));
            case TransportKind::WebRtc:
                return FactoryResult::Err(VaultFailure::Validation("WebRTC transport is not yet implemented."));
        }
        return FactoryResult::Err(VaultFailure::Validation("Unknown transport type."));
    }
}
