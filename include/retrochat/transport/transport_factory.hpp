#pragma once
#include "retrochat/interfaces/i_transport.hpp"
#include "retrochat/transport/relay_transport.hpp"
#include "retrochat/core/result.hpp"
#include "retrochat/core/failures.hpp"
#include <memory>
#include <optional>
#include <string_view>
namespace retrochat::vault::transport {

enum class TransportKind {
    Mock,
    Relay,
    WebRtc
};

[[nodiscard]] std::optional<TransportKind> TransportKindFromString(std::string_view name) noexcept;

class TransportFactory {
public:
    /** Relay requires a host and port in `relay_options`. WebRtc is not available. */
    [[nodiscard]] static Result<std::shared_ptr<interfaces::ITransport>, VaultFailure> Create(
        TransportKind kind,
        const RelayTransportOptions& relay_options = {});
private:
    TransportFactory() = delete;
};

}
