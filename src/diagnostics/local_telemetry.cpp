#include "retrochat/diagnostics/local_telemetry.hpp"
#include "retrochat/crypto/sodium_interop.hpp"
#include "retrochat/validation/redact.hpp"
#include "retrochat/core/format.hpp"
#include "retrochat/core/hex.hpp"
#include "retrochat/core/timestamp.hpp"
#include "retrochat/debug/vault_logger.hpp"
#include <chrono>

namespace retrochat::vault::diagnostics {
    namespace {
        std::string MakeEventId() {
            const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::system_clock::now().time_since_epoch()).count();
            const auto suffix = crypto::SodiumInterop::GetRandomBytes(3);
            return compat::format("{:x}-{}", millis, hex::Encode(suffix));
        }
    }

    LocalTelemetry::LocalTelemetry(const size_t capacity)
        : capacity_(capacity == 0 ? 1 : capacity) {
    }

    std::string LocalTelemetry::LogError(const std::string_view scope, const VaultFailure& failure) {
        TelemetryEvent event{
            TelemetryEventType::Error,
            MakeEventId(),
            timestamp::NowIso8601(),
            std::string(scope),
            validation::RedactSensitiveText(failure.message),
            std::string(ToString(failure.type))
        };
        RC_LOG_ID(debug::Area::Session, "TELEMETRY", event.scope.c_str(), event.message);
        return Push(std::move(event));
    }

    std::string LocalTelemetry::LogInfo(const std::string_view scope, const std::string_view message) {
        return Push(TelemetryEvent{
            TelemetryEventType::Info,
            MakeEventId(),
            timestamp::NowIso8601(),
            std::string(scope),
            validation::RedactSensitiveText(message),
            std::nullopt
        });
    }

    std::string LocalTelemetry::Push(TelemetryEvent event) {
        std::string id = event.id;
        std::lock_guard lock(mutex_);
        events_.push_front(std::move(event));
        while (events_.size() > capacity_) {
            events_.pop_back();
        }
        return id;
    }

    std::vector<TelemetryEvent> LocalTelemetry::Snapshot() const {
        std::lock_guard lock(mutex_);
        return {events_.begin(), events_.end()};
    }

    void LocalTelemetry::Clear() {
        std::lock_guard lock(mutex_);
        events_.clear();
    }

    size_t LocalTelemetry::Size() const {
        std::lock_guard lock(mutex_);
        return events_.size();
    }
}
