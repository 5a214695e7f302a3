#pragma once
#include "retrochat/core/failures.hpp"
#include "retrochat/core/constants.hpp"
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
namespace retrochat::vault::diagnostics {

enum class TelemetryEventType {
    Error,
    Info
};

struct TelemetryEvent {
    TelemetryEventType type;
    /** Local correlation id, not secret and not unique across processes. */
    std::string id;
    std::string at;
    std::string scope;
    std::string message;
    std::optional<std::string> name;
};

/**
 * @brief In-process ring buffer of redacted diagnostic events.
 *
 * Newest events come first. Once `capacity` events are held the oldest is
 * dropped. Every message passes RedactSensitiveText before it is stored.
 */
class LocalTelemetry {
public:
    explicit LocalTelemetry(size_t capacity = kTelemetryCapacity);

    std::string LogError(std::string_view scope, const VaultFailure& failure);

    std::string LogInfo(std::string_view scope, std::string_view message);

    [[nodiscard]] std::vector<TelemetryEvent> Snapshot() const;

    void Clear();

    [[nodiscard]] size_t Size() const;
private:
    std::string Push(TelemetryEvent event);

    size_t capacity_;
    mutable std::mutex mutex_;
    std::deque<TelemetryEvent> events_;
};

}
