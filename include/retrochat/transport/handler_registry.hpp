#pragma once
#include "retrochat/interfaces/i_transport.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <vector>
namespace retrochat::vault::transport {

/**
 * Thread-safe handler set shared by the transports. Subscriptions keep only
 * a weak reference, so they may outlive the registry.
 */
class HandlerRegistry : public std::enable_shared_from_this<HandlerRegistry> {
public:
    interfaces::Subscription Add(interfaces::MessageHandler handler);

    /** Invokes a snapshot of the handlers outside the lock. */
    void Dispatch(const proto::vault::MessageEnvelope& envelope) const;

    void Clear();

    [[nodiscard]] size_t Size() const;
private:
    void Remove(uint64_t id);

    mutable std::mutex mutex_;
    uint64_t next_id_ = 1;
    std::map<uint64_t, interfaces::MessageHandler> handlers_;
};

}
