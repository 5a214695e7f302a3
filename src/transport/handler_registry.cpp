#include "retrochat/transport/handler_registry.hpp"

namespace retrochat::vault::transport {
    interfaces::Subscription HandlerRegistry::Add(interfaces::MessageHandler handler) {
        uint64_t id;
        {
            std::lock_guard lock(mutex_);
            id = next_id_++;
            handlers_.emplace(id, std::move(handler));
        }
        std::weak_ptr<HandlerRegistry> weak = weak_from_this();
        return interfaces::Subscription([weak, id] {
            if (const auto registry = weak.lock()) {
                registry->Remove(id);
            }
        });
    }

    void HandlerRegistry::Dispatch(const proto::vault::MessageEnvelope& envelope) const {
        std::vector<interfaces::MessageHandler> snapshot;
        {
            std::lock_guard lock(mutex_);
            snapshot.reserve(handlers_.size());
            for (const auto& [id, handler] : handlers_) {
                snapshot.push_back(handler);
            }
        }
        for (const auto& handler : snapshot) {
            handler(envelope);
        }
    }

    void HandlerRegistry::Clear() {
        std::lock_guard lock(mutex_);
        handlers_.clear();
    }

    size_t HandlerRegistry::Size() const {
        std::lock_guard lock(mutex_);
        return handlers_.size();
    }

    void HandlerRegistry::Remove(const uint64_t id) {
        std::lock_guard lock(mutex_);
        handlers_.erase(id);
    }
}
