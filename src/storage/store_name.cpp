#include "retrochat/storage/store_name.hpp"

namespace retrochat::vault::storage {
    std::string_view ToString(const StoreName store) noexcept {
        switch (store) {
            case StoreName::Keys: return "keys";
            case StoreName::Contacts: return "contacts";
            case StoreName::Conversations: return "conversations";
            case StoreName::Messages: return "messages";
            case StoreName::Settings: return "settings";
        }
        return "unknown";
    }

    std::optional<StoreName> StoreNameFromString(const std::string_view name) noexcept {
        for (const auto store : kAllStores) {
            if (ToString(store) == name) {
                return store;
            }
        }
        return std::nullopt;
    }
}
