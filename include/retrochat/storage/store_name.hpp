#pragma once
#include <array>
#include <optional>
#include <string_view>
namespace retrochat::vault::storage {

enum class StoreName {
    Keys,
    Contacts,
    Conversations,
    Messages,
    Settings
};

inline constexpr std::array<StoreName, 5> kAllStores = {
    StoreName::Keys,
    StoreName::Contacts,
    StoreName::Conversations,
    StoreName::Messages,
    StoreName::Settings
};

std::string_view ToString(StoreName store) noexcept;

std::optional<StoreName> StoreNameFromString(std::string_view name) noexcept;

}
