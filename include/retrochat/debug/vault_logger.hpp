#pragma once

/**
 * @file vault_logger.hpp
 * @brief Debug tracing for the vault: unlock, storage, messaging and backup.
 *
 * Only non-secret data is ever passed to these macros: session fingerprints,
 * row ids, store names, counts and error codes. Key material, signatures and
 * plaintext never reach the log.
 *
 * Enable via CMake: -DRETROCHAT_DEBUG_VAULT=ON
 */

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <string>
#include <string_view>

namespace retrochat::vault::debug {

enum class Area {
    Session,
    Storage,
    Messaging,
    Backup,
    Transport
};

#ifdef RETROCHAT_DEBUG_VAULT

inline const char* AreaToString(const Area area) {
    switch (area) {
        case Area::Session: return "SESSION";
        case Area::Storage: return "STORAGE";
        case Area::Messaging: return "MESSAGING";
        case Area::Backup: return "BACKUP";
        case Area::Transport: return "TRANSPORT";
        default: return "UNKNOWN";
    }
}

inline std::string ToCString(const std::string_view text) {
    return std::string(text);
}

#define RC_LOG_MSG(area, operation, message) \
    do { \
        fprintf(stderr, "[RCV-DEBUG] %s %s %s\n", \
            ::retrochat::vault::debug::AreaToString(area), \
            operation, \
            ::retrochat::vault::debug::ToCString(message).c_str()); \
        fflush(stderr); \
    } while(0)

#define RC_LOG_VALUE(area, operation, name, value) \
    do { \
        fprintf(stderr, "[RCV-DEBUG] %s %s %s: %s\n", \
            ::retrochat::vault::debug::AreaToString(area), \
            operation, \
            name, \
            std::to_string(value).c_str()); \
        fflush(stderr); \
    } while(0)

#define RC_LOG_ID(area, operation, name, id) \
    do { \
        fprintf(stderr, "[RCV-DEBUG] %s %s %s: %s\n", \
            ::retrochat::vault::debug::AreaToString(area), \
            operation, \
            name, \
            ::retrochat::vault::debug::ToCString(id).c_str()); \
        fflush(stderr); \
    } while(0)

#define RC_LOG_SECTION(area, section_name) \
    do { \
        fprintf(stderr, "[RCV-DEBUG] %s ========== %s ==========\n", \
            ::retrochat::vault::debug::AreaToString(area), \
            section_name); \
        fflush(stderr); \
    } while(0)

inline void LogUnlocked(const std::string_view fingerprint, const bool created_dsk) {
    RC_LOG_SECTION(Area::Session, "UNLOCKED");
    RC_LOG_ID(Area::Session, "UNLOCK", "fingerprint", fingerprint);
    RC_LOG_MSG(Area::Session, "UNLOCK", created_dsk ? "dsk created" : "dsk unwrapped");
}

inline void LogRowSkipped(const std::string_view store, const std::string_view id) {
    RC_LOG_ID(Area::Storage, "SKIP", std::string(store).c_str(), id);
}

inline void LogBackupRows(const char* operation, const size_t row_count) {
    RC_LOG_VALUE(Area::Backup, operation, "rows", row_count);
}

#else // !RETROCHAT_DEBUG_VAULT

#define RC_LOG_MSG(area, operation, message) ((void)0)
#define RC_LOG_VALUE(area, operation, name, value) ((void)0)
#define RC_LOG_ID(area, operation, name, id) ((void)0)
#define RC_LOG_SECTION(area, section_name) ((void)0)

inline void LogUnlocked(std::string_view, bool) {}
inline void LogRowSkipped(std::string_view, std::string_view) {}
inline void LogBackupRows(const char*, size_t) {}

#endif // RETROCHAT_DEBUG_VAULT

}
