#pragma once
#include <string>
#include <string_view>
namespace retrochat::vault::timestamp {

/** Current UTC time as `YYYY-MM-DDTHH:MM:SS.mmmZ`. */
std::string NowIso8601();

/**
 * Accepts `YYYY-MM-DDTHH:MM:SS[.f+]Z` with calendar-valid fields.
 * Offsets other than Z are rejected.
 */
bool IsIso8601Utc(std::string_view text) noexcept;

}
