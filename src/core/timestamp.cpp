#include "retrochat/core/timestamp.hpp"
#include "retrochat/core/format.hpp"
#include <chrono>
#include <ctime>

namespace retrochat::vault::timestamp {
    namespace {
        bool ReadDigits(const std::string_view text, const size_t offset, const size_t count, int& out) noexcept {
            if (offset + count > text.size()) {
                return false;
            }
            int value = 0;
            for (size_t i = 0; i < count; ++i) {
                const char c = text[offset + i];
                if (c < '0' || c > '9') {
                    return false;
                }
                value = value * 10 + (c - '0');
            }
            out = value;
            return true;
        }

        int DaysInMonth(const int year, const int month) noexcept {
            static constexpr int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
            if (month == 2) {
                const bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
                return leap ? 29 : 28;
            }
            return kDays[month - 1];
        }
    }

    std::string NowIso8601() {
        const auto now = std::chrono::system_clock::now();
        const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()).count() % 1000;
        const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
        std::tm utc{};
        gmtime_r(&seconds, &utc);
        return compat::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z",
            utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday,
            utc.tm_hour, utc.tm_min, utc.tm_sec, static_cast<int>(millis));
    }

    bool IsIso8601Utc(const std::string_view text) noexcept {
        int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
        if (!ReadDigits(text, 0, 4, year) || text.size() < 20 || text[4] != '-' ||
            !ReadDigits(text, 5, 2, month) || text[7] != '-' ||
            !ReadDigits(text, 8, 2, day) || text[10] != 'T' ||
            !ReadDigits(text, 11, 2, hour) || text[13] != ':' ||
            !ReadDigits(text, 14, 2, minute) || text[16] != ':' ||
            !ReadDigits(text, 17, 2, second)) {
            return false;
        }
        if (month < 1 || month > 12 || day < 1 || day > DaysInMonth(year, month) ||
            hour > 23 || minute > 59 || second > 59) {
            return false;
        }
        size_t pos = 19;
        if (text[pos] == '.') {
            ++pos;
            const size_t fraction_start = pos;
            while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
                ++pos;
            }
            if (pos == fraction_start) {
                return false;
            }
        }
        return pos + 1 == text.size() && text[pos] == 'Z';
    }
}
