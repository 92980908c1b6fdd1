#include "geofence_service/timestamp.hpp"

#include <cctype>
#include <cstddef>
#include <cstdint>
#include <ctime>

#include <fmt/format.h>

namespace geofence_service {

namespace {

constexpr int k_seconds_per_minute{60};
constexpr int k_seconds_per_hour{3'600};
constexpr std::int64_t k_seconds_per_day{86'400};

/**
 * @brief Days since 1970-01-01 for a proleptic Gregorian date.
 */
constexpr std::int64_t days_from_civil(std::int64_t year, unsigned month, unsigned day) {
    year -= month <= 2 ? 1 : 0;
    const std::int64_t era = (year >= 0 ? year : year - 399) / 400;
    const auto year_of_era = static_cast<unsigned>(year - era * 400);
    const unsigned day_of_year = (153 * (month > 2 ? month - 3 : month + 9) + 2) / 5 + day - 1;
    const unsigned day_of_era = year_of_era * 365 + year_of_era / 4 - year_of_era / 100 + day_of_year;
    return era * 146'097 + static_cast<std::int64_t>(day_of_era) - 719'468;
}

constexpr bool is_leap_year(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

constexpr unsigned days_in_month(int year, unsigned month) {
    constexpr unsigned k_days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    return month == 2 && is_leap_year(year) ? 29U : k_days[month - 1];
}

/** @brief Cursor over the input that reads fixed-width decimal fields. */
class FieldReader final {
  public:
    explicit FieldReader(std::string_view text) : text_(text) {}

    bool read_digits(std::size_t width, int& value) {
        if (position_ + width > text_.size()) {
            return false;
        }
        value = 0;
        for (std::size_t index = 0; index < width; ++index) {
            const char character = text_[position_ + index];
            if (std::isdigit(static_cast<unsigned char>(character)) == 0) {
                return false;
            }
            value = value * 10 + (character - '0');
        }
        position_ += width;
        return true;
    }

    bool expect(char character) {
        if (position_ >= text_.size() || text_[position_] != character) {
            return false;
        }
        ++position_;
        return true;
    }

    [[nodiscard]] bool at_end() const noexcept { return position_ >= text_.size(); }
    [[nodiscard]] char peek() const noexcept { return at_end() ? '\0' : text_[position_]; }
    void advance() noexcept { ++position_; }

  private:
    std::string_view text_;
    std::size_t position_{0};
};

}  // namespace

std::string format_iso8601(WallTime time) {
    const auto since_epoch = std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch());
    std::int64_t total_ms = since_epoch.count();
    std::int64_t millis = total_ms % 1000;
    std::int64_t seconds = total_ms / 1000;
    if (millis < 0) {
        millis += 1000;
        seconds -= 1;
    }
    const auto time_seconds = static_cast<std::time_t>(seconds);
    std::tm utc_time{};
    gmtime_r(&time_seconds, &utc_time);
    return fmt::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}.{:03d}Z",
                       utc_time.tm_year + 1900,
                       utc_time.tm_mon + 1,
                       utc_time.tm_mday,
                       utc_time.tm_hour,
                       utc_time.tm_min,
                       utc_time.tm_sec,
                       static_cast<int>(millis));
}

std::optional<WallTime> parse_iso8601(std::string_view text) {
    FieldReader reader{text};
    int year = 0;
    int month = 0;
    int day = 0;
    int hour = 0;
    int minute = 0;
    int second = 0;

    if (!reader.read_digits(4, year) || !reader.expect('-') || !reader.read_digits(2, month) || !reader.expect('-')
        || !reader.read_digits(2, day)) {
        return std::nullopt;
    }
    if (!reader.expect('T') && !reader.expect('t') && !reader.expect(' ')) {
        return std::nullopt;
    }
    if (!reader.read_digits(2, hour) || !reader.expect(':') || !reader.read_digits(2, minute) || !reader.expect(':')
        || !reader.read_digits(2, second)) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > static_cast<int>(days_in_month(year, static_cast<unsigned>(month)))
        || hour > 23 || minute > 59 || second > 59) {
        return std::nullopt;
    }

    std::int64_t fraction_ns = 0;
    if (reader.peek() == '.') {
        reader.advance();
        std::int64_t scale = 100'000'000;
        bool any_digit = false;
        while (std::isdigit(static_cast<unsigned char>(reader.peek())) != 0) {
            fraction_ns += (reader.peek() - '0') * scale;
            scale /= 10;
            any_digit = true;
            reader.advance();
        }
        if (!any_digit) {
            return std::nullopt;
        }
    }

    int offset_seconds = 0;
    if (reader.peek() == 'Z' || reader.peek() == 'z') {
        reader.advance();
    } else if (reader.peek() == '+' || reader.peek() == '-') {
        const int sign = reader.peek() == '-' ? -1 : 1;
        reader.advance();
        int offset_hours = 0;
        int offset_minutes = 0;
        if (!reader.read_digits(2, offset_hours)) {
            return std::nullopt;
        }
        if (reader.peek() == ':') {
            reader.advance();
        }
        if (!reader.read_digits(2, offset_minutes) || offset_hours > 23 || offset_minutes > 59) {
            return std::nullopt;
        }
        offset_seconds = sign * (offset_hours * k_seconds_per_hour + offset_minutes * k_seconds_per_minute);
    }
    if (!reader.at_end()) {
        return std::nullopt;
    }

    const std::int64_t epoch_seconds = days_from_civil(year, static_cast<unsigned>(month), static_cast<unsigned>(day)) * k_seconds_per_day
        + hour * k_seconds_per_hour + minute * k_seconds_per_minute + second - offset_seconds;
    const auto since_epoch = std::chrono::seconds{epoch_seconds} + std::chrono::nanoseconds{fraction_ns};
    return WallTime{std::chrono::duration_cast<WallClock::duration>(since_epoch)};
}

}  // namespace geofence_service
