//! # UTC Timestamps Implementation

#include "bind/timestamp.hpp"

#include <chrono>
#include <iomanip>
#include <sstream>

namespace strictjson::bind {

namespace {

constexpr size_t SHORT_LENGTH = 20; // 2024-12-25T14:30:00Z
constexpr size_t LONG_LENGTH = 24;  // 2024-12-25T14:30:00.000Z

/// Reads `count` ASCII digits starting at `pos`; returns -1 on a non-digit.
auto read_digits(std::string_view text, size_t pos, size_t count) -> int {
    int value = 0;
    for (size_t i = 0; i < count; ++i) {
        char c = text[pos + i];
        if (c < '0' || c > '9') {
            return -1;
        }
        value = value * 10 + (c - '0');
    }
    return value;
}

} // anonymous namespace

auto Timestamp::parse(std::string_view text) -> Result<Timestamp, std::string> {
    using namespace std::chrono;

    if (text.size() != SHORT_LENGTH && text.size() != LONG_LENGTH) {
        if (text.size() == 10) {
            return std::string("date without a time component");
        }
        return std::string("wrong length for a UTC timestamp");
    }

    bool has_fraction = text.size() == LONG_LENGTH;
    if (text[4] != '-' || text[7] != '-' || text[10] != 'T' || text[13] != ':' ||
        text[16] != ':') {
        return std::string("misplaced date or time separator");
    }
    if (has_fraction && text[19] != '.') {
        return std::string("fractional seconds must be written as '.fff'");
    }
    if (text.back() != 'Z') {
        return std::string("timestamp must end with the UTC designator 'Z'");
    }

    int year_v = read_digits(text, 0, 4);
    int month_v = read_digits(text, 5, 2);
    int day_v = read_digits(text, 8, 2);
    int hour_v = read_digits(text, 11, 2);
    int minute_v = read_digits(text, 14, 2);
    int second_v = read_digits(text, 17, 2);
    int millis_v = has_fraction ? read_digits(text, 20, 3) : 0;
    if (year_v < 0 || month_v < 0 || day_v < 0 || hour_v < 0 || minute_v < 0 || second_v < 0 ||
        millis_v < 0) {
        return std::string("non-digit character in a numeric component");
    }

    year_month_day ymd{year{year_v}, month{static_cast<unsigned>(month_v)},
                       day{static_cast<unsigned>(day_v)}};
    if (!ymd.ok()) {
        return std::string("not a valid calendar date");
    }
    if (hour_v > 23 || minute_v > 59 || second_v > 59) {
        return std::string("time of day out of range");
    }

    auto point = sys_days{ymd} + hours{hour_v} + minutes{minute_v} + seconds{second_v} +
                 milliseconds{millis_v};
    return Timestamp{duration_cast<milliseconds>(point.time_since_epoch()).count()};
}

auto Timestamp::to_string() const -> std::string {
    using namespace std::chrono;

    sys_time<milliseconds> point{milliseconds{epoch_millis}};
    auto day_point = floor<days>(point);
    year_month_day ymd{day_point};
    hh_mm_ss<milliseconds> tod{point - day_point};

    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(4) << static_cast<int>(ymd.year()) << '-'
        << std::setw(2) << static_cast<unsigned>(ymd.month()) << '-' << std::setw(2)
        << static_cast<unsigned>(ymd.day()) << 'T' << std::setw(2) << tod.hours().count() << ':'
        << std::setw(2) << tod.minutes().count() << ':' << std::setw(2)
        << tod.seconds().count() << '.' << std::setw(3) << tod.subseconds().count() << 'Z';
    return oss.str();
}

} // namespace strictjson::bind
