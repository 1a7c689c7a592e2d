#include <resparse/core/timestamp.hpp>

#include <array>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <exception>
#include <regex>

namespace resparse {

namespace {

constexpr std::int64_t kSecondsPerDay = 86400;
constexpr std::int64_t kMicrosPerSecond = 1000000;

// 0000-01-01T00:00:00Z and 9999-12-31T23:59:59Z.
constexpr std::int64_t kMinEpochSeconds = -62167219200;
constexpr std::int64_t kMaxEpochSeconds = 253402300799;

Error TimestampError(const std::string& message) {
    return Error{"ParseTimestamp", "", std::nullopt, message, std::nullopt,
                 ErrorCategory::Timestamp};
}

// Days since 1970-01-01 for a proleptic Gregorian date (Howard Hinnant).
std::int64_t DaysFromCivil(std::int64_t y, unsigned m, unsigned d) {
    y -= m <= 2 ? 1 : 0;
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const auto yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

void CivilFromDays(std::int64_t z, std::int64_t& y, unsigned& m, unsigned& d) {
    z += 719468;
    const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const auto doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    y = static_cast<std::int64_t>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    y += m <= 2 ? 1 : 0;
}

bool ValidClock(int month, int day, int hour, int minute, int second) {
    return month >= 1 && month <= 12 && day >= 1 && day <= 31 &&
           hour >= 0 && hour <= 23 && minute >= 0 && minute <= 59 &&
           second >= 0 && second <= 60;
}

// Fraction digits after the decimal point, scaled to microseconds.
std::int64_t FractionToMicros(const std::string& digits) {
    std::int64_t micros = 0;
    for (size_t i = 0; i < 6; ++i) {
        micros *= 10;
        if (i < digits.size()) {
            micros += digits[i] - '0';
        }
    }
    return micros;
}

// "+05:30", "-0800", "Z", "GMT" -> offset east of UTC in seconds.
bool ParseZoneOffset(const std::string& zone, std::int64_t& offset) {
    offset = 0;
    if (zone.empty() || zone == "Z" || zone == "z" || zone == "GMT" ||
        zone == "UTC") {
        return true;
    }
    if (zone.size() < 5 || (zone[0] != '+' && zone[0] != '-')) {
        return false;
    }
    std::string digits;
    for (size_t i = 1; i < zone.size(); ++i) {
        if (zone[i] == ':') continue;
        if (!std::isdigit(static_cast<unsigned char>(zone[i]))) return false;
        digits += zone[i];
    }
    if (digits.size() != 4) {
        return false;
    }
    const int hours = std::stoi(digits.substr(0, 2));
    const int minutes = std::stoi(digits.substr(2, 2));
    offset = (hours * 3600 + minutes * 60) * (zone[0] == '-' ? -1 : 1);
    return true;
}

int MonthFromAbbreviation(const std::string& name) {
    static const std::array<const char*, 12> kMonths = {
        "jan", "feb", "mar", "apr", "may", "jun",
        "jul", "aug", "sep", "oct", "nov", "dec"};
    std::string lower;
    for (char c : name) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    for (size_t i = 0; i < kMonths.size(); ++i) {
        if (lower == kMonths[i]) {
            return static_cast<int>(i) + 1;
        }
    }
    return 0;
}

Result<nlohmann::json, Error> FromEpochSeconds(double seconds) {
    if (!std::isfinite(seconds)) {
        return Result<nlohmann::json, Error>::Err(
            TimestampError("epoch seconds must be finite"));
    }
    const double whole = std::floor(seconds);
    if (whole < static_cast<double>(kMinEpochSeconds) ||
        whole > static_cast<double>(kMaxEpochSeconds)) {
        return Result<nlohmann::json, Error>::Err(
            TimestampError("epoch seconds out of range: " + nlohmann::json(seconds).dump()));
    }
    auto micros = static_cast<std::int64_t>(
        std::llround((seconds - whole) * static_cast<double>(kMicrosPerSecond)));
    auto secs = static_cast<std::int64_t>(whole);
    if (micros >= kMicrosPerSecond) {
        secs += 1;
        micros -= kMicrosPerSecond;
    }
    return Result<nlohmann::json, Error>::Ok(FormatIso8601(secs, micros));
}

Result<nlohmann::json, Error> FromCalendar(std::int64_t year, int month, int day,
                                           int hour, int minute, int second,
                                           std::int64_t micros,
                                           const std::string& zone,
                                           const std::string& raw) {
    std::int64_t offset = 0;
    if (!ValidClock(month, day, hour, minute, second) ||
        !ParseZoneOffset(zone, offset)) {
        return Result<nlohmann::json, Error>::Err(
            TimestampError("invalid timestamp: '" + raw + "'"));
    }
    const std::int64_t secs =
        DaysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day)) *
            kSecondsPerDay +
        hour * 3600 + minute * 60 + second - offset;
    return Result<nlohmann::json, Error>::Ok(FormatIso8601(secs, micros));
}

std::string Trim(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(begin, end - begin);
}

} // anonymous namespace

std::string FormatIso8601(std::int64_t epoch_seconds, std::int64_t microseconds) {
    std::int64_t days = epoch_seconds / kSecondsPerDay;
    std::int64_t rem = epoch_seconds % kSecondsPerDay;
    if (rem < 0) {
        rem += kSecondsPerDay;
        days -= 1;
    }

    std::int64_t year = 0;
    unsigned month = 0;
    unsigned day = 0;
    CivilFromDays(days, year, month, day);

    char buf[64];
    std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02uT%02lld:%02lld:%02lld",
                  static_cast<long long>(year), month, day,
                  static_cast<long long>(rem / 3600),
                  static_cast<long long>((rem % 3600) / 60),
                  static_cast<long long>(rem % 60));
    std::string out(buf);

    if (microseconds > 0) {
        char frac[16];
        if (microseconds % 1000 == 0) {
            std::snprintf(frac, sizeof(frac), ".%03lld",
                          static_cast<long long>(microseconds / 1000));
        } else {
            std::snprintf(frac, sizeof(frac), ".%06lld",
                          static_cast<long long>(microseconds));
        }
        out += frac;
    }
    out += 'Z';
    return out;
}

Result<nlohmann::json, Error> ParseTimestamp(const nlohmann::json& raw) {
    if (raw.is_number()) {
        return FromEpochSeconds(raw.get<double>());
    }
    if (!raw.is_string()) {
        return Result<nlohmann::json, Error>::Err(
            TimestampError("timestamp must be a string or number, got " +
                           std::string(raw.type_name())));
    }

    const std::string text = Trim(raw.get<std::string>());

    static const std::regex kEpoch(R"(^-?\d+(\.\d+)?$)");
    static const std::regex kIso(
        R"(^(\d{4})-(\d{2})-(\d{2})(?:[Tt ](\d{2}):(\d{2})(?::(\d{2})(?:[.,](\d+))?)?)?\s*(Z|z|GMT|UTC|[+-]\d{2}:?\d{2})?$)");
    static const std::regex kRfc822(
        R"(^(?:[A-Za-z]{3},\s*)?(\d{1,2})\s+([A-Za-z]{3})\s+(\d{4})\s+(\d{2}):(\d{2}):(\d{2})\s*(GMT|UTC|Z|[+-]\d{4})?$)");

    std::smatch m;
    if (std::regex_match(text, kEpoch)) {
        try {
            return FromEpochSeconds(std::stod(text));
        } catch (const std::exception&) {
            return Result<nlohmann::json, Error>::Err(
                TimestampError("epoch seconds out of range: '" + text + "'"));
        }
    }
    if (std::regex_match(text, m, kIso)) {
        const auto field = [&m](size_t i) {
            return m[i].matched ? std::stoi(m[i].str()) : 0;
        };
        return FromCalendar(std::stoll(m[1].str()), field(2), field(3),
                            field(4), field(5), field(6),
                            m[7].matched ? FractionToMicros(m[7].str()) : 0,
                            m[8].matched ? m[8].str() : "", text);
    }
    if (std::regex_match(text, m, kRfc822)) {
        const int month = MonthFromAbbreviation(m[2].str());
        return FromCalendar(std::stoll(m[3].str()), month, std::stoi(m[1].str()),
                            std::stoi(m[4].str()), std::stoi(m[5].str()),
                            std::stoi(m[6].str()), 0,
                            m[7].matched ? m[7].str() : "", text);
    }

    return Result<nlohmann::json, Error>::Err(
        TimestampError("unrecognized timestamp format: '" + text + "'"));
}

} // namespace resparse
