#include <parity/core/time.hpp>

#include <fmt/core.h>

#include <array>
#include <charconv>
#include <chrono>
#include <limits>

namespace parity {

namespace {

constexpr std::int64_t kNanosPerSecond = 1'000'000'000;
// Whole seconds that still fit in int64 nanoseconds (about 1677 to 2262).
constexpr std::int64_t kMaxSeconds = std::numeric_limits<std::int64_t>::max() / kNanosPerSecond;
constexpr std::int64_t kMinSeconds = std::numeric_limits<std::int64_t>::min() / kNanosPerSecond;

auto parse_digits(std::string_view text, std::size_t pos, std::size_t count, int& out) -> bool {
    if (pos + count > text.size()) {
        return false;
    }
    out = 0;
    for (std::size_t i = pos; i < pos + count; ++i) {
        char ch = text[i];
        if (ch < '0' || ch > '9') {
            return false;
        }
        out = out * 10 + (ch - '0');
    }
    return true;
}

struct DurationUnit {
    std::string_view suffix;
    std::int64_t nanos;
};

// Longer suffixes first so that "ms" is not read as "m".
constexpr std::array<DurationUnit, 9> kDurationUnits = {{
    {"ns", 1},
    {"us", 1'000},
    {"\xC2\xB5s", 1'000},
    {"ms", 1'000'000},
    {"s", kNanosPerSecond},
    {"m", 60 * kNanosPerSecond},
    {"h", 3600 * kNanosPerSecond},
    {"d", 86400 * kNanosPerSecond},
    {"w", 7 * 86400 * kNanosPerSecond},
}};

}  // namespace

auto parse_rfc3339(std::string_view text) -> std::optional<Timestamp> {
    using namespace std::chrono;
    // YYYY-MM-DDTHH:MM:SS is the fixed-width prefix.
    if (text.size() < 20) {
        return std::nullopt;
    }
    int y = 0;
    int mo = 0;
    int d = 0;
    int h = 0;
    int mi = 0;
    int s = 0;
    if (!parse_digits(text, 0, 4, y) || text[4] != '-' || !parse_digits(text, 5, 2, mo) ||
        text[7] != '-' || !parse_digits(text, 8, 2, d) || (text[10] != 'T' && text[10] != 't') ||
        !parse_digits(text, 11, 2, h) || text[13] != ':' || !parse_digits(text, 14, 2, mi) ||
        text[16] != ':' || !parse_digits(text, 17, 2, s)) {
        return std::nullopt;
    }
    if (h > 23 || mi > 59 || s > 60) {
        return std::nullopt;
    }
    year_month_day ymd{year{y}, month{static_cast<unsigned>(mo)}, day{static_cast<unsigned>(d)}};
    if (!ymd.ok()) {
        return std::nullopt;
    }

    std::size_t pos = 19;
    std::int64_t fraction = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        std::size_t digits = 0;
        while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
            if (digits < 9) {
                fraction = fraction * 10 + (text[pos] - '0');
            }
            ++digits;
            ++pos;
        }
        if (digits == 0) {
            return std::nullopt;
        }
        for (std::size_t i = digits; i < 9; ++i) {
            fraction *= 10;
        }
    }

    std::int64_t offset_seconds = 0;
    if (pos >= text.size()) {
        return std::nullopt;
    }
    if (text[pos] == 'Z' || text[pos] == 'z') {
        ++pos;
    } else if (text[pos] == '+' || text[pos] == '-') {
        int oh = 0;
        int om = 0;
        if (!parse_digits(text, pos + 1, 2, oh) || pos + 3 >= text.size() ||
            text[pos + 3] != ':' || !parse_digits(text, pos + 4, 2, om)) {
            return std::nullopt;
        }
        offset_seconds = static_cast<std::int64_t>(oh) * 3600 + static_cast<std::int64_t>(om) * 60;
        if (text[pos] == '-') {
            offset_seconds = -offset_seconds;
        }
        pos += 6;
    } else {
        return std::nullopt;
    }
    if (pos != text.size()) {
        return std::nullopt;
    }

    auto days_since_epoch = static_cast<std::int64_t>(sys_days{ymd}.time_since_epoch().count());
    std::int64_t seconds = days_since_epoch * 86400 + static_cast<std::int64_t>(h) * 3600 +
                           static_cast<std::int64_t>(mi) * 60 + s - offset_seconds;
    if (seconds > kMaxSeconds || seconds < kMinSeconds) {
        return std::nullopt;
    }
    std::int64_t nanos = seconds * kNanosPerSecond;
    if (nanos > std::numeric_limits<std::int64_t>::max() - fraction) {
        return std::nullopt;
    }
    return Timestamp{nanos + fraction};
}

auto format_rfc3339(Timestamp ts) -> std::string {
    using namespace std::chrono;
    sys_time<nanoseconds> tp{nanoseconds{ts.nanos}};
    auto day_point = floor<days>(tp);
    year_month_day ymd{day_point};
    hh_mm_ss<nanoseconds> hms{tp - day_point};
    auto out = fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}", static_cast<int>(ymd.year()),
                           static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()),
                           hms.hours().count(), hms.minutes().count(), hms.seconds().count());
    auto fraction = hms.subseconds().count();
    if (fraction != 0) {
        auto digits = fmt::format("{:09}", fraction);
        while (!digits.empty() && digits.back() == '0') {
            digits.pop_back();
        }
        out.push_back('.');
        out.append(digits);
    }
    out.push_back('Z');
    return out;
}

auto parse_duration(std::string_view text) -> std::optional<Duration> {
    bool negative = false;
    if (!text.empty() && (text.front() == '-' || text.front() == '+')) {
        negative = text.front() == '-';
        text.remove_prefix(1);
    }
    if (text.empty()) {
        return std::nullopt;
    }
    // Accumulate the magnitude unsigned so that INT64_MIN parses back.
    const std::uint64_t limit =
        static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()) + (negative ? 1 : 0);
    std::uint64_t total = 0;
    while (!text.empty()) {
        // Unsigned parsing rejects a sign, which is only allowed before the first part.
        std::uint64_t magnitude = 0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), magnitude);
        if (ec != std::errc() || ptr == text.data()) {
            return std::nullopt;
        }
        text.remove_prefix(static_cast<std::size_t>(ptr - text.data()));
        const DurationUnit* unit = nullptr;
        for (const auto& candidate : kDurationUnits) {
            if (text.starts_with(candidate.suffix)) {
                unit = &candidate;
                break;
            }
        }
        if (unit == nullptr) {
            return std::nullopt;
        }
        text.remove_prefix(unit->suffix.size());
        const auto size = static_cast<std::uint64_t>(unit->nanos);
        if (magnitude > limit / size) {
            return std::nullopt;
        }
        std::uint64_t part = magnitude * size;
        if (total > limit - part) {
            return std::nullopt;
        }
        total += part;
    }
    return Duration{static_cast<std::int64_t>(negative ? ~total + 1 : total)};
}

auto format_duration(Duration duration) -> std::string {
    if (duration.nanos == 0) {
        return "0s";
    }
    std::string out;
    // Work on the unsigned magnitude so that INT64_MIN is representable.
    auto magnitude = static_cast<std::uint64_t>(duration.nanos);
    if (duration.nanos < 0) {
        out.push_back('-');
        magnitude = ~magnitude + 1;
    }
    constexpr std::array<std::pair<std::uint64_t, std::string_view>, 6> parts = {{
        {3600ULL * 1'000'000'000ULL, "h"},
        {60ULL * 1'000'000'000ULL, "m"},
        {1'000'000'000ULL, "s"},
        {1'000'000ULL, "ms"},
        {1'000ULL, "us"},
        {1ULL, "ns"},
    }};
    for (const auto& [size, suffix] : parts) {
        auto count = magnitude / size;
        if (count == 0) {
            continue;
        }
        out.append(fmt::format("{}{}", count, suffix));
        magnitude -= count * size;
    }
    return out;
}

}  // namespace parity
