#include "sme/core/time.h"

#include <iomanip>
#include <sstream>

namespace sme::core {

namespace {

// Reads exactly `width` decimal digits starting at `pos`. Advances pos on success.
std::optional<int> read_digits(std::string_view text, std::size_t& pos, std::size_t width) {
  if (pos + width > text.size()) {
    return std::nullopt;
  }
  int value = 0;
  for (std::size_t i = 0; i < width; ++i) {
    const char ch = text[pos + i];
    if (ch < '0' || ch > '9') {
      return std::nullopt;
    }
    value = value * 10 + (ch - '0');
  }
  pos += width;
  return value;
}

bool expect(std::string_view text, std::size_t& pos, char ch) {
  if (pos < text.size() && text[pos] == ch) {
    ++pos;
    return true;
  }
  return false;
}

}  // namespace

std::optional<Timestamp> parse_iso8601(const std::string_view text) {
  using namespace std::chrono;

  std::size_t pos = 0;
  const auto y = read_digits(text, pos, 4);
  if (!y || !expect(text, pos, '-')) {
    return std::nullopt;
  }
  const auto mo = read_digits(text, pos, 2);
  if (!mo || !expect(text, pos, '-')) {
    return std::nullopt;
  }
  const auto d = read_digits(text, pos, 2);
  if (!d) {
    return std::nullopt;
  }

  const year_month_day ymd{year{*y}, month{static_cast<unsigned>(*mo)},
                           day{static_cast<unsigned>(*d)}};
  if (!ymd.ok()) {
    return std::nullopt;
  }

  Timestamp ts = sys_days{ymd};
  if (pos == text.size()) {
    return ts;
  }

  if (!expect(text, pos, 'T') && !expect(text, pos, ' ')) {
    return std::nullopt;
  }

  const auto hh = read_digits(text, pos, 2);
  if (!hh || *hh > 23 || !expect(text, pos, ':')) {
    return std::nullopt;
  }
  const auto mm = read_digits(text, pos, 2);
  if (!mm || *mm > 59) {
    return std::nullopt;
  }
  int ss = 0;
  if (expect(text, pos, ':')) {
    const auto parsed = read_digits(text, pos, 2);
    if (!parsed || *parsed > 60) {
      return std::nullopt;
    }
    ss = *parsed;
  }
  ts += hours{*hh} + minutes{*mm} + seconds{ss};

  // Fractional seconds: keep millisecond precision, ignore further digits.
  if (expect(text, pos, '.')) {
    int ms = 0;
    int digits = 0;
    while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
      if (digits < 3) {
        ms = ms * 10 + (text[pos] - '0');
      }
      ++digits;
      ++pos;
    }
    if (digits == 0) {
      return std::nullopt;
    }
    for (int i = digits; i < 3; ++i) {
      ms *= 10;
    }
    ts += milliseconds{ms};
  }

  if (pos == text.size() || expect(text, pos, 'Z')) {
    return pos == text.size() ? std::optional<Timestamp>{ts} : std::nullopt;
  }

  const char sign = text[pos];
  if (sign != '+' && sign != '-') {
    return std::nullopt;
  }
  ++pos;
  const auto off_h = read_digits(text, pos, 2);
  if (!off_h) {
    return std::nullopt;
  }
  expect(text, pos, ':');
  const auto off_m = read_digits(text, pos, 2);
  if (!off_m || pos != text.size()) {
    return std::nullopt;
  }

  // Local time = UTC + offset, so UTC = local - offset.
  const auto offset = hours{*off_h} + minutes{*off_m};
  return sign == '+' ? ts - offset : ts + offset;
}

std::string format_iso8601(const Timestamp ts) {
  using namespace std::chrono;

  const auto day_point = floor<days>(ts);
  const year_month_day ymd{day_point};
  const hh_mm_ss tod{floor<seconds>(ts - day_point)};

  std::ostringstream oss;
  oss << std::setfill('0') << std::setw(4) << static_cast<int>(ymd.year()) << '-' << std::setw(2)
      << static_cast<unsigned>(ymd.month()) << '-' << std::setw(2)
      << static_cast<unsigned>(ymd.day()) << 'T' << std::setw(2) << tod.hours().count() << ':'
      << std::setw(2) << tod.minutes().count() << ':' << std::setw(2) << tod.seconds().count()
      << 'Z';
  return oss.str();
}

}  // namespace sme::core
