#include "intra_core/utils/timestamp.hpp"

#include <cctype>

#include "intra_core/errors.hpp"

namespace intra_core {

namespace {

// Days since 1970-01-01 for a proleptic Gregorian date (Howard Hinnant's algorithm)
int64_t days_from_civil(int64_t y, unsigned m, unsigned d) {
  y -= m <= 2;
  const int64_t era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

bool is_leap(int64_t y) {
  return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

unsigned days_in_month(int64_t y, unsigned m) {
  static const unsigned kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  return (m == 2 && is_leap(y)) ? 29 : kDays[m - 1];
}

class Cursor {
 public:
  explicit Cursor(const std::string &text) : text_(text), pos_(0) {}

  int read_digits(size_t count) {
    int value = 0;
    for (size_t i = 0; i < count; ++i) {
      if (pos_ >= text_.size() || !std::isdigit(static_cast<unsigned char>(text_[pos_]))) {
        fail("expected digit");
      }
      value = value * 10 + (text_[pos_++] - '0');
    }
    return value;
  }

  void expect(char c) {
    if (pos_ >= text_.size() || text_[pos_] != c) {
      fail(std::string("expected '") + c + "'");
    }
    ++pos_;
  }

  bool accept(char c) {
    if (pos_ < text_.size() && text_[pos_] == c) {
      ++pos_;
      return true;
    }
    return false;
  }

  void skip_digits() {
    while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) {
      ++pos_;
    }
  }

  bool at_end() const {
    return pos_ == text_.size();
  }

  [[noreturn]] void fail(const std::string &what) const {
    throw TimestampParseError("Invalid timestamp '" + text_ + "': " + what + " at position " +
                              std::to_string(pos_));
  }

 private:
  const std::string &text_;
  size_t pos_;
};

}  // namespace

Timestamp parse_timestamp(const std::string &text) {
  if (text.empty()) {
    throw TimestampParseError("Invalid timestamp: input is empty");
  }

  Cursor cur(text);
  const int year = cur.read_digits(4);
  cur.expect('-');
  const int month = cur.read_digits(2);
  cur.expect('-');
  const int day = cur.read_digits(2);
  if (!cur.accept('T') && !cur.accept('t') && !cur.accept(' ')) {
    cur.fail("expected date/time separator");
  }
  const int hour = cur.read_digits(2);
  cur.expect(':');
  const int minute = cur.read_digits(2);
  cur.expect(':');
  const int second = cur.read_digits(2);
  if (cur.accept('.')) {
    cur.read_digits(1);
    cur.skip_digits();
  }

  int offset_minutes = 0;
  if (cur.accept('Z') || cur.accept('z')) {
    // UTC
  } else {
    int sign = 0;
    if (cur.accept('+')) {
      sign = 1;
    } else if (cur.accept('-')) {
      sign = -1;
    } else {
      cur.fail("missing zone designator");
    }
    const int off_h = cur.read_digits(2);
    cur.expect(':');
    const int off_m = cur.read_digits(2);
    if (off_h > 23 || off_m > 59) {
      cur.fail("zone offset out of range");
    }
    offset_minutes = sign * (off_h * 60 + off_m);
  }
  if (!cur.at_end()) {
    cur.fail("trailing characters");
  }

  if (month < 1 || month > 12 || day < 1 ||
      static_cast<unsigned>(day) > days_in_month(year, static_cast<unsigned>(month)) ||
      hour > 23 || minute > 59 || second > 60) {
    throw TimestampParseError("Invalid timestamp '" + text + "': field out of range");
  }

  const int64_t days = days_from_civil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
  const int64_t seconds = days * 86400 + hour * 3600 + minute * 60 + second - offset_minutes * 60;
  return Timestamp(std::chrono::seconds(seconds));
}

int64_t days_between(Timestamp from, Timestamp to) {
  // duration_cast truncates toward zero
  return std::chrono::duration_cast<std::chrono::hours>(to - from).count() / 24;
}

}  // namespace intra_core
