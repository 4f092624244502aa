#include "DateTimeUtils.h"
#include "CommonUtils.h"

#include <cstdio>

namespace DateTimeUtils {
namespace {
bool parseFixedInt(const std::string& s, size_t offset, size_t len, int& out) {
    if (offset + len > s.size()) return false;
    int value = 0;
    for (size_t i = 0; i < len; ++i) {
        unsigned char ch = static_cast<unsigned char>(s[offset + i]);
        if (ch < '0' || ch > '9') return false;
        value = value * 10 + static_cast<int>(ch - '0');
    }
    out = value;
    return true;
}

bool isLeapYear(int year) {
    if (year % 400 == 0) return true;
    if (year % 100 == 0) return false;
    return (year % 4 == 0);
}

int daysInMonth(int year, int month) {
    static const int kMonthDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) return 0;
    if (month == 2) return isLeapYear(year) ? 29 : 28;
    return kMonthDays[month - 1];
}

void civilFromDays(int64_t z, int& year, unsigned& month, unsigned& day) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    day = doy - (153 * mp + 2) / 5 + 1;
    month = mp < 10 ? mp + 3 : mp - 9;
    year = static_cast<int>(static_cast<int64_t>(yoe) + era * 400) + (month <= 2 ? 1 : 0);
}

bool parseTimePart(std::string timePart, int& hour, int& minute, int& second) {
    hour = minute = second = 0;
    if (timePart.empty()) return true;
    if (timePart.back() == 'Z') timePart.pop_back();
    const size_t dot = timePart.find('.');
    if (dot != std::string::npos) {
        for (size_t i = dot + 1; i < timePart.size(); ++i) {
            if (timePart[i] < '0' || timePart[i] > '9') return false;
        }
        timePart.resize(dot);
    }
    if (timePart.size() == 5) {
        return parseFixedInt(timePart, 0, 2, hour) && timePart[2] == ':' &&
               parseFixedInt(timePart, 3, 2, minute);
    }
    if (timePart.size() != 8) return false;
    return parseFixedInt(timePart, 0, 2, hour) && timePart[2] == ':' &&
           parseFixedInt(timePart, 3, 2, minute) && timePart[5] == ':' &&
           parseFixedInt(timePart, 6, 2, second);
}

bool parseDatePart(const std::string& datePart, DateLocaleHint hint, int& year, int& month, int& day) {
    if (datePart.size() != 10) return false;

    // Year first: YYYY-MM-DD or YYYY/MM/DD
    if ((datePart[4] == '-' || datePart[4] == '/') && datePart[7] == datePart[4]) {
        return parseFixedInt(datePart, 0, 4, year) &&
               parseFixedInt(datePart, 5, 2, month) &&
               parseFixedInt(datePart, 8, 2, day);
    }

    // DD-MM-YYYY
    if (datePart[2] == '-' && datePart[5] == '-') {
        return parseFixedInt(datePart, 0, 2, day) &&
               parseFixedInt(datePart, 3, 2, month) &&
               parseFixedInt(datePart, 6, 4, year);
    }

    // dd/mm/yyyy or mm/dd/yyyy
    if (datePart[2] == '/' && datePart[5] == '/') {
        int a = 0;
        int b = 0;
        if (!parseFixedInt(datePart, 0, 2, a) ||
            !parseFixedInt(datePart, 3, 2, b) ||
            !parseFixedInt(datePart, 6, 4, year)) {
            return false;
        }
        if (hint == DateLocaleHint::DMY || (hint == DateLocaleHint::AUTO && a > 12 && b <= 12)) {
            day = a;
            month = b;
        } else {
            month = a;
            day = b;
        }
        return true;
    }

    return false;
}
} // namespace

int64_t daysFromCivil(int y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const int mp = static_cast<int>(m) + (m > 2 ? -3 : 9);
    const unsigned doy = (153 * static_cast<unsigned>(mp) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return static_cast<int64_t>(era) * 146097 + static_cast<int64_t>(doe) - 719468;
}

bool parse(const std::string& text, int64_t& outUnixSeconds, DateLocaleHint hint) {
    const std::string s = CommonUtils::trim(text);
    if (s.size() < 10) return false;

    const std::string datePart = s.substr(0, 10);
    std::string timePart;
    if (s.size() > 10) {
        if (s[10] != ' ' && s[10] != 'T') return false;
        timePart = CommonUtils::trim(s.substr(11));
    }

    int year = 0;
    int month = 0;
    int day = 0;
    int hour = 0;
    int minute = 0;
    int second = 0;
    if (!parseDatePart(datePart, hint, year, month, day)) return false;
    if (!parseTimePart(timePart, hour, minute, second)) return false;

    if (month < 1 || month > 12) return false;
    if (day < 1 || day > daysInMonth(year, month)) return false;
    if (hour > 23 || minute > 59 || second > 59) return false;

    const int64_t days = daysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    outUnixSeconds = days * 86400 + static_cast<int64_t>(hour) * 3600 + static_cast<int64_t>(minute) * 60 + second;
    return true;
}

std::string toIsoString(int64_t unixSeconds) {
    int64_t days = unixSeconds / 86400;
    int64_t secs = unixSeconds % 86400;
    if (secs < 0) {
        secs += 86400;
        --days;
    }
    int year = 0;
    unsigned month = 0;
    unsigned day = 0;
    civilFromDays(days, year, month, day);

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02uT%02d:%02d:%02d",
                  year, month, day,
                  static_cast<int>(secs / 3600),
                  static_cast<int>((secs % 3600) / 60),
                  static_cast<int>(secs % 60));
    return buf;
}

double toSpreadsheetSerial(int64_t unixSeconds) {
    // 1899-12-30 is 25569 days before the unix epoch.
    return 25569.0 + static_cast<double>(unixSeconds) / 86400.0;
}

} // namespace DateTimeUtils
