#pragma once

#include <cstdint>
#include <string>

namespace DateTimeUtils {

enum class DateLocaleHint { AUTO, DMY, MDY };

/**
 * @brief Parses a calendar date with an optional time of day into unix seconds (UTC).
 * @details Accepts YYYY-MM-DD, YYYY/MM/DD, DD-MM-YYYY, dd/mm/yyyy or mm/dd/yyyy (resolved by
 * the locale hint, or by the day > 12 rule under AUTO), followed by an optional
 * ' ' or 'T' separated HH:MM or HH:MM:SS part with optional fractional seconds and 'Z'.
 */
bool parse(const std::string& text, int64_t& outUnixSeconds, DateLocaleHint hint = DateLocaleHint::AUTO);

// Canonical text form, YYYY-MM-DDTHH:MM:SS.
std::string toIsoString(int64_t unixSeconds);

// Spreadsheet serial date (days since 1899-12-30, fractional time of day).
double toSpreadsheetSerial(int64_t unixSeconds);

int64_t daysFromCivil(int y, unsigned m, unsigned d);

} // namespace DateTimeUtils
