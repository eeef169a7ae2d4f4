#include "date.h"

#include <cstdio>
#include <ctime>
#include <iomanip>
#include <ostream>
#include <sstream>

#include "errors.h"

namespace fmcal {

// Civil-calendar conversion on the proleptic Gregorian calendar, in 400-year
// eras starting on March 1st.
Date Date::fromCivil(int year, int month, int day) {
    year -= month <= 2;
    const int era = (year >= 0 ? year : year - 399) / 400;
    const int yoe = year - era * 400;
    const int doy = (153 * (month + (month > 2 ? -3 : 9)) + 2) / 5 + day - 1;
    const int doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return Date{era * 146097 + doe - 719468};
}

void Date::toCivil(int &year, int &month, int &day) const {
    const int z = days + 719468;
    const int era = (z >= 0 ? z : z - 146096) / 146097;
    const int doe = z - era * 146097;
    const int yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const int mp = (5 * doy + 2) / 153;
    day = doy - (153 * mp + 2) / 5 + 1;
    month = mp < 10 ? mp + 3 : mp - 9;
    year = yoe + era * 400 + (month <= 2);
}

Date Date::parse(const std::string &text) {
    std::tm tm = {};
    std::istringstream ss(text);
    ss >> std::get_time(&tm, "%Y-%m-%d");
    if (ss.fail()) {
        throw ParseError("Failed to parse date: " + text);
    }
    const int y = tm.tm_year + 1900, m = tm.tm_mon + 1, d = tm.tm_mday;
    Date date = fromCivil(y, m, d);

    // get_time accepts e.g. 2025-02-31; the round trip catches it.
    int ry, rm, rd;
    date.toCivil(ry, rm, rd);
    if (ry != y || rm != m || rd != d) {
        throw ParseError("Invalid calendar date: " + text);
    }
    return date;
}

std::string Date::str() const {
    int y, m, d;
    toCivil(y, m, d);
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", y, m, d);
    return buf;
}

std::ostream &operator<<(std::ostream &os, const Date &d) {
    return os << d.str();
}

}  // namespace fmcal
