#ifndef FMCAL_DATE_H
#define FMCAL_DATE_H

#include <iosfwd>
#include <string>

namespace fmcal {

// Calendar day, stored as days since 1970-01-01.
struct Date {
    int days = 0;

    static Date fromCivil(int year, int month, int day);
    static Date parse(const std::string &text);

    void toCivil(int &year, int &month, int &day) const;
    std::string str() const;

    Date operator+(int n) const { return Date{days + n}; }
    Date operator-(int n) const { return Date{days - n}; }
    int operator-(const Date &o) const { return days - o.days; }

    bool operator==(const Date &o) const { return days == o.days; }
    bool operator!=(const Date &o) const { return days != o.days; }
    bool operator<(const Date &o) const { return days < o.days; }
    bool operator<=(const Date &o) const { return days <= o.days; }
    bool operator>(const Date &o) const { return days > o.days; }
    bool operator>=(const Date &o) const { return days >= o.days; }
};

std::ostream &operator<<(std::ostream &os, const Date &d);

}  // namespace fmcal

#endif  // FMCAL_DATE_H
