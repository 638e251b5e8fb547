#include <fxvol/market/Calendar.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

using boost::gregorian::days;
using boost::gregorian::gregorian_calendar;

Calendar::Calendar()
    : _fixedHolidays{{1, 1}, {12, 25}}
{
}

Calendar::Calendar(std::vector<std::pair<int, int>> fixedHolidays)
    : _fixedHolidays(fixedHolidays.begin(), fixedHolidays.end())
{
    for (const auto& [month, day] : _fixedHolidays) {
        if (month < 1 || month > 12 || day < 1 || day > 31) {
            throw std::invalid_argument("Calendar: invalid fixed holiday (month, day)");
        }
    }
}

bool Calendar::isWeekend(const Date& date) const
{
    const int weekday = date.day_of_week().as_number();
    return weekday == boost::date_time::Saturday || weekday == boost::date_time::Sunday;
}

bool Calendar::isHoliday(const Date& date) const
{
    return _fixedHolidays.count({date.month().as_number(), date.day().as_number()}) > 0;
}

bool Calendar::isBusinessDay(const Date& date) const
{
    return !isWeekend(date) && !isHoliday(date);
}

Calendar::Date Calendar::adjust(const Date& date, Adjustment adjustment) const
{
    if (adjustment == Adjustment::Unadjusted || isBusinessDay(date)) {
        return date;
    }

    if (adjustment == Adjustment::Preceding) {
        Date d = date;
        while (!isBusinessDay(d)) d -= days(1);
        return d;
    }

    Date following = date;
    while (!isBusinessDay(following)) following += days(1);

    // Modified following: roll back instead if following crosses into the next month
    if (adjustment == Adjustment::ModifiedFollowing && following.month() != date.month()) {
        return adjust(date, Adjustment::Preceding);
    }
    return following;
}

Calendar::Date Calendar::addBusinessDays(const Date& date, int n) const
{
    Date d = date;
    const int step = (n >= 0) ? 1 : -1;
    int remaining = std::abs(n);
    while (remaining > 0) {
        d += days(step);
        if (isBusinessDay(d)) {
            --remaining;
        }
    }
    return d;
}

int Calendar::businessDaysBetween(const Date& from, const Date& to) const
{
    if (to < from) {
        return -businessDaysBetween(to, from);
    }
    int count = 0;
    for (Date d = from + days(1); d <= to; d += days(1)) {
        if (isBusinessDay(d)) {
            ++count;
        }
    }
    return count;
}

Calendar::Tenor Calendar::parseTenor(const std::string& tenor)
{
    std::string label;
    label.reserve(tenor.size());
    for (char c : tenor) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            label.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
        }
    }

    if (label == "ON" || label == "O/N") {
        return {1, 'D'};
    }
    if (label.size() < 2) {
        throw std::invalid_argument("Calendar: invalid tenor '" + tenor + "'");
    }

    const char unit = label.back();
    const std::string amount = label.substr(0, label.size() - 1);
    if ((unit != 'D' && unit != 'W' && unit != 'M' && unit != 'Y') ||
        !std::all_of(amount.begin(), amount.end(), [](unsigned char c) { return std::isdigit(c); })) {
        throw std::invalid_argument("Calendar: invalid tenor '" + tenor + "'");
    }
    return {std::stoi(amount), unit};
}

Calendar::Date Calendar::expiryDate(const Date& tradeDate, const std::string& tenor) const
{
    const Tenor t = parseTenor(tenor);

    switch (t.unit) {
        case 'D':
            if (t.amount == 1) {
                return addBusinessDays(tradeDate, 1); // overnight
            }
            return adjust(tradeDate + days(t.amount), Adjustment::Following);
        case 'W':
            return adjust(tradeDate + days(7 * t.amount), Adjustment::Following);
        default:
            break;
    }

    const int months = (t.unit == 'Y') ? 12 * t.amount : t.amount;
    const int monthIndex = static_cast<int>(tradeDate.month().as_number()) - 1 + months;
    const int year = static_cast<int>(tradeDate.year()) + monthIndex / 12;
    const int month = monthIndex % 12 + 1;
    const int lastDay = gregorian_calendar::end_of_month_day(year, month);
    const int day = std::min(static_cast<int>(tradeDate.day().as_number()), lastDay);

    return adjust(Date(year, month, day), Adjustment::ModifiedFollowing);
}

int Calendar::tenorToDays(const std::string& tenor)
{
    const Tenor t = parseTenor(tenor);
    switch (t.unit) {
        case 'D': return t.amount;
        case 'W': return 7 * t.amount;
        case 'Y': return 365 * t.amount;
        default:  break;
    }
    // whole years count as 365 days, other month tenors as 30 days per month
    return (t.amount % 12 == 0) ? 365 * (t.amount / 12) : 30 * t.amount;
}

int Calendar::dayCount(const Date& from, const Date& to)
{
    return static_cast<int>((to - from).days());
}

double Calendar::yearFraction(const Date& from, const Date& to)
{
    return dayCount(from, to) / 365.0;
}
