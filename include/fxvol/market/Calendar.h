#ifndef FXVOL_CALENDAR_H
#define FXVOL_CALENDAR_H

#include <boost/date_time/gregorian/gregorian.hpp>
#include <set>
#include <string>
#include <utility>
#include <vector>

/**
 * Business-day calendar: Saturdays and Sundays plus a list of fixed (month, day) holidays
 * observed every year. Dates are boost::gregorian::date.
 *
 * Tenor labels follow FX market convention: ON, <n>D, <n>W, <n>M, <n>Y (e.g. "18M", "2Y").
 */
class Calendar
{
public:
    using Date = boost::gregorian::date;

    enum class Adjustment { Unadjusted, Following, ModifiedFollowing, Preceding };

    // Default holidays: 1 January, 25 December
    Calendar();
    explicit Calendar(std::vector<std::pair<int, int>> fixedHolidays); // (month, day)

    bool isWeekend(const Date& date) const;
    bool isHoliday(const Date& date) const;
    bool isBusinessDay(const Date& date) const;

    Date adjust(const Date& date, Adjustment adjustment = Adjustment::Following) const;

    // n > 0 moves forward, n < 0 backward; the start date itself is never counted
    Date addBusinessDays(const Date& date, int n) const;
    Date businessDaysAgo(const Date& date, int n) const { return addBusinessDays(date, -n); }

    // Business days in (from, to]; negative when to < from
    int businessDaysBetween(const Date& from, const Date& to) const;

    /**
     * Expiry for a tenor from the trade date:
     *   ON -> next business day
     *   D/W -> calendar days, then Following
     *   M/Y -> calendar months (end-of-month clipped), then ModifiedFollowing
     */
    Date expiryDate(const Date& tradeDate, const std::string& tenor) const;

    // Nominal day count for a tenor label (ON=1, 1W=7, 1M=30, 12M=1Y=365, 18M=540)
    static int tenorToDays(const std::string& tenor);

    static int dayCount(const Date& from, const Date& to);          // actual days
    static double yearFraction(const Date& from, const Date& to);   // ACT/365

    const std::set<std::pair<int, int>>& fixedHolidays() const { return _fixedHolidays; }

private:
    std::set<std::pair<int, int>> _fixedHolidays;

    struct Tenor {
        int amount;
        char unit;   // 'D', 'W', 'M', 'Y'
    };
    static Tenor parseTenor(const std::string& tenor);
};

#endif //FXVOL_CALENDAR_H
