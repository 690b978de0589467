#ifndef RECORDS_HPP
#define RECORDS_HPP

#include <boost/date_time/gregorian/gregorian.hpp>
#include <optional>
#include <string>
#include <variant>

namespace prodintel {

using Date = boost::gregorian::date;

/**
 * @brief Entity identifier that is either numeric or textual
 *
 * Numeric identifiers compare numerically and sort before textual ones, so
 * machine "2" orders before machine "10". Both record kinds use the same type,
 * which keeps the (date, machine) join comparing like with like.
 */
using Identifier = std::variant<long long, std::string>;
using MachineId = Identifier;

std::string toString(const Identifier& id);

/**
 * @brief Parse source text into an identifier (integer when all digits, text otherwise)
 */
Identifier parseIdentifier(const std::string& text);

enum class Shift {
    Day,
    Night
};

std::string toString(Shift shift);

/**
 * @brief Parse "Day"/"Night" (case-insensitive, surrounding blanks ignored)
 * @return std::nullopt for any other text
 */
std::optional<Shift> parseShift(const std::string& text);

/**
 * @brief Calendar fields derived once from a record date
 */
struct CalendarFields {
    int year = 0;
    int month = 0;           // 1..12
    std::string month_name;  // "January".."December"
    int iso_week = 0;        // ISO-8601 week number, 1..53

    static CalendarFields fromDate(const Date& date);
};

/**
 * @brief One production reading of one machine on one day
 */
struct MachineRecord {
    MachineRecord(const Date& date,
                  MachineId machine_id,
                  double rpm,
                  double actual_counter,
                  double rated_counter,
                  long long production);

    Date date;
    MachineId machine_id;
    double rpm = 0.0;
    double actual_counter = 0.0;
    double rated_counter = 0.0;  // "100% efficiency" reference, may be zero
    long long production = 0;
    CalendarFields calendar;
};

/**
 * @brief One shift worked by one operator on one machine
 */
struct OperatorRecord {
    OperatorRecord(const Date& date,
                   std::string operator_name,
                   MachineId machine_id,
                   Shift shift,
                   long long production);

    Date date;
    std::string operator_name;
    MachineId machine_id;
    Shift shift = Shift::Day;
    long long production = 0;
    CalendarFields calendar;
};

} // namespace prodintel

#endif // RECORDS_HPP
