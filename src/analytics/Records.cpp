#include "analytics/Records.hpp"
#include <algorithm>
#include <cctype>
#include <utility>

namespace prodintel {

namespace {

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

} // namespace

std::string toString(const Identifier& id) {
    if (const auto* number = std::get_if<long long>(&id)) {
        return std::to_string(*number);
    }
    return std::get<std::string>(id);
}

Identifier parseIdentifier(const std::string& text) {
    const std::string value = trim(text);

    // Spreadsheet exports often render integer ids as "12.0"
    std::string digits = value;
    const auto dot = digits.find('.');
    if (dot != std::string::npos &&
        dot + 1 < digits.size() &&
        std::all_of(digits.begin() + dot + 1, digits.end(), [](char c) { return c == '0'; })) {
        digits.erase(dot);
    }

    if (!digits.empty() && digits.size() <= 18 &&
        std::all_of(digits.begin(), digits.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return std::stoll(digits);
    }
    return value;
}

std::string toString(Shift shift) {
    return shift == Shift::Day ? "Day" : "Night";
}

std::optional<Shift> parseShift(const std::string& text) {
    std::string lowered = trim(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "day") return Shift::Day;
    if (lowered == "night") return Shift::Night;
    return std::nullopt;
}

CalendarFields CalendarFields::fromDate(const Date& date) {
    CalendarFields fields;
    if (date.is_special()) {
        return fields;
    }
    fields.year = static_cast<int>(date.year());
    fields.month = static_cast<int>(date.month().as_number());
    fields.month_name = date.month().as_long_string();
    fields.iso_week = date.week_number();
    return fields;
}

MachineRecord::MachineRecord(const Date& date,
                             MachineId machine_id,
                             double rpm,
                             double actual_counter,
                             double rated_counter,
                             long long production)
    : date(date),
      machine_id(std::move(machine_id)),
      rpm(rpm),
      actual_counter(actual_counter),
      rated_counter(rated_counter),
      production(production),
      calendar(CalendarFields::fromDate(date)) {}

OperatorRecord::OperatorRecord(const Date& date,
                               std::string operator_name,
                               MachineId machine_id,
                               Shift shift,
                               long long production)
    : date(date),
      operator_name(std::move(operator_name)),
      machine_id(std::move(machine_id)),
      shift(shift),
      production(production),
      calendar(CalendarFields::fromDate(date)) {}

} // namespace prodintel
