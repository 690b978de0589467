#include "ingest/DatasetLoader.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <sstream>

namespace prodintel {

namespace {

const std::string COL_DATE = "Date";
const std::string COL_MACHINE = "Machine Number";
const std::string COL_RPM = "Rpm";
const std::string COL_ACTUAL = "Actual Counter";
const std::string COL_RATED = "100% Efficiency";
const std::string COL_PRODUCTION = "Production";
const std::string COL_OPERATOR = "Machine Operator";
const std::string COL_SHIFT = "Shift (Day/Night)";

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

bool isBlank(const std::string& line) {
    return std::all_of(line.begin(), line.end(), [](unsigned char c) { return std::isspace(c); });
}

std::string location(const std::string& source_name, std::size_t line_number) {
    return source_name + ":" + std::to_string(line_number);
}

double parseNumber(const std::string& text, const std::string& column, const std::string& where) {
    const std::string value = trim(text);
    if (value.empty()) {
        throw InvalidRecordException("DatasetLoader", where + ": missing value for '" + column + "'");
    }
    try {
        std::size_t consumed = 0;
        const double number = std::stod(value, &consumed);
        if (consumed != value.size() || !std::isfinite(number)) {
            throw std::invalid_argument(value);
        }
        return number;
    } catch (const std::invalid_argument&) {
        throw InvalidRecordException("DatasetLoader", where + ": non-numeric value '" + value + "' for '" + column + "'");
    } catch (const std::out_of_range&) {
        throw InvalidRecordException("DatasetLoader", where + ": value '" + value + "' out of range for '" + column + "'");
    }
}

long long parseCount(const std::string& text, const std::string& column, const std::string& where) {
    return std::llround(parseNumber(text, column, where));
}

const std::string& field(const std::vector<std::string>& fields,
                         const std::map<std::string, std::size_t>& columns,
                         const std::string& column,
                         const std::string& where) {
    const std::size_t index = columns.at(column);
    if (index >= fields.size()) {
        throw InvalidRecordException("DatasetLoader", where + ": row has no value for '" + column + "'");
    }
    return fields[index];
}

std::ifstream openFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw FileIOException("DatasetLoader", "Failed to open file: " + path);
    }
    return file;
}

} // namespace

const std::vector<std::string>& DatasetLoader::machineColumns() {
    static const std::vector<std::string> columns = {
        COL_DATE, COL_MACHINE, COL_RPM, COL_ACTUAL, COL_RATED, COL_PRODUCTION
    };
    return columns;
}

const std::vector<std::string>& DatasetLoader::operatorColumns() {
    static const std::vector<std::string> columns = {
        COL_DATE, COL_OPERATOR, COL_MACHINE, COL_SHIFT, COL_PRODUCTION
    };
    return columns;
}

std::string DatasetLoader::normalizeColumnName(const std::string& name) {
    std::string normalized = trim(name);
    bool word_start = true;
    for (char& c : normalized) {
        const unsigned char uc = static_cast<unsigned char>(c);
        if (std::isalpha(uc)) {
            c = static_cast<char>(word_start ? std::toupper(uc) : std::tolower(uc));
            word_start = false;
        } else {
            word_start = true;
        }
    }
    return normalized;
}

std::vector<std::string> DatasetLoader::splitCsvLine(const std::string& line) {
    std::vector<std::string> fields;
    std::string current;
    bool in_quotes = false;

    for (std::size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    current += '"';
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                current += c;
            }
        } else if (c == '"') {
            in_quotes = true;
        } else if (c == ',') {
            fields.push_back(current);
            current.clear();
        } else if (c != '\r') {
            current += c;
        }
    }
    fields.push_back(current);
    return fields;
}

Date DatasetLoader::parseDate(const std::string& text, const std::string& where) {
    std::string value = trim(text);
    const auto time_sep = value.find_first_of(" T");
    if (time_sep != std::string::npos) {
        value.erase(time_sep);
    }
    if (value.empty()) {
        throw InvalidRecordException("DatasetLoader", where + ": missing date");
    }

    try {
        const Date date = boost::gregorian::from_simple_string(value);
        if (date.is_special()) {
            throw InvalidRecordException("DatasetLoader", where + ": invalid date '" + value + "'");
        }
        return date;
    } catch (const InvalidRecordException&) {
        throw;
    } catch (const std::exception&) {
        throw InvalidRecordException("DatasetLoader", where + ": malformed date '" + value + "'");
    }
}

DatasetLoader::ColumnIndex DatasetLoader::readHeader(
    std::istream& input,
    const std::vector<std::string>& required,
    const std::string& source_name) {

    std::string line;
    while (std::getline(input, line) && isBlank(line)) {}
    if (isBlank(line)) {
        PRODINTEL_THROW_DATA_FORMAT("DatasetLoader", source_name + ": missing header row");
    }

    // Strip a UTF-8 byte order mark left by spreadsheet exports
    if (line.size() >= 3 && line.compare(0, 3, "\xEF\xBB\xBF") == 0) {
        line.erase(0, 3);
    }

    ColumnIndex columns;
    const std::vector<std::string> names = splitCsvLine(line);
    for (std::size_t i = 0; i < names.size(); ++i) {
        columns.emplace(normalizeColumnName(names[i]), i);
    }

    for (const auto& column : required) {
        if (columns.find(column) == columns.end()) {
            PRODINTEL_THROW_DATA_FORMAT("DatasetLoader", source_name + ": missing required column '" + column + "'");
        }
    }
    return columns;
}

std::vector<MachineRecord> DatasetLoader::parseMachineRecords(std::istream& input, const std::string& source_name) {
    const ColumnIndex columns = readHeader(input, machineColumns(), source_name);

    std::vector<MachineRecord> records;
    std::string line;
    std::size_t line_number = 1;
    while (std::getline(input, line)) {
        ++line_number;
        if (isBlank(line)) continue;

        const std::string where = location(source_name, line_number);
        const std::vector<std::string> fields = splitCsvLine(line);

        const std::string& machine = field(fields, columns, COL_MACHINE, where);
        if (trim(machine).empty()) {
            throw InvalidRecordException("DatasetLoader", where + ": missing machine number");
        }

        records.emplace_back(
            parseDate(field(fields, columns, COL_DATE, where), where),
            parseIdentifier(machine),
            parseNumber(field(fields, columns, COL_RPM, where), COL_RPM, where),
            parseNumber(field(fields, columns, COL_ACTUAL, where), COL_ACTUAL, where),
            parseNumber(field(fields, columns, COL_RATED, where), COL_RATED, where),
            parseCount(field(fields, columns, COL_PRODUCTION, where), COL_PRODUCTION, where));
    }

    Logger::getInstance().debug("DatasetLoader",
        "Parsed " + std::to_string(records.size()) + " machine records from " + source_name);
    return records;
}

std::vector<OperatorRecord> DatasetLoader::parseOperatorRecords(std::istream& input, const std::string& source_name) {
    const ColumnIndex columns = readHeader(input, operatorColumns(), source_name);

    std::vector<OperatorRecord> records;
    std::string line;
    std::size_t line_number = 1;
    while (std::getline(input, line)) {
        ++line_number;
        if (isBlank(line)) continue;

        const std::string where = location(source_name, line_number);
        const std::vector<std::string> fields = splitCsvLine(line);

        const std::string name = trim(field(fields, columns, COL_OPERATOR, where));
        if (name.empty()) {
            throw InvalidRecordException("DatasetLoader", where + ": missing operator name");
        }

        const std::string& machine = field(fields, columns, COL_MACHINE, where);
        if (trim(machine).empty()) {
            throw InvalidRecordException("DatasetLoader", where + ": missing machine number");
        }

        const std::string& shift_text = field(fields, columns, COL_SHIFT, where);
        const std::optional<Shift> shift = parseShift(shift_text);
        if (!shift) {
            throw InvalidRecordException("DatasetLoader", where + ": unknown shift '" + trim(shift_text) + "'");
        }

        records.emplace_back(
            parseDate(field(fields, columns, COL_DATE, where), where),
            name,
            parseIdentifier(machine),
            *shift,
            parseCount(field(fields, columns, COL_PRODUCTION, where), COL_PRODUCTION, where));
    }

    Logger::getInstance().debug("DatasetLoader",
        "Parsed " + std::to_string(records.size()) + " operator records from " + source_name);
    return records;
}

std::vector<MachineRecord> DatasetLoader::loadMachineRecords(const std::string& path) {
    std::ifstream file = openFile(path);
    return parseMachineRecords(file, path);
}

std::vector<OperatorRecord> DatasetLoader::loadOperatorRecords(const std::string& path) {
    std::ifstream file = openFile(path);
    return parseOperatorRecords(file, path);
}

EntityStore DatasetLoader::loadStore(const std::string& machines_path, const std::string& operators_path) {
    Logger& logger = Logger::getInstance();
    logger.info("DatasetLoader", "Loading machine data from " + machines_path);
    std::vector<MachineRecord> machines = loadMachineRecords(machines_path);
    logger.info("DatasetLoader", "Loading operator data from " + operators_path);
    std::vector<OperatorRecord> operators = loadOperatorRecords(operators_path);
    return EntityStore(std::move(machines), std::move(operators));
}

} // namespace prodintel
