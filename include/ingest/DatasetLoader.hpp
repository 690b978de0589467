#ifndef DATASET_LOADER_HPP
#define DATASET_LOADER_HPP

#include "analytics/EntityStore.hpp"
#include "analytics/Records.hpp"
#include <istream>
#include <map>
#include <string>
#include <vector>

namespace prodintel {

/**
 * @brief Reads the machine and operator CSV tables into records
 *
 * Header names are normalized once (trimmed, each word title-cased) so that
 * "machine number " and "Machine Number" address the same column. The loader
 * is the only component that touches the raw tables.
 */
class DatasetLoader {
public:
    static const std::vector<std::string>& machineColumns();
    static const std::vector<std::string>& operatorColumns();

    /**
     * @brief Trim a header name and upper-case the first letter of every word
     *
     * A word starts after any non-letter, so "100% efficiency" becomes
     * "100% Efficiency" and "shift (day/night)" becomes "Shift (Day/Night)".
     */
    static std::string normalizeColumnName(const std::string& name);

    /**
     * @brief Split one CSV line, honouring double-quoted fields
     */
    static std::vector<std::string> splitCsvLine(const std::string& line);

    /**
     * @brief Parse "YYYY-MM-DD", ignoring a trailing time of day
     * @throws InvalidRecordException on malformed input
     */
    static Date parseDate(const std::string& text, const std::string& location);

    /**
     * @brief Parse machine records from a stream
     * @param input CSV content with a header row
     * @param source_name Name used in error messages (usually the file path)
     * @throws DataFormatException if a required column is missing
     * @throws InvalidRecordException if a row cannot be parsed
     */
    static std::vector<MachineRecord> parseMachineRecords(std::istream& input, const std::string& source_name);

    /// @copydoc parseMachineRecords
    static std::vector<OperatorRecord> parseOperatorRecords(std::istream& input, const std::string& source_name);

    /**
     * @throws FileIOException if the file cannot be opened
     */
    static std::vector<MachineRecord> loadMachineRecords(const std::string& path);
    static std::vector<OperatorRecord> loadOperatorRecords(const std::string& path);

    /**
     * @brief Load both tables and build the validated session store
     */
    static EntityStore loadStore(const std::string& machines_path, const std::string& operators_path);

private:
    using ColumnIndex = std::map<std::string, std::size_t>;

    static ColumnIndex readHeader(std::istream& input,
                                  const std::vector<std::string>& required,
                                  const std::string& source_name);
};

} // namespace prodintel

#endif // DATASET_LOADER_HPP
