#pragma once

#include <cstddef>
#include <fstream>
#include <string>
#include <vector>

namespace spotmap {

// Comma separated text, first record is the header:
//
//   - fields may be wrapped in double quotes; "" inside quotes is a literal quote
//   - quoted fields may contain commas and line breaks
//   - CRLF and LF line endings are both accepted
//   - blank lines between records are skipped
//   - a UTF-8 byte-order mark before the header is dropped
//
// Writing quotes a field only when it needs it.

/* Whole file in memory. */
struct CsvTable {
    std::vector<std::string>              header;
    std::vector<std::vector<std::string>> rows;   // padded to header.size()
    std::vector<std::size_t>              lines;  // source line of each row (1-based)

    /* Index of a header column, or -1. */
    [[nodiscard]] int column(const std::string& name) const;
};

class CsvReader {
public:
    explicit CsvReader(const std::string& path);

    [[nodiscard]] bool ok() const noexcept { return ok_; }

    // Reads the next record into 'out'.
    // Returns false at end of file.
    bool readRecord(std::vector<std::string>& out);

    // Line on which the last record returned by readRecord() started.
    [[nodiscard]] std::size_t line() const noexcept { return recordLine_; }

private:
    std::ifstream ifs_;
    bool ok_{false};
    std::size_t nextLine_{1};
    std::size_t recordLine_{0};
};

class CsvWriter {
public:
    explicit CsvWriter(const std::string& path);

    [[nodiscard]] bool ok() const noexcept { return ok_; }

    bool write(const std::vector<std::string>& fields);

private:
    std::ofstream ofs_;
    bool ok_{false};
};

/* Load a CSV file. Throws Error{FileAccessError} when the file cannot be
   opened, Error{MissingColumn} when it has no header record. */
CsvTable readCsv(const std::string& path);

/* Write header and rows. Throws Error{FileAccessError}. */
void writeCsv(const std::string& path, const CsvTable& table);

/* Shortest text that reads back to the same double; always carries a
   decimal point or exponent ("1.0", "2.25", "1e-07"). */
std::string formatReal(double v);

} // namespace spotmap
