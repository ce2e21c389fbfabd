#include "spotmap/io/CsvTable.hpp"
#include "spotmap/core/Error.hpp"

#include <charconv>
#include <system_error>

namespace spotmap {

namespace {

bool needsQuotes(const std::string& f)
{
    return f.find_first_of(",\"\r\n") != std::string::npos;
}

// Consume a UTF-8 byte-order mark at the start of the stream, if any.
void skipBom(std::ifstream& in)
{
    if (in.peek() != 0xEF) return;
    char bom[3] = {};
    in.read(bom, 3);
    if (in.gcount() == 3 &&
        static_cast<unsigned char>(bom[1]) == 0xBB &&
        static_cast<unsigned char>(bom[2]) == 0xBF) return;
    in.clear();
    in.seekg(0);
}

} // namespace

int CsvTable::column(const std::string& name) const
{
    for (std::size_t i = 0; i < header.size(); ++i)
        if (header[i] == name) return static_cast<int>(i);
    return -1;
}

//---------------- CsvReader ----------------

CsvReader::CsvReader(const std::string& path)
    : ifs_(path, std::ios::binary)
{
    ok_ = static_cast<bool>(ifs_);
    if (ok_) skipBom(ifs_);
}

bool CsvReader::readRecord(std::vector<std::string>& out)
{
    if (!ok_) return false;
    out.clear();

    std::string field;
    bool inQuotes   = false;
    bool quotedOnce = false;   // field started with a quote
    bool any        = false;   // consumed at least one char of this record
    recordLine_ = nextLine_;

    char c;
    while (ifs_.get(c)) {
        if (inQuotes) {
            if (c == '"') {
                if (ifs_.peek() == '"') { ifs_.get(c); field.push_back('"'); }
                else inQuotes = false;
            } else {
                if (c == '\n') ++nextLine_;
                field.push_back(c);
            }
            continue;
        }

        if (c == '\r') continue;
        if (c == '\n') {
            ++nextLine_;
            if (!any) { recordLine_ = nextLine_; continue; }   // blank line
            out.push_back(std::move(field));
            return true;
        }

        any = true;
        if (c == '"' && field.empty() && !quotedOnce) {
            inQuotes = quotedOnce = true;
        } else if (c == ',') {
            out.push_back(std::move(field));
            field.clear();
            quotedOnce = false;
        } else {
            field.push_back(c);
        }
    }

    // last record without a trailing newline
    if (!any) return false;
    out.push_back(std::move(field));
    return true;
}

//---------------- CsvWriter ----------------

CsvWriter::CsvWriter(const std::string& path)
    : ofs_(path, std::ios::binary | std::ios::trunc)
{
    ok_ = static_cast<bool>(ofs_);
}

bool CsvWriter::write(const std::vector<std::string>& fields)
{
    if (!ok_) return false;

    for (std::size_t i = 0; i < fields.size(); ++i) {
        if (i) ofs_ << ',';
        const std::string& f = fields[i];
        if (!needsQuotes(f)) { ofs_ << f; continue; }

        ofs_ << '"';
        for (char c : f) {
            if (c == '"') ofs_ << '"';
            ofs_ << c;
        }
        ofs_ << '"';
    }
    ofs_ << "\r\n";

    ok_ = static_cast<bool>(ofs_);
    return ok_;
}

//---------------- helpers ----------------

CsvTable readCsv(const std::string& path)
{
    CsvReader reader(path);
    if (!reader.ok())
        throw Error(ErrorKind::FileAccessError, "cannot open '" + path + "' for reading");

    CsvTable table;
    if (!reader.readRecord(table.header))
        throw Error(ErrorKind::MissingColumn, "'" + path + "' has no header row");

    std::vector<std::string> rec;
    while (reader.readRecord(rec)) {
        if (rec.size() < table.header.size()) rec.resize(table.header.size());
        table.rows.push_back(rec);
        table.lines.push_back(reader.line());
    }
    return table;
}

void writeCsv(const std::string& path, const CsvTable& table)
{
    CsvWriter writer(path);
    if (!writer.ok())
        throw Error(ErrorKind::FileAccessError, "cannot open '" + path + "' for writing");

    bool ok = writer.write(table.header);
    for (const auto& row : table.rows) {
        if (!ok) break;
        ok = writer.write(row);
    }
    if (!ok)
        throw Error(ErrorKind::FileAccessError, "failed while writing '" + path + "'");
}

std::string formatReal(double v)
{
    char buf[64];
    auto res = std::to_chars(buf, buf + sizeof(buf), v);
    if (res.ec != std::errc{}) return std::to_string(v);

    std::string s(buf, res.ptr);
    if (s.find_first_of(".eEn") == std::string::npos) s += ".0";   // 'n' covers inf/nan
    return s;
}

} // namespace spotmap
