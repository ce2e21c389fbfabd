#include "spotmap/io/PointsFile.hpp"
#include "spotmap/io/CsvTable.hpp"
#include "spotmap/io/RowCodec.hpp"
#include "spotmap/core/Error.hpp"

namespace spotmap {

static std::string rowPrefix(std::size_t line)
{
    return "row at line " + std::to_string(line) + ": ";
}

ImportReport readPointsCsv(const std::string& path, const PointSettings& settings)
{
    const CsvTable table = readCsv(path);

    RowCodec codec(NativeDialect{}, settings);
    codec.bind(table.header);

    ImportReport rep;
    rep.rows = table.rows.size();
    rep.points.reserve(table.rows.size());

    for (std::size_t i = 0; i < table.rows.size(); ++i) {
        try {
            rep.points.push_back(std::get<Point>(codec.decode(table.rows[i])));
        } catch (const Error& e) {
            ++rep.skipped;
            rep.messages.push_back(rowPrefix(table.lines[i]) + e.what());
        }
    }

    if (rep.rows > 0 && rep.points.empty())
        throw Error(ErrorKind::MalformedRow,
                    "none of the " + std::to_string(rep.rows) + " rows in '" + path + "' could be read");
    return rep;
}

ImportReport loadPointsCsv(const std::string& path, const PointSettings& settings,
                           PointRegistry& registry)
{
    ImportReport rep = readPointsCsv(path, settings);

    PointRegistry staged = registry;
    std::vector<Point> accepted;
    accepted.reserve(rep.points.size());

    for (auto& p : rep.points) {
        try {
            accepted.push_back(staged.add(p));
        } catch (const Error& e) {
            ++rep.skipped;
            rep.messages.push_back(std::string("point '") + joinName(p.sample_name, p.id) + "': " + e.what());
        }
    }

    if (rep.rows > 0 && accepted.empty())
        throw Error(ErrorKind::MalformedRow,
                    "none of the " + std::to_string(rep.rows) + " rows in '" + path + "' could be added");

    rep.points = std::move(accepted);
    registry = std::move(staged);
    return rep;
}

void writePointsCsv(const std::string& path, const std::vector<Point>& points)
{
    RowCodec codec(NativeDialect{}, PointSettings{});

    CsvTable table;
    table.header = codec.exportHeader();
    table.rows.reserve(points.size());
    for (const auto& p : points) table.rows.push_back(codec.encode(p));

    writeCsv(path, table);
}

} // namespace spotmap
