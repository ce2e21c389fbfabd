#include "spotmap/io/RowCodec.hpp"
#include "spotmap/io/CsvTable.hpp"
#include "spotmap/core/Error.hpp"

#include <charconv>
#include <cmath>
#include <cstdio>
#include <initializer_list>
#include <limits>
#include <system_error>

namespace spotmap {

namespace {

std::string_view trim(std::string_view s)
{
    const char* ws = " \t";
    auto b = s.find_first_not_of(ws);
    if (b == std::string_view::npos) return {};
    auto e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

bool parseInt(std::string_view text, int& out)
{
    text = trim(text);
    if (!text.empty() && text.front() == '+') text.remove_prefix(1);
    if (text.empty()) return false;
    auto res = std::from_chars(text.data(), text.data() + text.size(), out);
    return res.ec == std::errc{} && res.ptr == text.data() + text.size();
}

bool parseReal(std::string_view text, double& out)
{
    text = trim(text);
    if (!text.empty() && text.front() == '+') text.remove_prefix(1);
    if (text.empty()) return false;
    auto res = std::from_chars(text.data(), text.data() + text.size(), out);
    return res.ec == std::errc{} && res.ptr == text.data() + text.size() && std::isfinite(out);
}

// Integer pixel / size field; real input is rounded half away from zero.
bool parsePixel(std::string_view text, int& out)
{
    double v = 0.0;
    if (!parseReal(text, v)) return false;
    if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) return false;
    out = static_cast<int>(std::lround(v));
    return true;
}

int findColumn(const std::vector<std::string>& header,
               std::initializer_list<std::string_view> names)
{
    for (auto n : names)
        for (std::size_t i = 0; i < header.size(); ++i)
            if (trim(header[i]) == n) return static_cast<int>(i);
    return -1;
}

const std::string& cell(const std::vector<std::string>& cells, int idx)
{
    static const std::string empty;
    if (idx < 0 || static_cast<std::size_t>(idx) >= cells.size()) return empty;
    return cells[static_cast<std::size_t>(idx)];
}

[[noreturn]] void malformed(const std::string& what)
{
    throw Error(ErrorKind::MalformedRow, what);
}

} // namespace

const std::vector<std::string>& nativeHeader()
{
    static const std::vector<std::string> h{
        "Name", "label", "x", "y", "diameter", "scale", "colour",
        "mount_name", "material", "notes"};
    return h;
}

std::string joinName(const std::string& sample, int id)
{
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%03d", id);
    return sample + "_#" + buf;
}

void splitName(std::string_view name, std::string& sample, std::string& id)
{
    auto pos = name.rfind("_#");
    if (pos == std::string_view::npos) {
        sample.clear();
        id.assign(name);
        return;
    }
    sample.assign(name.substr(0, pos));
    id.assign(name.substr(pos + 2));
}

RowCodec::RowCodec(Dialect dialect, PointSettings defaults)
    : dialect_(std::move(dialect)), defaults_(std::move(defaults)) {}

std::vector<std::string> RowCodec::exportHeader(const std::vector<std::string>& sourceHeader) const
{
    if (std::holds_alternative<NativeDialect>(dialect_)) return nativeHeader();
    return sourceHeader;
}

void RowCodec::bind(const std::vector<std::string>& header)
{
    col_ = Columns{};

    if (const auto* inst = std::get_if<InstrumentDialect>(&dialect_)) {
        const InstrumentColumns& c = inst->columns;
        col_.id    = findColumn(header, {c.id});
        col_.x     = findColumn(header, {c.x});
        col_.y     = findColumn(header, {c.y});
        col_.label = findColumn(header, {c.label});

        std::string missing;
        if (col_.id < 0)    missing += " '" + c.id + "'";
        if (col_.x < 0)     missing += " '" + c.x + "'";
        if (col_.y < 0)     missing += " '" + c.y + "'";
        if (col_.label < 0) missing += " '" + c.label + "'";
        if (!missing.empty())
            throw Error(ErrorKind::MissingColumn, "missing required header(s):" + missing);
    } else {
        // laser software spells a few columns differently; accept both
        col_.name     = findColumn(header, {"Name"});
        col_.label    = findColumn(header, {"label", "Type"});
        col_.x        = findColumn(header, {"x", "X"});
        col_.y        = findColumn(header, {"y", "Y"});
        col_.diameter = findColumn(header, {"diameter"});
        col_.scale    = findColumn(header, {"scale"});
        col_.colour   = findColumn(header, {"colour"});
        col_.sample   = findColumn(header, {"sample_name"});
        col_.mount    = findColumn(header, {"mount_name"});
        col_.material = findColumn(header, {"material"});
        col_.notes    = findColumn(header, {"notes"});

        if (col_.x < 0 || col_.y < 0)
            throw Error(ErrorKind::MissingColumn, "missing required header(s): 'x' and 'y'");
    }
    bound_ = true;
}

DecodedRow RowCodec::decode(const std::vector<std::string>& cells) const
{
    if (!bound_) throw Error(ErrorKind::MissingColumn, "RowCodec::decode before bind()");

    if (const auto* inst = std::get_if<InstrumentDialect>(&dialect_))
        return decodeInstrument(*inst, cells);
    return decodeNative(cells);
}

Point RowCodec::decodeNative(const std::vector<std::string>& cells) const
{
    Point p = defaults_.makePoint(0, 0);

    if (!parsePixel(cell(cells, col_.x), p.x))
        malformed("x value '" + cell(cells, col_.x) + "' is not a number");
    if (!parsePixel(cell(cells, col_.y), p.y))
        malformed("y value '" + cell(cells, col_.y) + "' is not a number");

    const std::string_view name = trim(cell(cells, col_.name));
    if (!name.empty()) {
        std::string sample, id;
        splitName(name, sample, id);
        if (name.find("_#") != std::string_view::npos) p.sample_name = sample;
        else if (col_.sample >= 0) p.sample_name = cell(cells, col_.sample);
        if (!trim(id).empty() && (!parseInt(id, p.id) || p.id <= 0))
            malformed("id '" + id + "' in Name column is not a positive integer");
    } else if (col_.sample >= 0) {
        p.sample_name = cell(cells, col_.sample);
    }

    if (col_.label >= 0 && !trim(cell(cells, col_.label)).empty())
        p.label = parseLabel(trim(cell(cells, col_.label)));

    const std::string& dia = cell(cells, col_.diameter);
    if (col_.diameter >= 0 && !trim(dia).empty()) {
        if (!parsePixel(dia, p.diameter)) malformed("diameter value '" + dia + "' is not a number");
    }
    if (p.diameter <= 0) malformed("diameter must be positive");

    const std::string& sc = cell(cells, col_.scale);
    if (col_.scale >= 0 && !trim(sc).empty()) {
        if (!parseReal(sc, p.scale)) malformed("scale value '" + sc + "' is not a number");
    }
    if (!(p.scale > 0.0)) malformed("scale must be positive");

    if (col_.colour >= 0 && !trim(cell(cells, col_.colour)).empty())
        p.colour = std::string(trim(cell(cells, col_.colour)));

    // present-but-empty free text stays empty
    if (col_.mount >= 0)    p.mount_name = cell(cells, col_.mount);
    if (col_.material >= 0) p.material   = cell(cells, col_.material);
    if (col_.notes >= 0)    p.notes      = cell(cells, col_.notes);
    return p;
}

InstrumentRow RowCodec::decodeInstrument(const InstrumentDialect& d,
                                         const std::vector<std::string>& cells) const
{
    InstrumentRow r;
    r.reference = trim(cell(cells, col_.label)) == trim(d.columns.reference_value);

    double x = 0.0, y = 0.0;
    if (!parseReal(cell(cells, col_.x), x))
        malformed("'" + d.columns.x + "' value '" + cell(cells, col_.x) + "' is not a number");
    if (!parseReal(cell(cells, col_.y), y))
        malformed("'" + d.columns.y + "' value '" + cell(cells, col_.y) + "' is not a number");
    r.position = cv::Point2d(invertX(x, d.image_width), y);

    int id = 0;
    const std::string& idText = cell(cells, col_.id);
    if (parseInt(idText, id) && id > 0) {
        r.id = id;
    } else if (!r.reference) {
        malformed("'" + d.columns.id + "' value '" + idText + "' is not a positive integer");
    }
    return r;
}

std::vector<std::string> RowCodec::encode(const Point& p, const std::vector<std::string>& source) const
{
    if (const auto* inst = std::get_if<InstrumentDialect>(&dialect_)) {
        std::vector<std::string> row = source;
        auto put = [&row](int idx, std::string v) {
            if (idx < 0) return;
            if (static_cast<std::size_t>(idx) >= row.size()) row.resize(static_cast<std::size_t>(idx) + 1);
            row[static_cast<std::size_t>(idx)] = std::move(v);
        };
        put(col_.x, std::to_string(static_cast<int>(std::lround(invertX(p.x, inst->image_width)))));
        put(col_.y, std::to_string(p.y));
        if (p.id > 0) put(col_.id, std::to_string(p.id));
        return row;
    }

    return {
        joinName(p.sample_name, p.id),
        labelName(p.label),
        std::to_string(p.x),
        std::to_string(p.y),
        std::to_string(p.diameter),
        formatReal(p.scale),
        p.colour,
        p.mount_name,
        p.material,
        p.notes,
    };
}

} // namespace spotmap
