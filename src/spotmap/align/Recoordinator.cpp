#include "spotmap/align/Recoordinator.hpp"
#include "spotmap/core/Error.hpp"
#include "spotmap/io/RowCodec.hpp"
#include <sstream>
#include <string_view>
#include <utility>
#include <variant>

/*
 Recoordination of an instrument particle report.

 Steps:
   1) Check the registry has 3 RefMark points (destination side).
   2) Read the file, decode every row in the instrument dialect
      (x mirrored with the image width). Bad rows are counted and skipped.
   3) First three reference rows in file order -> source triplet.
   4) Fit source -> destination, apply to every decoded row.
   5) Target rows become Points (settings metadata, file id) and are added
      to a staged copy of the registry; the copy replaces the registry only
      when the whole run succeeds.
*/

namespace spotmap {

static std::string rowPrefix(std::size_t line)
{
    return "row at line " + std::to_string(line) + ": ";
}

static std::string_view trimmed(std::string_view s)
{
    const auto b = s.find_first_not_of(" \t");
    if (b == std::string_view::npos) return {};
    return s.substr(b, s.find_last_not_of(" \t") - b + 1);
}

static bool insideImage(const cv::Point& p, const cv::Size& sz)
{
    return p.x >= 0 && p.y >= 0 && p.x <= sz.width && p.y <= sz.height;
}

RecoordinationResult recoordinate(const std::string& instrumentCsv,
                                  const PointSettings& settings,
                                  const RecoordinateOptions& opt,
                                  PointRegistry& registry)
{
    // --- 1) destination side
    const std::vector<Point> refs = registry.referencePoints();
    if (refs.size() < 3)
        throw Error(ErrorKind::InsufficientReferencePoints,
                    std::string("there must be at least 3 points labelled '") + labelName(Label::RefMark)
                    + "', found " + std::to_string(refs.size()));
    const ReferenceTriplet dst = firstThree(refs);

    // --- 2) parse
    RecoordinationResult res;
    res.source = readCsv(instrumentCsv);
    const CsvTable& table = res.source;
    res.rows = table.rows.size();

    RowCodec codec(InstrumentDialect{opt.columns, opt.image_size.width}, settings);
    codec.bind(table.header);

    // a row that fails to decode is still a target unless it is labelled as a reference
    const int labelCol = table.column(opt.columns.label);
    auto labelledReference = [&](const std::vector<std::string>& row) {
        return labelCol >= 0 &&
               trimmed(row[(std::size_t)labelCol]) == trimmed(opt.columns.reference_value);
    };

    std::vector<std::optional<InstrumentRow>> decoded(table.rows.size());
    std::vector<cv::Point2d> srcRefs;
    std::size_t targets = 0;
    for (std::size_t i = 0; i < table.rows.size(); ++i) {
        try {
            decoded[i] = std::get<InstrumentRow>(codec.decode(table.rows[i]));
        } catch (const Error& e) {
            ++res.skipped;
            if (!labelledReference(table.rows[i])) ++targets;
            res.messages.push_back(rowPrefix(table.lines[i]) + e.what());
            continue;
        }
        if (decoded[i]->reference) {
            ++res.reference_rows;
            srcRefs.push_back(decoded[i]->position);
        } else {
            ++targets;
        }
    }

    // --- 3) + 4) fit
    if (srcRefs.size() < 3)
        throw Error(ErrorKind::InsufficientReferencePoints,
                    "'" + instrumentCsv + "' has " + std::to_string(srcRefs.size())
                    + " usable reference rows ('" + opt.columns.label + "' = '"
                    + opt.columns.reference_value + "'), 3 are needed");
    res.transform = fitAffine(firstThree(srcRefs), dst);

    // --- 5) apply, stage
    PointRegistry staged = registry;
    res.mapped.assign(table.rows.size(), std::nullopt);

    for (std::size_t i = 0; i < decoded.size(); ++i) {
        if (!decoded[i]) continue;
        const InstrumentRow& row = *decoded[i];
        try {
            const cv::Point q = applyAffine(res.transform, row.position);
            res.mapped[i] = q;
            if (row.reference) continue;

            // targets are always Spots; the rest of the metadata follows the settings
            Point p = settings.makePoint(q.x, q.y);
            p.label = Label::Spot;
            p.id = *row.id;
            res.points.push_back(staged.add(p));
            if (!insideImage(q, opt.image_size)) ++res.out_of_bounds;
        } catch (const Error& e) {
            ++res.skipped;
            res.mapped[i].reset();
            res.messages.push_back(rowPrefix(table.lines[i]) + e.what());
        }
    }

    if (targets > 0 && res.points.empty())
        throw Error(ErrorKind::MalformedRow,
                    "none of the " + std::to_string(targets) + " target rows in '"
                    + instrumentCsv + "' could be recoordinated");

    registry = std::move(staged);

    std::ostringstream rep;
    const cv::Matx23d& m = res.transform.m;
    rep << "transform [" << m(0,0) << " " << m(0,1) << " " << m(0,2) << "; "
        << m(1,0) << " " << m(1,1) << " " << m(1,2) << "]\n";
    rep << "rows=" << res.rows << " references=" << res.reference_rows
        << " inserted=" << res.points.size() << " skipped=" << res.skipped << "\n";
    if (res.out_of_bounds)
        rep << res.out_of_bounds << " recoordinated point(s) fall outside the "
            << opt.image_size.width << "x" << opt.image_size.height << " image\n";
    res.report = rep.str();
    return res;
}

void writeRecoordinatedCsv(const std::string& path,
                           const RecoordinationResult& result,
                           const RecoordinateOptions& opt)
{
    RowCodec codec(InstrumentDialect{opt.columns, opt.image_size.width}, PointSettings{});
    codec.bind(result.source.header);

    CsvTable out;
    out.header = codec.exportHeader(result.source.header);
    out.rows.reserve(result.source.rows.size());

    for (std::size_t i = 0; i < result.source.rows.size(); ++i) {
        const auto& row = result.source.rows[i];
        if (i >= result.mapped.size() || !result.mapped[i]) {
            out.rows.push_back(row);
            continue;
        }
        Point p;                       // id 0: keep the file's id cell
        p.x = result.mapped[i]->x;
        p.y = result.mapped[i]->y;
        out.rows.push_back(codec.encode(p, row));
    }
    writeCsv(path, out);
}

} // namespace spotmap
