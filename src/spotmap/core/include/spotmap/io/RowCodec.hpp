#pragma once

#include "spotmap/core/Config.hpp"
#include "spotmap/core/Point.hpp"

#include <opencv2/core.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace spotmap {

/* Full-fidelity points file written and read by this tool. */
struct NativeDialect {};

/* Partial particle report of the instrument software.
   x is measured from the top-right corner, so decoding needs the width of
   the image the points are mapped onto. */
struct InstrumentDialect {
    InstrumentColumns columns{};
    int image_width{0};
};

using Dialect = std::variant<NativeDialect, InstrumentDialect>;

/* One decoded instrument row. position is already in top-left convention. */
struct InstrumentRow {
    std::optional<int> id;     // absent on most reference rows
    bool reference{false};
    cv::Point2d position{};
};

using DecodedRow = std::variant<Point, InstrumentRow>;

/// Native export header, in order.
const std::vector<std::string>& nativeHeader();

/// Mirror an x coordinate between top-right and top-left origin.
[[nodiscard]] constexpr double invertX(double x, double width) noexcept { return width - x; }

/// "<sample>_#<id>", id padded to at least three digits.
std::string joinName(const std::string& sample, int id);

/// Split a Name cell on its last "_#". 'id' stays empty when there is none.
void splitName(std::string_view name, std::string& sample, std::string& id);

/*
  Row <-> field mapping for both dialects behind one interface.

  Usage:
    RowCodec codec(NativeDialect{}, settings);
    codec.bind(table.header);                 // resolve column positions
    DecodedRow r = codec.decode(table.rows[i]);

  decode() throws Error{MalformedRow} for non-numeric required fields and
  Error{InvalidLabel} for an unknown label; bind() throws Error{MissingColumn}.
*/
class RowCodec {
public:
    RowCodec(Dialect dialect, PointSettings defaults);

    [[nodiscard]] const Dialect& dialect() const noexcept { return dialect_; }
    [[nodiscard]] const PointSettings& defaults() const noexcept { return defaults_; }

    /// Header written by encode(). The instrument dialect keeps the source header.
    [[nodiscard]] std::vector<std::string>
    exportHeader(const std::vector<std::string>& sourceHeader = {}) const;

    void bind(const std::vector<std::string>& header);

    [[nodiscard]] DecodedRow decode(const std::vector<std::string>& cells) const;

    /// Native: one full row per point, 'source' unused.
    /// Instrument: copy of 'source' with id / x / y replaced (x mapped back
    /// to the top-right convention).
    [[nodiscard]] std::vector<std::string>
    encode(const Point& p, const std::vector<std::string>& source = {}) const;

private:
    Dialect       dialect_;
    PointSettings defaults_;

    // column positions, -1 = absent
    struct Columns {
        int name{-1}, label{-1}, x{-1}, y{-1}, diameter{-1}, scale{-1}, colour{-1};
        int sample{-1}, mount{-1}, material{-1}, notes{-1};
        int id{-1};
    } col_;
    bool bound_{false};

    Point         decodeNative(const std::vector<std::string>& cells) const;
    InstrumentRow decodeInstrument(const InstrumentDialect& d,
                                   const std::vector<std::string>& cells) const;
};

} // namespace spotmap
