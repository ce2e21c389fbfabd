#pragma once
#include <opencv2/core.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "spotmap/align/AffineSolver.hpp"
#include "spotmap/core/Config.hpp"
#include "spotmap/core/Registry.hpp"
#include "spotmap/io/CsvTable.hpp"

namespace spotmap {

/** Recoordination parameters. */
struct RecoordinateOptions {
    InstrumentColumns columns{};   // header names of the instrument file
    cv::Size image_size{};         // destination image; width drives the x inversion
};

/** Outcome of one recoordination run. */
struct RecoordinationResult {
    AffineTransform transform;            // instrument frame (x inverted) -> image pixels
    std::vector<Point> points;            // inserted into the registry, file order
    std::size_t rows{0};                  // data rows in the file
    std::size_t reference_rows{0};        // rows flagged as reference marks
    std::size_t skipped{0};               // rows that could not be used
    std::size_t out_of_bounds{0};         // inserted points outside the image
    std::vector<std::string> messages;    // one line per skipped row
    std::string report;                   // short text log

    // kept for writeRecoordinatedCsv()
    CsvTable source;
    std::vector<std::optional<cv::Point>> mapped;   // per source row, nullopt = unusable
};

/**
 * Map the target rows of an instrument file into the current image.
 *
 * Sources are the first three reference rows of the file (file order),
 * destinations the first three RefMark points of 'registry' (insertion
 * order). Pairing is purely positional.
 *
 * New points are labelled Spot, take the rest of their metadata from
 * 'settings' and their id from the instrument id column, and are appended
 * to 'registry'. A row whose mapped position does not fit in int pixels is
 * skipped.
 *
 * Throws Error{InsufficientReferencePoints | FileAccessError | MissingColumn |
 * DegenerateReferenceSet}, and Error{MalformedRow} when target rows exist
 * but none could be inserted. The registry is untouched on every throw.
 */
RecoordinationResult recoordinate(const std::string& instrumentCsv,
                                  const PointSettings& settings,
                                  const RecoordinateOptions& opt,
                                  PointRegistry& registry);

/**
 * Write the instrument file back with every usable row's coordinates
 * replaced by its recoordinated position (x in the instrument's top-right
 * convention again). Unusable rows are copied unchanged.
 * Throws Error{FileAccessError}.
 */
void writeRecoordinatedCsv(const std::string& path,
                           const RecoordinationResult& result,
                           const RecoordinateOptions& opt);

} // namespace spotmap
