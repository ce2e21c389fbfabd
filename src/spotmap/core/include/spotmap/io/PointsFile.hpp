#pragma once

#include "spotmap/core/Config.hpp"
#include "spotmap/core/Point.hpp"
#include "spotmap/core/Registry.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace spotmap {

/* Outcome of a batch import. Rows that failed are counted, not fatal. */
struct ImportReport {
    std::vector<Point>       points;    // accepted points, file order
    std::size_t              rows{0};   // data rows seen
    std::size_t              skipped{0};
    std::vector<std::string> messages;  // one line per skipped row
};

/* Decode a native points file. Missing fields take 'settings'.
   Throws Error{FileAccessError | MissingColumn}, and Error{MalformedRow}
   when the file has rows but none of them decodes. */
ImportReport readPointsCsv(const std::string& path, const PointSettings& settings);

/* readPointsCsv() then add every point to 'registry'.
   Points whose id is already taken are skipped and reported.
   On any exception the registry is left as it was. */
ImportReport loadPointsCsv(const std::string& path, const PointSettings& settings,
                           PointRegistry& registry);

/* Write points in the native dialect, registry order.
   Throws Error{FileAccessError}. */
void writePointsCsv(const std::string& path, const std::vector<Point>& points);

} // namespace spotmap
