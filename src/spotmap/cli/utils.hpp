#pragma once
#include <opencv2/core.hpp>
#include <string>
#include <vector>

#include "spotmap/core/Config.hpp"
#include "spotmap/core/Registry.hpp"
#include "spotmap/io/PointsFile.hpp"

/*
  Shared pieces of the CLI modes: settings from flags, loading and saving
  with log lines. Logging goes to std::cout, warnings to std::cerr.
*/

/* PointSettings from --sample --mount --material --notes --colour --label
   --diameter --scale. Unset flags keep the defaults.
   Throws spotmap::Error{InvalidLabel} for a bad --label. */
spotmap::PointSettings settingsFromArgs(int argc, char** argv);

/* InstrumentColumns from --id-col --x-col --y-col --label-col --ref-value. */
spotmap::InstrumentColumns columnsFromArgs(int argc, char** argv);

/* Load --points into 'registry' and print the import report under 'tag'.
   Returns false (with a message) when --points is missing. */
bool load_points(int argc, char** argv, const spotmap::PointSettings& settings,
                 spotmap::PointRegistry& registry, const char* tag);

/* Print export warnings, then write the registry to 'path'. */
void save_points(const spotmap::PointRegistry& registry,
                 const spotmap::PointSettings& settings,
                 const std::string& path, const char* tag);

/* Print skipped-row messages of a batch on stderr. */
void print_messages(const std::vector<std::string>& messages, const char* tag);

/* Read an image for rendering or for its size. Throws spotmap::Error{FileAccessError}. */
cv::Mat load_image(const std::string& path);
