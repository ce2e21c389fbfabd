#include "utils.hpp"
#include "args.hpp"

#include "spotmap/core/Error.hpp"

#include <opencv2/imgcodecs.hpp>
#include <iostream>

spotmap::PointSettings settingsFromArgs(int argc, char** argv)
{
    spotmap::PointSettings s;
    s.sample_name = argValue(argc, argv, "sample",   s.sample_name);
    s.mount_name  = argValue(argc, argv, "mount",    s.mount_name);
    s.material    = argValue(argc, argv, "material", s.material);
    s.notes       = argValue(argc, argv, "notes",    s.notes);
    s.colour      = argValue(argc, argv, "colour",   s.colour);
    s.diameter    = argValueInt   (argc, argv, "diameter", s.diameter);
    s.scale       = argValueDouble(argc, argv, "scale",    s.scale);
    const std::string label = argValue(argc, argv, "label", "");
    if (!label.empty()) s.label = spotmap::parseLabel(label);
    return s;
}

spotmap::InstrumentColumns columnsFromArgs(int argc, char** argv)
{
    spotmap::InstrumentColumns c;
    c.id              = argValue(argc, argv, "id-col",    c.id);
    c.x               = argValue(argc, argv, "x-col",     c.x);
    c.y               = argValue(argc, argv, "y-col",     c.y);
    c.label           = argValue(argc, argv, "label-col", c.label);
    c.reference_value = argValue(argc, argv, "ref-value", c.reference_value);
    return c;
}

void print_messages(const std::vector<std::string>& messages, const char* tag)
{
    for (const auto& m : messages)
        std::cerr << "[" << tag << "] skipped " << m << "\n";
}

bool load_points(int argc, char** argv, const spotmap::PointSettings& settings,
                 spotmap::PointRegistry& registry, const char* tag)
{
    const std::string path = argValue(argc, argv, "points", "");
    if (path.empty()) {
        std::cerr << "[" << tag << "] --points=<file.csv> is required\n";
        return false;
    }
    const spotmap::ImportReport rep = spotmap::loadPointsCsv(path, settings, registry);
    print_messages(rep.messages, tag);
    std::cout << "[" << tag << "] " << path << ": " << rep.points.size() << " of "
              << rep.rows << " rows loaded\n";
    return true;
}

void save_points(const spotmap::PointRegistry& registry,
                 const spotmap::PointSettings& settings,
                 const std::string& path, const char* tag)
{
    for (const auto& w : spotmap::exportWarnings(registry, settings))
        std::cerr << "[" << tag << "] warning: " << w << "\n";
    spotmap::writePointsCsv(path, registry.points());
    std::cout << "[" << tag << "] " << registry.size() << " points saved to " << path << "\n";
}

cv::Mat load_image(const std::string& path)
{
    cv::Mat img = cv::imread(path, cv::IMREAD_COLOR);
    if (img.empty())
        throw spotmap::Error(spotmap::ErrorKind::FileAccessError, "cannot read image '" + path + "'");
    return img;
}
