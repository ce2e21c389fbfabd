// src/spotmap/cli/mode_scale.cpp
#include "modes.hpp"
#include "args.hpp"

#include "spotmap/core/Scale.hpp"

#include <cstdio>
#include <iostream>
#include <string>

// "x,y" -> point; false on anything else
static bool parse_xy(const std::string& s, cv::Point2d& out) {
    double x = 0, y = 0;
    char tail = 0;
    if (std::sscanf(s.c_str(), "%lf,%lf%c", &x, &y, &tail) != 2) return false;
    out = {x, y};
    return true;
}

int run_scale(int argc, char** argv)
{
    double pixels = argValueDouble(argc, argv, "pixels", 0.0);
    const std::string from = argValue(argc, argv, "from", "");
    const std::string to   = argValue(argc, argv, "to", "");
    if (!from.empty() || !to.empty()) {
        cv::Point2d a, b;
        if (!parse_xy(from, a) || !parse_xy(to, b)) {
            std::cerr << "[scale] --from and --to take x,y\n";
            return 1;
        }
        pixels = spotmap::pixelDistance(a, b);
    }
    const double microns = argValueDouble(argc, argv, "microns", 0.0);

    const double ratio = spotmap::pixelsPerMicron(pixels, microns);
    std::cout << "[scale] " << pixels << " px / " << microns << " um = "
              << ratio << " px/um\n";
    return 0;
}
