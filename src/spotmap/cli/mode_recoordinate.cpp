// src/spotmap/cli/mode_recoordinate.cpp
#include "modes.hpp"
#include "args.hpp"
#include "utils.hpp"

#include "spotmap/align/Recoordinator.hpp"

#include <iostream>
#include <sstream>
#include <string>

/*
  Recoordination from files:

    --points=refs.csv        session with >= 3 RefMark points (destination side)
    --instrument=report.csv  instrument particle report (source side)
    --image=scan.png         destination image; or --width=W --height=H
    --out=session.csv        registry after insertion (default: --points)
    --instrument-out=f.csv   optional: report with recoordinated coordinates
*/
int run_recoordinate(int argc, char** argv)
{
    const std::string instrument = argValue(argc, argv, "instrument", "");
    if (instrument.empty()) {
        std::cerr << "[recoord] --instrument=<report.csv> is required\n";
        return 1;
    }

    spotmap::RecoordinateOptions opt;
    opt.columns = columnsFromArgs(argc, argv);
    const std::string imagePath = argValue(argc, argv, "image", "");
    if (!imagePath.empty()) {
        opt.image_size = load_image(imagePath).size();
    } else {
        opt.image_size = cv::Size(argValueInt(argc, argv, "width", 0),
                                  argValueInt(argc, argv, "height", 0));
    }
    if (opt.image_size.width <= 0 || opt.image_size.height <= 0) {
        std::cerr << "[recoord] --image=<file> or --width/--height is required\n";
        return 1;
    }

    const spotmap::PointSettings settings = settingsFromArgs(argc, argv);
    spotmap::PointRegistry registry;
    if (!load_points(argc, argv, settings, registry, "recoord")) return 1;

    const spotmap::RecoordinationResult res =
        spotmap::recoordinate(instrument, settings, opt, registry);

    print_messages(res.messages, "recoord");
    std::istringstream lines(res.report);
    for (std::string line; std::getline(lines, line); )
        std::cout << "[recoord] " << line << "\n";
    if (res.out_of_bounds)
        std::cerr << "[recoord] warning: " << res.out_of_bounds
                  << " point(s) outside the image\n";

    const std::string instrumentOut = argValue(argc, argv, "instrument-out", "");
    if (!instrumentOut.empty()) {
        spotmap::writeRecoordinatedCsv(instrumentOut, res, opt);
        std::cout << "[recoord] instrument report written to " << instrumentOut << "\n";
    }

    const std::string out = argValue(argc, argv, "out", argValue(argc, argv, "points"));
    save_points(registry, settings, out, "recoord");
    return 0;
}
