// src/spotmap/cli/mode_points.cpp
#include "modes.hpp"
#include "args.hpp"
#include "utils.hpp"

#include "spotmap/core/Registry.hpp"

#include <iomanip>
#include <iostream>
#include <string>

// ---------------- summary ----------------

int run_summary(int argc, char** argv)
{
    const spotmap::PointSettings settings = settingsFromArgs(argc, argv);
    spotmap::PointRegistry registry;
    if (!load_points(argc, argv, settings, registry, "summary")) return 1;

    std::size_t refs = 0;
    std::cout << std::left
              << std::setw(6)  << "id"
              << std::setw(9)  << "label"
              << std::setw(8)  << "x"
              << std::setw(8)  << "y"
              << std::setw(10) << "diameter"
              << std::setw(8)  << "scale"
              << "sample\n";
    for (const auto& p : registry.points()) {
        if (p.isReference()) ++refs;
        std::cout << std::setw(6)  << p.id
                  << std::setw(9)  << spotmap::labelName(p.label)
                  << std::setw(8)  << p.x
                  << std::setw(8)  << p.y
                  << std::setw(10) << p.diameter
                  << std::setw(8)  << p.scale
                  << p.sample_name << "\n";
    }
    std::cout << "[summary] " << registry.size() << " points, " << refs
              << " reference marks, next id " << registry.nextId() << "\n";

    for (const auto& w : spotmap::exportWarnings(registry, settings))
        std::cerr << "[summary] warning: " << w << "\n";
    return 0;
}

// ---------------- renumber ----------------

int run_renumber(int argc, char** argv)
{
    const spotmap::PointSettings settings = settingsFromArgs(argc, argv);
    spotmap::PointRegistry registry;
    if (!load_points(argc, argv, settings, registry, "renumber")) return 1;

    registry.resetIds();
    std::cout << "[renumber] ids are now 1.." << registry.size() << "\n";

    const std::string out = argValue(argc, argv, "out", argValue(argc, argv, "points"));
    save_points(registry, settings, out, "renumber");
    return 0;
}

// ---------------- remove ----------------

int run_remove(int argc, char** argv)
{
    const spotmap::PointSettings settings = settingsFromArgs(argc, argv);
    spotmap::PointRegistry registry;
    if (!load_points(argc, argv, settings, registry, "remove")) return 1;

    const int id = argValueInt(argc, argv, "id", 0);
    if (id <= 0) {
        std::cerr << "[remove] --id=<positive id> is required\n";
        return 1;
    }
    registry.remove(id);
    std::cout << "[remove] point " << id << " deleted\n";

    const std::string out = argValue(argc, argv, "out", argValue(argc, argv, "points"));
    save_points(registry, settings, out, "remove");
    return 0;
}

// ---------------- edit ----------------

int run_edit(int argc, char** argv)
{
    const spotmap::PointSettings settings = settingsFromArgs(argc, argv);
    spotmap::PointRegistry registry;
    if (!load_points(argc, argv, settings, registry, "edit")) return 1;

    const int id = argValueInt(argc, argv, "id", 0);
    const std::string column = argValue(argc, argv, "column", "");
    if (id <= 0 || column.empty()) {
        std::cerr << "[edit] --id=<positive id> and --column=<name> are required\n";
        return 1;
    }
    const std::string value = argValue(argc, argv, "value", "");
    registry.edit(id, column, value);
    std::cout << "[edit] point " << id << ": " << column << " = '" << value << "'\n";

    const std::string out = argValue(argc, argv, "out", argValue(argc, argv, "points"));
    save_points(registry, settings, out, "edit");
    return 0;
}
