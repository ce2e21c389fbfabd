#include "modes.hpp"

#include "spotmap/core/Error.hpp"

#include <iostream>
#include <string>

#ifndef SPOTMAP_VERSION
#define SPOTMAP_VERSION "0.0.0"
#endif

/*
  CLI entry point.

  Modes:
    - summary      : list a points file and its export warnings.
    - renumber     : reset ids to 1..N.
    - remove       : delete a point.
    - edit         : change one column of a point.
    - render       : draw points over an image.
    - recoordinate : import an instrument report through the reference marks.
    - scale        : pixels-per-micrometre from a measured line.
*/
static void print_usage() {
    std::cout
        << "Usage:\n"
        << "  spotmap-cli summary      --points=in.csv\n"
        << "  spotmap-cli renumber     --points=in.csv [--out=out.csv]\n"
        << "  spotmap-cli remove       --points=in.csv --id=N [--out=out.csv]\n"
        << "  spotmap-cli edit         --points=in.csv --id=N --column=material --value=zircon [--out=out.csv]\n"
        << "  spotmap-cli render       --points=in.csv --image=scan.png [--save=overlay.png]\n"
        << "                           [--thickness=4] [--font-scale=0.5]\n"
        << "  spotmap-cli recoordinate --points=refs.csv --instrument=report.csv\n"
        << "                           (--image=scan.png | --width=W --height=H)\n"
        << "                           [--out=out.csv] [--instrument-out=report_mapped.csv]\n"
        << "                           [--id-col=..] [--x-col=..] [--y-col=..] [--label-col=..] [--ref-value=..]\n"
        << "  spotmap-cli scale        (--pixels=P | --from=x,y --to=x,y) --microns=M\n"
        << "  spotmap-cli --version\n"
        << "Point settings (new and imported points):\n"
        << "  [--sample=..] [--mount=..] [--material=..] [--notes=..] [--colour=#rrggbb]\n"
        << "  [--label=RefMark|Spot] [--diameter=10] [--scale=1.0]\n";
}

int main(int argc, char** argv)
{
    if (argc < 2) { print_usage(); return 0; }
    const std::string mode = argv[1];

    if (mode == "--version") {
        std::cout << "spotmap-cli " << SPOTMAP_VERSION << "\n";
        return 0;
    }

    try {
        if      (mode == "summary")      return run_summary     (argc, argv);
        else if (mode == "renumber")     return run_renumber    (argc, argv);
        else if (mode == "remove")       return run_remove      (argc, argv);
        else if (mode == "edit")         return run_edit        (argc, argv);
        else if (mode == "render")       return run_render      (argc, argv);
        else if (mode == "recoordinate") return run_recoordinate(argc, argv);
        else if (mode == "scale")        return run_scale       (argc, argv);
    } catch (const spotmap::Error& e) {
        std::cerr << "[error] " << spotmap::errorKindName(e.kind()) << ": " << e.what() << "\n";
        return 2;
    }

    std::cout << "Unknown mode: " << mode << "\n";
    print_usage();
    return 1;
}
