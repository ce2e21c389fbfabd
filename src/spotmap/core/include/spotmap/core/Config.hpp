#pragma once

#include "Point.hpp"

#include <string>

namespace spotmap {

/* Current point settings.
   Used for points placed by the caller and to fill fields missing from
   imported rows. Passed explicitly into every operation that needs it. */
struct PointSettings {
    std::string sample_name{"None"};
    std::string mount_name{"None"};
    std::string material{"None"};
    std::string notes{"None"};
    std::string colour{"#ffff00"};
    Label label{Label::RefMark};
    int diameter{10};        // micrometres
    double scale{1.0};       // pixels per micrometre; 1.0 means "not set"

    /* A Point at (x, y) carrying these settings and no id. */
    [[nodiscard]] Point makePoint(int x, int y) const;
};

/* Header names of the instrument export.
   Defaults match the SEM particle report the laser software consumes. */
struct InstrumentColumns {
    std::string id{"Particle ID"};
    std::string x{"Laser Ablation Centre X"};
    std::string y{"Laser Ablation Centre Y"};
    std::string label{"Mineral Classification"};
    std::string reference_value{"Fiducial"};   // label value that marks a reference row
};

} // namespace spotmap
