#include "spotmap/core/Point.hpp"
#include "spotmap/core/Config.hpp"
#include "spotmap/core/Error.hpp"

#include <algorithm>
#include <cctype>

namespace spotmap {

const char* labelName(Label label) noexcept
{
    switch (label) {
        case Label::RefMark: return "RefMark";
        case Label::Spot:    return "Spot";
    }
    return "?";
}

Label parseLabel(std::string_view text)
{
    std::string up(text);
    std::transform(up.begin(), up.end(), up.begin(),
                   [](unsigned char c){ return static_cast<char>(std::toupper(c)); });
    if (up == "REFMARK") return Label::RefMark;
    if (up == "SPOT")    return Label::Spot;
    throw Error(ErrorKind::InvalidLabel,
                "'" + std::string(text) + "' is not a valid label, use either 'Spot' or 'RefMark'");
}

Point PointSettings::makePoint(int x, int y) const
{
    Point p;
    p.label       = label;
    p.x           = x;
    p.y           = y;
    p.diameter    = diameter;
    p.scale       = scale;
    p.colour      = colour;
    p.sample_name = sample_name;
    p.mount_name  = mount_name;
    p.material    = material;
    p.notes       = notes;
    return p;
}

} // namespace spotmap
