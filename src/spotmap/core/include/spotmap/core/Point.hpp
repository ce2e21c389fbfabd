#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace spotmap {

/// Role of an analysis point.
enum class Label : std::uint8_t {
    RefMark = 0, ///< reference mark used for recoordination
    Spot         ///< ordinary ablation target
};

/// Canonical text of a label ("RefMark" / "Spot").
const char* labelName(Label label) noexcept;

/// Case-insensitive parse ("refmark", "SPOT", ...). Throws Error{InvalidLabel}.
Label parseLabel(std::string_view text);

/// True for the enumerators above (guards values produced by casts).
[[nodiscard]] constexpr bool isValidLabel(Label label) noexcept {
    return label == Label::RefMark || label == Label::Spot;
}

/// One annotated location on the loaded image.
/// Pure data: on-screen primitives are built from it by compose/Overlay.
struct Point {
    int id{0};                        ///< 0 = not assigned yet
    Label label{Label::RefMark};
    int x{0};                         ///< pixels, origin top-left
    int y{0};
    int diameter{10};                 ///< record size, micrometres intended
    double scale{1.0};                ///< pixels per micrometre at placement time
    std::string colour{"#ffff00"};
    std::string sample_name{"None"};
    std::string mount_name{"None"};
    std::string material{"None"};
    std::string notes{"None"};

    [[nodiscard]] bool isReference() const noexcept { return label == Label::RefMark; }

    bool operator==(const Point&) const = default;
};

} // namespace spotmap
