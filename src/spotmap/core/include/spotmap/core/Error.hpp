#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace spotmap {

/* Failure categories reported by the engine. */
enum class ErrorKind : std::uint8_t {
    InvalidLabel = 0,              ///< label text is neither RefMark nor Spot
    MalformedRow,                  ///< a row cannot supply a required numeric field
    NotFound,                      ///< id lookup miss
    DegenerateReferenceSet,        ///< collinear or coincident reference triplet
    InsufficientReferencePoints,   ///< fewer than 3 reference marks on either side
    FileAccessError,               ///< unreadable / unwritable path
    MissingColumn,                 ///< required header absent from a CSV file
    DuplicateId,                   ///< id already present in the registry
    InvalidValue                   ///< out-of-range value (diameter, scale, column name)
};

/* Short stable name of an error kind, e.g. "NotFound". */
const char* errorKindName(ErrorKind kind) noexcept;

/*
  Single exception type of the engine.
  what() carries a user-facing message, kind() lets callers branch.
*/
class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace spotmap
