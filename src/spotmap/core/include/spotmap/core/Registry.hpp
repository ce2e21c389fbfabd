#pragma once

#include "Config.hpp"
#include "Point.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace spotmap {

/*
  Ordered set of the points of one editing session.

  - Insertion order is kept (export order, "most recent wins" at a location).
  - nextId() only grows; deleting points never frees an id.
    resetIds() is the single operation that renumbers.
  - Not thread-safe: one session owns and mutates it.
*/
class PointRegistry {
public:
    PointRegistry() = default;

    /// Append a point. id == 0 gets nextId(); a supplied id must be unused.
    /// Throws Error{InvalidLabel | InvalidValue | DuplicateId}.
    const Point& add(Point point);

    /// Delete by id. Throws Error{NotFound}.
    void remove(int id);

    /// Drop every point; the id counter is kept.
    void clear() noexcept;

    /// Renumber 1..N in ascending old-id order, keep the insertion order,
    /// nextId() becomes N+1.
    void resetIds();

    /// Points labelled RefMark, insertion order.
    [[nodiscard]] std::vector<Point> referencePoints() const;

    /// Throws Error{NotFound}.
    [[nodiscard]] const Point& lookup(int id) const;

    [[nodiscard]] bool contains(int id) const noexcept;

    /// Edit a user-editable column: label, sample_name, mount_name, material, notes.
    /// Throws Error{NotFound | InvalidLabel | InvalidValue}.
    void edit(int id, const std::string& column, const std::string& value);

    [[nodiscard]] const std::vector<Point>& points() const noexcept { return points_; }
    [[nodiscard]] std::size_t size() const noexcept { return points_.size(); }
    [[nodiscard]] bool empty() const noexcept { return points_.empty(); }
    [[nodiscard]] int nextId() const noexcept { return nextId_; }

private:
    std::vector<Point> points_;
    int nextId_{1};

    Point& find(int id);
};

/* Non-fatal checks before writing points out:
   fewer than 3 RefMark points, scale left at its default.
   Returns one message per failed check. */
std::vector<std::string> exportWarnings(const PointRegistry& registry,
                                        const PointSettings& settings);

} // namespace spotmap
