#include "spotmap/core/Registry.hpp"
#include "spotmap/core/Error.hpp"

#include <algorithm>
#include <iterator>
#include <limits>
#include <numeric>
#include <utility>

namespace spotmap {

const Point& PointRegistry::add(Point point)
{
    if (!isValidLabel(point.label))
        throw Error(ErrorKind::InvalidLabel, "point label is neither 'Spot' nor 'RefMark'");
    if (point.diameter <= 0)
        throw Error(ErrorKind::InvalidValue,
                    "diameter must be positive, got " + std::to_string(point.diameter));
    if (!(point.scale > 0.0))
        throw Error(ErrorKind::InvalidValue,
                    "scale must be positive, got " + std::to_string(point.scale));

    // the counter always holds id + 1, so INT_MAX itself is never handed out
    if (point.id == 0) {
        if (nextId_ == std::numeric_limits<int>::max())
            throw Error(ErrorKind::InvalidValue, "no point ids left to assign");
        point.id = nextId_++;
    } else {
        if (point.id < 0 || point.id == std::numeric_limits<int>::max())
            throw Error(ErrorKind::InvalidValue,
                        "point id must be between 1 and " + std::to_string(std::numeric_limits<int>::max() - 1)
                        + ", got " + std::to_string(point.id));
        if (contains(point.id))
            throw Error(ErrorKind::DuplicateId,
                        "point id " + std::to_string(point.id) + " is already in use");
        nextId_ = std::max(nextId_, point.id + 1);
    }

    points_.push_back(std::move(point));
    return points_.back();
}

void PointRegistry::remove(int id)
{
    auto it = std::find_if(points_.begin(), points_.end(),
                           [id](const Point& p){ return p.id == id; });
    if (it == points_.end())
        throw Error(ErrorKind::NotFound, "no point with id " + std::to_string(id));
    points_.erase(it);
}

void PointRegistry::clear() noexcept
{
    points_.clear();
}

void PointRegistry::resetIds()
{
    // rank[i] = position of points_[i] when sorted by old id
    std::vector<std::size_t> order(points_.size());
    std::iota(order.begin(), order.end(), std::size_t{0});
    std::sort(order.begin(), order.end(), [this](std::size_t a, std::size_t b) {
        return points_[a].id < points_[b].id;
    });

    for (std::size_t rank = 0; rank < order.size(); ++rank)
        points_[order[rank]].id = static_cast<int>(rank) + 1;

    nextId_ = static_cast<int>(points_.size()) + 1;
}

std::vector<Point> PointRegistry::referencePoints() const
{
    std::vector<Point> refs;
    std::copy_if(points_.begin(), points_.end(), std::back_inserter(refs),
                 [](const Point& p){ return p.isReference(); });
    return refs;
}

const Point& PointRegistry::lookup(int id) const
{
    auto it = std::find_if(points_.begin(), points_.end(),
                           [id](const Point& p){ return p.id == id; });
    if (it == points_.end())
        throw Error(ErrorKind::NotFound, "no point with id " + std::to_string(id));
    return *it;
}

bool PointRegistry::contains(int id) const noexcept
{
    return std::any_of(points_.begin(), points_.end(),
                       [id](const Point& p){ return p.id == id; });
}

Point& PointRegistry::find(int id)
{
    return const_cast<Point&>(std::as_const(*this).lookup(id));
}

void PointRegistry::edit(int id, const std::string& column, const std::string& value)
{
    Point& p = find(id);

    if      (column == "label")       p.label = parseLabel(value);
    else if (column == "sample_name") p.sample_name = value;
    else if (column == "mount_name")  p.mount_name = value;
    else if (column == "material")    p.material = value;
    else if (column == "notes")       p.notes = value;
    else
        throw Error(ErrorKind::InvalidValue, "column '" + column + "' is not editable");
}

std::vector<std::string> exportWarnings(const PointRegistry& registry,
                                        const PointSettings& settings)
{
    std::vector<std::string> out;
    if (registry.referencePoints().size() < 3) {
        out.push_back(std::string("Missing reference points: there must be at least 3 points labelled '")
                      + labelName(Label::RefMark) + "'");
    }
    if (settings.scale == PointSettings{}.scale) {
        out.push_back("A scale value has not been set");
    }
    return out;
}

} // namespace spotmap
