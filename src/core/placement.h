#pragma once

#include <cstddef>
#include <vector>

#include "errors.h"
#include "geometry.h"
#include "partition.h"

namespace collager::core {

struct Placement {
    Point point;
    Size size;

    [[nodiscard]] Rect rect() const {
        return Rect{point.x, point.y, static_cast<int>(size.width), static_cast<int>(size.height)};
    }

    bool operator==(const Placement& other) const {
        return point == other.point && size == other.size;
    }
};

using PlacementGrid = std::vector<std::vector<Placement>>;

// Walks the matrix row by row: each row starts at x = padding, each cell
// advances x by its width plus padding, and each row advances y by its
// tallest cell plus padding. Circle cells are square diameters.
PlacementGrid compute_placements(const ImageMatrix& matrix, int padding, int target_width, Shape shape);

// Finds an image by identity. Pure; ImageNotFound when the pointer is not in
// the matrix.
bool locate(const ImagePtr& image,
            const ImageMatrix& matrix,
            int padding,
            int target_width,
            Shape shape,
            Placement& out,
            Error& error);

bool locate_cell(const ImageMatrix& matrix,
                 size_t row,
                 size_t col,
                 int padding,
                 int target_width,
                 Shape shape,
                 Placement& out,
                 Error& error);

} // namespace collager::core
