#include "placement.h"

#include <algorithm>
#include <string>

namespace collager::core {
namespace {

// Shared cursor walk. visit(row, col, placement) returns true to stop early.
template <typename Visitor>
bool walk_placements(const ImageMatrix& matrix, int padding, int target_width, Shape shape, Visitor&& visit) {
    // Cursors are wide and clamped on the way out; partition_images rejects
    // layouts that would need clamping.
    long long y = padding;
    for (size_t row = 0; row < matrix.size(); ++row) {
        const ImageRow& cells = matrix[row];
        const unsigned int column_width = column_width_for(cells.size(), target_width);
        long long x = padding;
        long long row_height = 0;
        for (size_t col = 0; col < cells.size(); ++col) {
            const Size size = cell_extent(rendered_size(*cells[col], column_width), shape);
            if (visit(row, col, Placement{Point{clamp_coordinate(x), clamp_coordinate(y)}, size})) {
                return true;
            }
            x += static_cast<long long>(size.width) + padding;
            row_height = std::max<long long>(row_height, size.height);
        }
        y += row_height + padding;
    }
    return false;
}

} // namespace

PlacementGrid compute_placements(const ImageMatrix& matrix, int padding, int target_width, Shape shape) {
    PlacementGrid grid(matrix.size());
    for (size_t row = 0; row < matrix.size(); ++row) {
        grid[row].reserve(matrix[row].size());
    }
    walk_placements(matrix, padding, target_width, shape,
                    [&](size_t row, size_t /*col*/, const Placement& placement) {
                        grid[row].push_back(placement);
                        return false;
                    });
    return grid;
}

bool locate(const ImagePtr& image,
            const ImageMatrix& matrix,
            int padding,
            int target_width,
            Shape shape,
            Placement& out,
            Error& error) {
    const bool found = walk_placements(matrix, padding, target_width, shape,
                                       [&](size_t row, size_t col, const Placement& placement) {
                                           if (matrix[row][col] != image) {
                                               return false;
                                           }
                                           out = placement;
                                           return true;
                                       });
    if (!found) {
        error.set(ErrorCode::ImageNotFound, "image not found in matrix");
    }
    return found;
}

bool locate_cell(const ImageMatrix& matrix,
                 size_t row,
                 size_t col,
                 int padding,
                 int target_width,
                 Shape shape,
                 Placement& out,
                 Error& error) {
    if (row >= matrix.size() || col >= matrix[row].size()) {
        error.set(ErrorCode::ImageNotFound,
                  "no cell at row " + std::to_string(row) + ", column " + std::to_string(col));
        return false;
    }
    return walk_placements(matrix, padding, target_width, shape,
                           [&](size_t r, size_t c, const Placement& placement) {
                               if (r != row || c != col) {
                                   return false;
                               }
                               out = placement;
                               return true;
                           });
}

} // namespace collager::core
