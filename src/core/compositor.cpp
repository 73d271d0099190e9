#include "compositor.h"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <new>
#include <string>
#include <utility>

#include "resample.h"

namespace collager::core {

std::vector<CellPlan> plan_cells(const ImageMatrix& matrix, int padding, int target_width, Shape shape) {
    const PlacementGrid grid = compute_placements(matrix, padding, target_width, shape);
    std::vector<CellPlan> cells;
    for (size_t row = 0; row < matrix.size(); ++row) {
        for (size_t col = 0; col < matrix[row].size(); ++col) {
            cells.push_back(CellPlan{row, col, matrix[row][col], grid[row][col]});
        }
    }
    return cells;
}

Size canvas_size_for(const ImageMatrix& matrix,
                     unsigned int canvas_width,
                     unsigned int canvas_height,
                     int padding,
                     const std::vector<CellPlan>& cells) {
    size_t max_columns = 0;
    for (const ImageRow& row : matrix) {
        max_columns = std::max(max_columns, row.size());
    }
    const auto pad = static_cast<uint64_t>(std::max(padding, 0));
    const uint64_t rows = matrix.size();
    const uint64_t columns = max_columns;

    uint64_t width = canvas_width + (columns > 0 ? (columns - 1) * pad : 0) + (2 * pad);
    uint64_t height = canvas_height + (rows > 0 ? (rows - 1) * pad : 0) + (2 * pad);

    // The column-sum height can fall short of the row-by-row stacking when
    // images in one row scale to different heights.
    for (const CellPlan& cell : cells) {
        const Rect r = cell.placement.rect();
        width = std::max<uint64_t>(width, static_cast<uint64_t>(std::max(r.right(), 0)) + pad);
        height = std::max<uint64_t>(height, static_cast<uint64_t>(std::max(r.bottom(), 0)) + pad);
    }
    constexpr uint64_t k_unsigned_max = std::numeric_limits<unsigned int>::max();
    return Size{static_cast<unsigned int>(std::min(width, k_unsigned_max)),
                static_cast<unsigned int>(std::min(height, k_unsigned_max))};
}

bool allocate_canvas(const Size& size, const Color& background, std::shared_ptr<Canvas>& out, Error& error) {
    constexpr auto k_max_dimension = static_cast<unsigned int>(k_max_layout_extent);
    size_t byte_count = 0;
    if (size.width > k_max_dimension || size.height > k_max_dimension
        || !canvas_byte_count(size.width, size.height, byte_count)) {
        error.set(ErrorCode::InvalidLayout, "canvas of " + std::to_string(size.width) + "x" +
                                                std::to_string(size.height) + " is too large");
        return false;
    }
    try {
        out = std::make_shared<Canvas>(static_cast<int>(size.width), static_cast<int>(size.height), background);
    } catch (const std::bad_alloc&) {
        error.set(ErrorCode::OutputError, "out of memory allocating a " + std::to_string(byte_count) + " byte canvas");
        return false;
    }
    return true;
}

void draw_rectangle(CanvasRegion& region, const Image& image, const Size& size) {
    const Image resized = resample(image, size.width, size.height);
    for (unsigned int y = 0; y < resized.height(); ++y) {
        for (unsigned int x = 0; x < resized.width(); ++x) {
            region.set_pixel(static_cast<int>(x), static_cast<int>(y), resized.pixel(x, y));
        }
    }
}

void draw_circle(CanvasRegion& region, const Image& image, unsigned int diameter) {
    if (diameter == 0 || image.empty()) {
        return;
    }

    const unsigned int shorter = std::min(image.width(), image.height());
    const double scale = static_cast<double>(diameter) / static_cast<double>(shorter);
    const unsigned int pre_mask_w = std::max(diameter, static_cast<unsigned int>(image.width() * scale));
    const unsigned int pre_mask_h = std::max(diameter, static_cast<unsigned int>(image.height() * scale));
    const Image resized = resample(image, pre_mask_w, pre_mask_h);

    const unsigned int offset_x = (pre_mask_w - diameter) / 2;
    const unsigned int offset_y = (pre_mask_h - diameter) / 2;
    const int half = static_cast<int>(diameter / 2);
    const CircleMask mask{Point{half, half}, half};

    for (unsigned int y = 0; y < diameter; ++y) {
        for (unsigned int x = 0; x < diameter; ++x) {
            const int lx = static_cast<int>(x);
            const int ly = static_cast<int>(y);
            if (mask.alpha_at(lx, ly) == 0 || !region.contains(lx, ly)) {
                continue;
            }
            const Color src = resized.pixel(offset_x + x, offset_y + y);
            region.set_pixel(lx, ly, blend_over(src, region.get_pixel(lx, ly)));
        }
    }
}

void composite_cell(CanvasRegion& region, const CellPlan& cell, Shape shape) {
    if (!cell.image) {
        return;
    }
    if (shape == Shape::Rectangle) {
        draw_rectangle(region, *cell.image, cell.placement.size);
    } else {
        draw_circle(region, *cell.image, cell.placement.size.width);
    }
}

bool composite(const ImageMatrix& matrix,
               Shape shape,
               int padding,
               int target_width,
               unsigned int canvas_width,
               unsigned int canvas_height,
               const Color& background,
               std::shared_ptr<Canvas>& out,
               Error& error) {
    if (matrix.empty() || std::ranges::any_of(matrix, [](const ImageRow& row) { return row.empty(); })) {
        error.set(ErrorCode::InvalidLayout, "cannot composite a matrix with empty rows");
        return false;
    }

    const std::vector<CellPlan> cells = plan_cells(matrix, padding, target_width, shape);
    const Size size = canvas_size_for(matrix, canvas_width, canvas_height, padding, cells);
    std::shared_ptr<Canvas> canvas;
    if (!allocate_canvas(size, background, canvas, error)) {
        return false;
    }
    for (const CellPlan& cell : cells) {
        CanvasRegion region = canvas->region(cell.placement.rect());
        composite_cell(region, cell, shape);
    }
    out = std::move(canvas);
    return true;
}

} // namespace collager::core
