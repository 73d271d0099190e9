#include "partition.h"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>

namespace collager::core {

void sort_by_height_desc(std::vector<ImagePtr>& images) {
    std::ranges::sort(images, [](const ImagePtr& lhs, const ImagePtr& rhs) {
        return lhs->height() > rhs->height();
    });
}

bool build_image_matrix(const std::vector<ImagePtr>& sorted, int rows, ImageMatrix& out, Error& error) {
    if (rows <= 0) {
        error.set(ErrorCode::InvalidLayout, "row count must be positive, got " + std::to_string(rows));
        return false;
    }

    const size_t row_count = static_cast<size_t>(rows);
    const size_t columns = sorted.size() / row_count;
    ImageMatrix matrix(row_count);
    size_t added = 0;
    for (size_t row = 0; row < row_count; ++row) {
        size_t columns_in_row = columns;
        if ((row_count - row) * columns < sorted.size() - added) {
            ++columns_in_row;
        }
        if (columns_in_row == 0) {
            error.set(ErrorCode::InvalidLayout,
                      std::to_string(sorted.size()) + " images cannot fill " + std::to_string(rows) + " rows");
            return false;
        }
        matrix[row].assign(sorted.begin() + static_cast<std::ptrdiff_t>(added),
                           sorted.begin() + static_cast<std::ptrdiff_t>(added + columns_in_row));
        added += columns_in_row;
    }

    out = std::move(matrix);
    return true;
}

unsigned int column_width_for(size_t columns_in_row, int target_width) {
    if (columns_in_row == 0 || target_width <= 0) {
        return 0;
    }
    return static_cast<unsigned int>(
        std::floor(static_cast<double>(target_width) / static_cast<double>(columns_in_row)));
}

Size rendered_size(const Image& image, unsigned int column_width) {
    if (image.width() == 0) {
        return Size{};
    }
    const double original_width = image.width();
    const double original_height = image.height();
    const double resize_factor = static_cast<double>(column_width) / original_width;
    constexpr auto k_limit = static_cast<double>(k_max_layout_extent);
    return Size{static_cast<unsigned int>(std::min(original_width * resize_factor, k_limit)),
                static_cast<unsigned int>(std::min(original_height * resize_factor, k_limit))};
}

Size cell_extent(const Size& rendered, Shape shape) {
    if (shape == Shape::Rectangle) {
        return rendered;
    }
    const unsigned int diameter = circle_diameter(rendered);
    return Size{diameter, diameter};
}

bool partition_images(std::vector<ImagePtr> images,
                      int rows,
                      Shape shape,
                      int target_width,
                      Partition& out,
                      Error& error) {
    if (target_width <= 0) {
        error.set(ErrorCode::InvalidLayout, "target width must be positive, got " + std::to_string(target_width));
        return false;
    }
    if (images.empty()) {
        error.set(ErrorCode::InvalidLayout, "no images to lay out");
        return false;
    }

    sort_by_height_desc(images);

    Partition result;
    if (!build_image_matrix(images, rows, result.matrix, error)) {
        return false;
    }

    const auto padding = static_cast<uint64_t>(padding_for(shape));
    constexpr auto k_limit = static_cast<uint64_t>(k_max_layout_extent);
    const auto too_large = [&]() {
        error.set(ErrorCode::InvalidLayout,
                  "target width " + std::to_string(target_width) + " makes the layout too large");
        return false;
    };

    std::vector<std::vector<Size>> extents(result.matrix.size());
    uint64_t canvas_width = 0;
    uint64_t stacked_height = padding;
    for (size_t row = 0; row < result.matrix.size(); ++row) {
        const ImageRow& cells = result.matrix[row];
        const unsigned int column_width = column_width_for(cells.size(), target_width);
        if (column_width == 0) {
            error.set(ErrorCode::InvalidLayout,
                      "target width " + std::to_string(target_width) + " is too small for " +
                          std::to_string(cells.size()) + " columns");
            return false;
        }

        uint64_t row_width = 0;
        uint64_t row_span = padding;
        uint64_t row_height = 0;
        extents[row].reserve(cells.size());
        for (const ImagePtr& image : cells) {
            const Size extent = cell_extent(rendered_size(*image, column_width), shape);
            extents[row].push_back(extent);
            row_width += extent.width;
            row_span += extent.width + padding;
            row_height = std::max<uint64_t>(row_height, extent.height);
        }
        // Every placed cell, padding included, has to stay addressable.
        stacked_height += row_height + padding;
        if (row_span > k_limit || stacked_height > k_limit) {
            return too_large();
        }
        canvas_width = std::max(canvas_width, row_width);
        result.max_columns = std::max(result.max_columns, cells.size());
    }

    uint64_t canvas_height = 0;
    for (size_t col = 0; col < result.max_columns; ++col) {
        uint64_t column_height = 0;
        for (const auto& row_extents : extents) {
            if (col < row_extents.size()) {
                column_height += row_extents[col].height;
            }
        }
        canvas_height = std::max(canvas_height, column_height);
    }
    result.canvas_width = static_cast<unsigned int>(canvas_width);
    result.canvas_height = static_cast<unsigned int>(canvas_height);

    out = std::move(result);
    return true;
}

} // namespace collager::core
