#pragma once

#include <cstddef>
#include <vector>

#include "errors.h"
#include "geometry.h"
#include "image.h"

namespace collager::core {

using ImageRow = std::vector<ImagePtr>;
using ImageMatrix = std::vector<ImageRow>;

struct Partition {
    ImageMatrix matrix;
    unsigned int canvas_width = 0;   // widest row, summed cell extents
    unsigned int canvas_height = 0;  // tallest positional column, summed cell extents
    size_t max_columns = 0;
};

// Tallest first. The sort is not stable: images of equal height may come out
// in any order.
void sort_by_height_desc(std::vector<ImagePtr>& images);

// Splits an already sorted sequence into rows. Earlier rows absorb the
// remainder of N / rows, one extra image each.
bool build_image_matrix(const std::vector<ImagePtr>& sorted, int rows, ImageMatrix& out, Error& error);

unsigned int column_width_for(size_t columns_in_row, int target_width);

// Uniform scale of an image to a column width. Every stage of the layout goes
// through this function, so canvas sizing and placement cannot drift apart.
Size rendered_size(const Image& image, unsigned int column_width);

// Space a rendered image occupies in its cell: the image itself for
// rectangles, the crop diameter square for circles.
Size cell_extent(const Size& rendered, Shape shape);

bool partition_images(std::vector<ImagePtr> images,
                      int rows,
                      Shape shape,
                      int target_width,
                      Partition& out,
                      Error& error);

} // namespace collager::core
