#pragma once

#include <cstddef>
#include <memory>
#include <vector>

#include "canvas.h"
#include "errors.h"
#include "geometry.h"
#include "image.h"
#include "partition.h"
#include "placement.h"

namespace collager::core {

// One matrix cell resolved ahead of drawing.
struct CellPlan {
    size_t row = 0;
    size_t col = 0;
    ImagePtr image;
    Placement placement;
};

std::vector<CellPlan> plan_cells(const ImageMatrix& matrix, int padding, int target_width, Shape shape);

// Canvas dimensions for a partition: the summed extents plus padding between
// cells and around the border, grown where needed so every planned cell fits.
Size canvas_size_for(const ImageMatrix& matrix,
                     unsigned int canvas_width,
                     unsigned int canvas_height,
                     int padding,
                     const std::vector<CellPlan>& cells);

// Allocates a background-filled canvas. Sizes past the coordinate range or
// the canvas byte limit are InvalidLayout.
bool allocate_canvas(const Size& size, const Color& background, std::shared_ptr<Canvas>& out, Error& error);

// Opaque copy: destination pixels are replaced, alpha included.
void draw_rectangle(CanvasRegion& region, const Image& image, const Size& size);

// Resamples with the aspect ratio kept so the shorter side equals diameter,
// then composites the centred circle "over" the region. Pixels outside the
// circle are left as they were.
void draw_circle(CanvasRegion& region, const Image& image, unsigned int diameter);

void composite_cell(CanvasRegion& region, const CellPlan& cell, Shape shape);

// Serial compositor: allocates the canvas and draws each cell in matrix order.
bool composite(const ImageMatrix& matrix,
               Shape shape,
               int padding,
               int target_width,
               unsigned int canvas_width,
               unsigned int canvas_height,
               const Color& background,
               std::shared_ptr<Canvas>& out,
               Error& error);

} // namespace collager::core
