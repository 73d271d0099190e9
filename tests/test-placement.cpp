/*
 * Unit tests for placement and canvas sizing
 */

#include <gtest/gtest.h>

#include <vector>

#include "core/compositor.h"
#include "core/partition.h"
#include "core/placement.h"

using namespace collager::core;

namespace {

ImagePtr solid(unsigned int w, unsigned int h) {
    return make_solid_image(w, h, Color{200, 100, 50, 255});
}

} // namespace

TEST(PlacementTest, WalksRowsAndColumnsWithPadding) {
    const ImagePtr a = solid(100, 100);
    const ImagePtr b = solid(100, 90);
    const ImagePtr c = solid(100, 50);
    const ImagePtr d = solid(100, 40);
    const ImageMatrix matrix = {{a, b}, {c, d}};

    const PlacementGrid grid = compute_placements(matrix, 1, 200, Shape::Rectangle);
    ASSERT_EQ(grid.size(), 2u);
    EXPECT_EQ(grid[0][0], (Placement{Point{1, 1}, Size{100, 100}}));
    EXPECT_EQ(grid[0][1], (Placement{Point{102, 1}, Size{100, 90}}));
    EXPECT_EQ(grid[1][0], (Placement{Point{1, 102}, Size{100, 50}}));
    EXPECT_EQ(grid[1][1], (Placement{Point{102, 102}, Size{100, 40}}));
}

TEST(PlacementTest, LocateMatchesGridAndIsIdempotent) {
    const ImagePtr a = solid(120, 60);
    const ImagePtr b = solid(60, 60);
    const ImagePtr c = solid(30, 90);
    const ImageMatrix matrix = {{a, b}, {c}};
    const PlacementGrid grid = compute_placements(matrix, 20, 300, Shape::Circle);

    Placement first;
    Placement second;
    Error error;
    ASSERT_TRUE(locate(c, matrix, 20, 300, Shape::Circle, first, error));
    ASSERT_TRUE(locate(c, matrix, 20, 300, Shape::Circle, second, error));
    EXPECT_EQ(first, second);
    EXPECT_EQ(first, grid[1][0]);

    Placement by_index;
    ASSERT_TRUE(locate_cell(matrix, 0, 1, 20, 300, Shape::Circle, by_index, error));
    EXPECT_EQ(by_index, grid[0][1]);
}

TEST(PlacementTest, LocateUsesIdentityNotValue) {
    const ImagePtr member = solid(50, 50);
    const ImagePtr lookalike = solid(50, 50);
    const ImageMatrix matrix = {{member}};

    Placement placement;
    Error error;
    EXPECT_FALSE(locate(lookalike, matrix, 1, 100, Shape::Rectangle, placement, error));
    EXPECT_EQ(error.code, ErrorCode::ImageNotFound);
}

TEST(PlacementTest, LocateCellOutOfRangeIsImageNotFound) {
    const ImageMatrix matrix = {{solid(10, 10)}};
    Placement placement;
    Error error;
    EXPECT_FALSE(locate_cell(matrix, 0, 1, 1, 100, Shape::Rectangle, placement, error));
    EXPECT_EQ(error.code, ErrorCode::ImageNotFound);
    EXPECT_FALSE(locate_cell(matrix, 2, 0, 1, 100, Shape::Rectangle, placement, error));
}

TEST(PlacementTest, CircleSizesAreSquareDiameters) {
    const ImagePtr landscape = solid(100, 60);
    const ImagePtr portrait = solid(40, 90);
    const ImageMatrix matrix = {{landscape, portrait}};

    const PlacementGrid grid = compute_placements(matrix, 20, 200, Shape::Circle);
    // Column width 100: 100x60 -> 48, 40x90 -> 100x225 -> 80.
    EXPECT_EQ(grid[0][0].size, (Size{48, 48}));
    EXPECT_EQ(grid[0][1].size, (Size{80, 80}));
    EXPECT_EQ(grid[0][1].point.x, 20 + 48 + 20);
}

TEST(PlacementTest, RectanglePlacementsKeepAspectRatio) {
    std::vector<ImagePtr> images = {solid(640, 480), solid(300, 500), solid(1024, 256), solid(77, 91),
                                    solid(500, 500)};
    Partition partition;
    Error error;
    ASSERT_TRUE(partition_images(images, 2, Shape::Rectangle, 900, partition, error));

    const PlacementGrid grid = compute_placements(partition.matrix, 1, 900, Shape::Rectangle);
    for (size_t row = 0; row < partition.matrix.size(); ++row) {
        for (size_t col = 0; col < partition.matrix[row].size(); ++col) {
            const Image& image = *partition.matrix[row][col];
            const Size size = grid[row][col].size;
            ASSERT_GT(size.height, 0u);
            const double rendered_ratio = static_cast<double>(size.width) / size.height;
            const double original_ratio = static_cast<double>(image.width()) / image.height();
            EXPECT_NEAR(rendered_ratio, original_ratio, original_ratio * 0.02);
        }
    }
}

TEST(PlacementTest, CanvasNeverClipsPlacedCells) {
    // Mixed aspect ratios in one row make the row-by-row stacking taller
    // than the tallest column sum.
    const std::vector<ImagePtr> images = {solid(100, 300), solid(300, 100), solid(100, 100), solid(100, 100),
                                          solid(250, 40), solid(60, 200)};

    for (Shape shape : {Shape::Rectangle, Shape::Circle}) {
        for (int rows = 1; rows <= 3; ++rows) {
            for (int width : {200, 333, 1000}) {
                Partition partition;
                Error error;
                ASSERT_TRUE(partition_images(images, rows, shape, width, partition, error)) << error.message;

                const int padding = padding_for(shape);
                const std::vector<CellPlan> cells = plan_cells(partition.matrix, padding, width, shape);
                const Size canvas = canvas_size_for(partition.matrix, partition.canvas_width,
                                                    partition.canvas_height, padding, cells);

                EXPECT_GE(canvas.width, partition.canvas_width + 2u * padding);
                EXPECT_GE(canvas.height, partition.canvas_height + 2u * padding);
                for (const CellPlan& cell : cells) {
                    const Rect r = cell.placement.rect();
                    EXPECT_GE(r.x, padding);
                    EXPECT_GE(r.y, padding);
                    EXPECT_LE(static_cast<unsigned int>(r.right()), canvas.width);
                    EXPECT_LE(static_cast<unsigned int>(r.bottom()), canvas.height);
                }
            }
        }
    }
}

TEST(PlacementTest, UniformRowsMatchSummedCanvasSize) {
    const ImageMatrix matrix = {{solid(100, 100), solid(100, 90)}, {solid(100, 50), solid(100, 40)}};
    const std::vector<CellPlan> cells = plan_cells(matrix, 1, 200, Shape::Rectangle);
    // canvas_width 200, canvas_height max(100 + 50, 90 + 40) = 150.
    const Size canvas = canvas_size_for(matrix, 200, 150, 1, cells);
    EXPECT_EQ(canvas, (Size{203, 153}));
}

TEST(PlacementTest, CursorsClampInsteadOfWrapping) {
    const ImageMatrix matrix = {{solid(1, 1), solid(1, 1), solid(1, 1)}};
    const PlacementGrid grid = compute_placements(matrix, 1, 2147483646, Shape::Rectangle);
    ASSERT_EQ(grid.size(), 1u);
    ASSERT_EQ(grid[0].size(), 3u);
    EXPECT_EQ(grid[0][0].point.x, 1);
    EXPECT_EQ(grid[0][1].point.x, 715827884);
    EXPECT_EQ(grid[0][2].point.x, 1431655767);
    EXPECT_EQ(grid[0][2].size.width, 715827882u);
    EXPECT_EQ(grid[0][2].rect().right(), k_max_layout_extent);
}
