#include "collage_driver.h"

#include <algorithm>
#include <string>
#include <system_error>
#include <thread>
#include <utility>

namespace collager::core {

const char* draw_mode_name(DrawMode mode) {
    switch (mode) {
        case DrawMode::Serial:
            return "serial";
        case DrawMode::Joined:
            return "joined";
        case DrawMode::Detached:
            return "detached";
    }
    return "unknown";
}

void DrawProgress::mark_drawn() {
    const size_t drawn = drawn_.fetch_add(1, std::memory_order_acq_rel) + 1;
    if (drawn >= total_) {
        std::scoped_lock lock(mutex_);
        done_.notify_all();
    }
}

void DrawProgress::wait() {
    std::unique_lock lock(mutex_);
    done_.wait(lock, [this]() { return is_complete(); });
}

unsigned int resolve_worker_count(unsigned int requested, size_t cell_count) {
    unsigned int worker_count = requested > 0 ? requested : std::thread::hardware_concurrency();
    if (worker_count == 0) {
        worker_count = 1;
    }
    return std::min<unsigned int>(worker_count, static_cast<unsigned int>(std::max<size_t>(1, cell_count)));
}

bool cells_overlap(const std::vector<CellPlan>& cells) {
    if (cells.size() < 2) {
        return false;
    }
    std::vector<size_t> order(cells.size());
    for (size_t i = 0; i < cells.size(); ++i) {
        order[i] = i;
    }
    std::ranges::sort(order, [&](size_t lhs, size_t rhs) {
        const Point& a = cells[lhs].placement.point;
        const Point& b = cells[rhs].placement.point;
        if (a.x != b.x) {
            return a.x < b.x;
        }
        return a.y < b.y;
    });

    for (size_t i = 0; i < order.size(); ++i) {
        const Rect a = cells[order[i]].placement.rect();
        for (size_t j = i + 1; j < order.size(); ++j) {
            const Rect b = cells[order[j]].placement.rect();
            if (b.x >= a.right()) {
                break;
            }
            if (rects_overlap(a, b)) {
                return true;
            }
        }
    }
    return false;
}

bool run_composite(const Partition& partition, const CompositeOptions& options, CompositeJob& out, Error& error) {
    const ImageMatrix& matrix = partition.matrix;
    if (matrix.empty() || std::ranges::any_of(matrix, [](const ImageRow& row) { return row.empty(); })) {
        error.set(ErrorCode::InvalidLayout, "cannot composite a matrix with empty rows");
        return false;
    }

    const int padding = padding_for(options.shape);
    auto cells = std::make_shared<const std::vector<CellPlan>>(
        plan_cells(matrix, padding, options.target_width, options.shape));
    const Size size = canvas_size_for(matrix, partition.canvas_width, partition.canvas_height, padding, *cells);
    std::shared_ptr<Canvas> canvas;
    if (!allocate_canvas(size, options.background, canvas, error)) {
        return false;
    }
    auto progress = std::make_shared<DrawProgress>(cells->size());

    // Regions are handed out before any task starts; no task sees the whole canvas.
    std::vector<CanvasRegion> regions;
    regions.reserve(cells->size());
    for (const CellPlan& cell : *cells) {
        regions.push_back(canvas->region(cell.placement.rect()));
    }

    DrawMode mode = options.draw_mode;
    if (mode != DrawMode::Serial && cells_overlap(*cells)) {
        mode = DrawMode::Serial;
    }
    const Shape shape = options.shape;

    if (mode == DrawMode::Serial) {
        for (size_t idx = 0; idx < cells->size(); ++idx) {
            composite_cell(regions[idx], (*cells)[idx], shape);
            progress->mark_drawn();
        }
    } else if (mode == DrawMode::Joined) {
        const unsigned int worker_count = resolve_worker_count(options.threads, cells->size());
        std::atomic<size_t> next_index{0};
        std::vector<std::thread> workers;
        workers.reserve(worker_count);
        for (unsigned int i = 0; i < worker_count; ++i) {
            workers.emplace_back([&]() {
                while (true) {
                    const size_t idx = next_index.fetch_add(1, std::memory_order_relaxed);
                    if (idx >= cells->size()) {
                        break;
                    }
                    composite_cell(regions[idx], (*cells)[idx], shape);
                    progress->mark_drawn();
                }
            });
        }
        for (auto& worker : workers) {
            worker.join();
        }
    } else {
        // Fire and forget. Each task owns shared references to the plan, the
        // canvas and the progress counter, so the caller may drop its handle.
        for (size_t idx = 0; idx < cells->size(); ++idx) {
            auto task = [cells, canvas, progress, region = regions[idx], idx, shape]() mutable {
                composite_cell(region, (*cells)[idx], shape);
                progress->mark_drawn();
            };
            try {
                std::thread(std::move(task)).detach();
            } catch (const std::system_error&) {
                // Out of threads: draw this cell here instead.
                composite_cell(regions[idx], (*cells)[idx], shape);
                progress->mark_drawn();
            }
        }
    }

    out.canvas = std::move(canvas);
    out.progress = std::move(progress);
    out.draw_mode = mode;
    return true;
}

bool make_collage(std::vector<ImagePtr> images,
                  int rows,
                  int target_height,
                  const CompositeOptions& options,
                  CompositeJob& out,
                  Error& error) {
    if (rows <= 0) {
        error.set(ErrorCode::InvalidLayout, "row count must be positive, got " + std::to_string(rows));
        return false;
    }
    if (options.target_width <= 0) {
        error.set(ErrorCode::InvalidLayout,
                  "target width must be positive, got " + std::to_string(options.target_width));
        return false;
    }
    if (target_height <= 0) {
        error.set(ErrorCode::InvalidLayout, "target height must be positive, got " + std::to_string(target_height));
        return false;
    }

    Partition partition;
    if (!partition_images(std::move(images), rows, options.shape, options.target_width, partition, error)) {
        return false;
    }
    return run_composite(partition, options, out, error);
}

} // namespace collager::core
