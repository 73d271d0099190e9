#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <vector>

#include "canvas.h"
#include "compositor.h"
#include "errors.h"
#include "geometry.h"
#include "image.h"
#include "partition.h"

namespace collager::core {

enum class DrawMode {
    Serial,    // calling thread draws every cell in order
    Joined,    // worker pool, joined before returning
    Detached   // one fire-and-forget task per cell, returns immediately
};

const char* draw_mode_name(DrawMode mode);

struct CompositeOptions {
    Shape shape = Shape::Rectangle;
    int target_width = 0;
    unsigned int threads = 0;  // 0 = hardware concurrency
    DrawMode draw_mode = DrawMode::Joined;
    Color background = k_default_background;
};

// Counts finished cells. In Detached mode this is the only way to learn that
// the canvas is safe to read.
class DrawProgress {
public:
    explicit DrawProgress(size_t total) : total_(total) {}

    void mark_drawn();
    void wait();

    [[nodiscard]] size_t cells_drawn() const { return drawn_.load(std::memory_order_acquire); }
    [[nodiscard]] size_t total() const { return total_; }
    [[nodiscard]] bool is_complete() const { return cells_drawn() >= total_; }

private:
    size_t total_;
    std::atomic<size_t> drawn_{0};
    std::mutex mutex_;
    std::condition_variable done_;
};

struct CompositeJob {
    std::shared_ptr<Canvas> canvas;
    std::shared_ptr<DrawProgress> progress;
    DrawMode draw_mode = DrawMode::Joined;  // mode actually used
};

unsigned int resolve_worker_count(unsigned int requested, size_t cell_count);

bool cells_overlap(const std::vector<CellPlan>& cells);

// Draws every cell of a partition onto a fresh canvas. Parallel modes need
// disjoint cell rectangles and fall back to Serial when they overlap.
bool run_composite(const Partition& partition, const CompositeOptions& options, CompositeJob& out, Error& error);

// Validates the request, partitions the images and runs the composite.
// target_height must be positive but takes no part in the layout.
bool make_collage(std::vector<ImagePtr> images,
                  int rows,
                  int target_height,
                  const CompositeOptions& options,
                  CompositeJob& out,
                  Error& error);

} // namespace collager::core
