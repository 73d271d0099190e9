#pragma once

#include <cstddef>
#include <vector>

#include "geometry.h"

namespace collager::core {

constexpr size_t k_num_channels = 4;
constexpr size_t k_channel_r = 0;
constexpr size_t k_channel_g = 1;
constexpr size_t k_channel_b = 2;
constexpr size_t k_channel_a = 3;
constexpr unsigned char k_max_alpha = 255;
constexpr size_t k_max_canvas_bytes = size_t{1} << 31;

// Bytes of a width x height RGBA8 buffer. False on overflow or when the
// buffer would exceed k_max_canvas_bytes.
bool canvas_byte_count(unsigned int width, unsigned int height, size_t& out);

struct Color {
    unsigned char r = 0;
    unsigned char g = 0;
    unsigned char b = 0;
    unsigned char a = 0;

    bool operator==(const Color& other) const {
        return r == other.r && g == other.g && b == other.b && a == other.a;
    }

    bool operator!=(const Color& other) const {
        return !(*this == other);
    }
};

constexpr Color k_default_background{0, 0, 0, k_max_alpha};

class CanvasRegion;

// Output pixel buffer, RGBA8 row-major.
class Canvas {
public:
    Canvas(int width, int height, const Color& background = k_default_background);

    [[nodiscard]] int width() const { return width_; }
    [[nodiscard]] int height() const { return height_; }
    [[nodiscard]] Rect bounds() const { return Rect{0, 0, width_, height_}; }
    [[nodiscard]] bool in_bounds(int x, int y) const {
        return x >= 0 && y >= 0 && x < width_ && y < height_;
    }

    [[nodiscard]] Color get_pixel(int x, int y) const;
    void set_pixel(int x, int y, const Color& color);

    [[nodiscard]] const unsigned char* data() const { return pixels_.data(); }
    [[nodiscard]] size_t stride() const { return static_cast<size_t>(width_) * k_num_channels; }

    // Handle over one sub-rectangle, clipped to the canvas.
    CanvasRegion region(const Rect& area);

private:
    int width_;
    int height_;
    std::vector<unsigned char> pixels_;

    [[nodiscard]] size_t offset_of(int x, int y) const {
        return ((static_cast<size_t>(y) * static_cast<size_t>(width_)) + static_cast<size_t>(x)) * k_num_channels;
    }

    friend class CanvasRegion;
};

// Exclusive view of a canvas sub-rectangle. Coordinates are local to the
// region and writes outside of it are dropped, so two tasks holding disjoint
// regions never touch the same bytes.
class CanvasRegion {
public:
    [[nodiscard]] int width() const { return area_.w; }
    [[nodiscard]] int height() const { return area_.h; }
    [[nodiscard]] Rect area() const { return area_; }
    [[nodiscard]] bool contains(int x, int y) const {
        return x >= 0 && y >= 0 && x < area_.w && y < area_.h;
    }

    [[nodiscard]] Color get_pixel(int x, int y) const;
    void set_pixel(int x, int y, const Color& color);

private:
    CanvasRegion(Canvas* canvas, const Rect& area) : canvas_(canvas), area_(area) {}

    Canvas* canvas_;
    Rect area_;

    friend class Canvas;
};

// Programmatic alpha mask: opaque inside the circle, transparent outside.
struct CircleMask {
    Point center;
    int radius = 0;

    [[nodiscard]] unsigned char alpha_at(int x, int y) const {
        const double xx = static_cast<double>(x - center.x) + 0.5;
        const double yy = static_cast<double>(y - center.y) + 0.5;
        const double rr = static_cast<double>(radius);
        return (xx * xx) + (yy * yy) < rr * rr ? k_max_alpha : 0;
    }
};

// Porter-Duff "over" on straight alpha.
Color blend_over(const Color& src, const Color& dst);

} // namespace collager::core
