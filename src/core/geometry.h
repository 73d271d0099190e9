#pragma once

#include <algorithm>
#include <cmath>
#include <limits>

namespace collager::core {

enum class Shape { Rectangle, Circle };

constexpr int k_rectangle_padding = 1;
constexpr int k_circle_padding = 20;
constexpr double k_circle_diameter_factor = 0.8;

// Largest coordinate or extent a layout may produce.
constexpr int k_max_layout_extent = std::numeric_limits<int>::max();

inline int clamp_coordinate(long long value) {
    return static_cast<int>(
        std::clamp<long long>(value, std::numeric_limits<int>::min(), k_max_layout_extent));
}

struct Size {
    unsigned int width = 0;
    unsigned int height = 0;

    bool operator==(const Size& other) const {
        return width == other.width && height == other.height;
    }
};

struct Point {
    int x = 0;
    int y = 0;

    bool operator==(const Point& other) const {
        return x == other.x && y == other.y;
    }
};

struct Rect {
    int x = 0;
    int y = 0;
    int w = 0;
    int h = 0;

    [[nodiscard]] int right() const { return clamp_coordinate(static_cast<long long>(x) + w); }
    [[nodiscard]] int bottom() const { return clamp_coordinate(static_cast<long long>(y) + h); }
    [[nodiscard]] bool empty() const { return w <= 0 || h <= 0; }
};

inline int padding_for(Shape shape) {
    return shape == Shape::Circle ? k_circle_padding : k_rectangle_padding;
}

inline const char* shape_name(Shape shape) {
    return shape == Shape::Circle ? "Circle" : "Rectangle";
}

// Diameter of the circle crop taken from a rendered size.
inline unsigned int circle_diameter(const Size& size) {
    const double shorter = static_cast<double>(std::min(size.width, size.height));
    return static_cast<unsigned int>(std::floor(shorter * k_circle_diameter_factor));
}

// Half-open rectangles; empty rectangles never overlap anything.
inline bool rects_overlap(const Rect& a, const Rect& b) {
    if (a.empty() || b.empty()) {
        return false;
    }
    return a.right() > b.x && b.right() > a.x && a.bottom() > b.y && b.bottom() > a.y;
}

} // namespace collager::core
