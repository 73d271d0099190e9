#include "canvas.h"

#include <algorithm>
#include <limits>
#include <stdexcept>

namespace collager::core {
namespace {

bool checked_mul_size_t(size_t a, size_t b, size_t& out) {
    if (a == 0 || b <= std::numeric_limits<size_t>::max() / a) {
        out = a * b;
        return true;
    }
    return false;
}

} // namespace

bool canvas_byte_count(unsigned int width, unsigned int height, size_t& out) {
    size_t pixel_count = 0;
    size_t byte_count = 0;
    if (!checked_mul_size_t(width, height, pixel_count)
        || !checked_mul_size_t(pixel_count, k_num_channels, byte_count)
        || byte_count > k_max_canvas_bytes) {
        return false;
    }
    out = byte_count;
    return true;
}

Canvas::Canvas(int width, int height, const Color& background)
    : width_(width), height_(height) {
    if (width < 0 || height < 0) {
        throw std::invalid_argument("canvas dimensions must not be negative");
    }
    pixels_.resize(static_cast<size_t>(width) * static_cast<size_t>(height) * k_num_channels);
    for (size_t offset = 0; offset < pixels_.size(); offset += k_num_channels) {
        pixels_[offset + k_channel_r] = background.r;
        pixels_[offset + k_channel_g] = background.g;
        pixels_[offset + k_channel_b] = background.b;
        pixels_[offset + k_channel_a] = background.a;
    }
}

Color Canvas::get_pixel(int x, int y) const {
    if (!in_bounds(x, y)) {
        return Color{};
    }
    const size_t offset = offset_of(x, y);
    return Color{pixels_[offset + k_channel_r], pixels_[offset + k_channel_g],
                 pixels_[offset + k_channel_b], pixels_[offset + k_channel_a]};
}

void Canvas::set_pixel(int x, int y, const Color& color) {
    if (!in_bounds(x, y)) {
        return;
    }
    const size_t offset = offset_of(x, y);
    pixels_[offset + k_channel_r] = color.r;
    pixels_[offset + k_channel_g] = color.g;
    pixels_[offset + k_channel_b] = color.b;
    pixels_[offset + k_channel_a] = color.a;
}

CanvasRegion Canvas::region(const Rect& area) {
    const int left = std::clamp(area.x, 0, width_);
    const int top = std::clamp(area.y, 0, height_);
    const int right = std::clamp(area.right(), left, width_);
    const int bottom = std::clamp(area.bottom(), top, height_);
    return CanvasRegion(this, Rect{left, top, right - left, bottom - top});
}

Color CanvasRegion::get_pixel(int x, int y) const {
    if (!contains(x, y)) {
        return Color{};
    }
    return canvas_->get_pixel(area_.x + x, area_.y + y);
}

void CanvasRegion::set_pixel(int x, int y, const Color& color) {
    if (!contains(x, y)) {
        return;
    }
    canvas_->set_pixel(area_.x + x, area_.y + y, color);
}

Color blend_over(const Color& src, const Color& dst) {
    if (src.a == k_max_alpha) {
        return src;
    }
    if (src.a == 0) {
        return dst;
    }
    const double sa = src.a / 255.0;
    const double da = dst.a / 255.0;
    const double out_a = sa + (da * (1.0 - sa));
    auto channel = [&](unsigned char s, unsigned char d) {
        const double value = ((s * sa) + (d * da * (1.0 - sa))) / out_a;
        return static_cast<unsigned char>(std::clamp(value + 0.5, 0.0, 255.0));
    };
    return Color{channel(src.r, dst.r), channel(src.g, dst.g), channel(src.b, dst.b),
                 static_cast<unsigned char>(std::clamp((out_a * 255.0) + 0.5, 0.0, 255.0))};
}

} // namespace collager::core
