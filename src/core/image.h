#pragma once

#include <cstddef>
#include <memory>
#include <vector>

#include "canvas.h"

namespace collager::core {

// Decoded RGBA8 pixels. Never mutated after construction; consumers share it
// through ImagePtr and compare by pointer identity.
class Image {
public:
    Image() = default;
    Image(unsigned int width, unsigned int height, std::vector<unsigned char> rgba);

    [[nodiscard]] unsigned int width() const { return width_; }
    [[nodiscard]] unsigned int height() const { return height_; }
    [[nodiscard]] bool empty() const { return width_ == 0 || height_ == 0; }
    [[nodiscard]] const unsigned char* data() const { return pixels_.data(); }
    [[nodiscard]] Color pixel(unsigned int x, unsigned int y) const;

private:
    unsigned int width_ = 0;
    unsigned int height_ = 0;
    std::vector<unsigned char> pixels_;
};

using ImagePtr = std::shared_ptr<const Image>;

ImagePtr make_solid_image(unsigned int width, unsigned int height, const Color& color);

} // namespace collager::core
