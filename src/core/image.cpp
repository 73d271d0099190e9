#include "image.h"

#include <stdexcept>
#include <utility>

namespace collager::core {

Image::Image(unsigned int width, unsigned int height, std::vector<unsigned char> rgba)
    : width_(width), height_(height), pixels_(std::move(rgba)) {
    const size_t expected = static_cast<size_t>(width) * static_cast<size_t>(height) * k_num_channels;
    if (pixels_.size() != expected) {
        throw std::invalid_argument("image pixel buffer does not match its dimensions");
    }
}

Color Image::pixel(unsigned int x, unsigned int y) const {
    if (x >= width_ || y >= height_) {
        return Color{};
    }
    const size_t offset = ((static_cast<size_t>(y) * width_) + x) * k_num_channels;
    return Color{pixels_[offset + k_channel_r], pixels_[offset + k_channel_g],
                 pixels_[offset + k_channel_b], pixels_[offset + k_channel_a]};
}

ImagePtr make_solid_image(unsigned int width, unsigned int height, const Color& color) {
    std::vector<unsigned char> rgba(static_cast<size_t>(width) * height * k_num_channels);
    for (size_t offset = 0; offset < rgba.size(); offset += k_num_channels) {
        rgba[offset + k_channel_r] = color.r;
        rgba[offset + k_channel_g] = color.g;
        rgba[offset + k_channel_b] = color.b;
        rgba[offset + k_channel_a] = color.a;
    }
    return std::make_shared<const Image>(width, height, std::move(rgba));
}

} // namespace collager::core
