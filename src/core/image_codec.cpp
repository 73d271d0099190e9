#include "image_codec.h"

#include <limits>
#include <string>
#include <utility>
#include <vector>

#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>

namespace collager::core {
namespace {

bool adopt_stbi_pixels(unsigned char* data, int w, int h, ImagePtr& out) {
    if (w <= 0 || h <= 0) {
        stbi_image_free(data);
        return false;
    }
    const size_t byte_count = static_cast<size_t>(w) * static_cast<size_t>(h) * k_num_channels;
    std::vector<unsigned char> pixels(data, data + byte_count);
    stbi_image_free(data);
    out = std::make_shared<const Image>(static_cast<unsigned int>(w), static_cast<unsigned int>(h),
                                        std::move(pixels));
    return true;
}

std::string failure_reason() {
    const char* reason = stbi_failure_reason();
    return reason != nullptr ? reason : "unknown reason";
}

} // namespace

bool decode_image_file(const fs::path& path, ImagePtr& out, Error& error) {
    int w = 0;
    int h = 0;
    int channels = 0;
    unsigned char* data = stbi_load(path.string().c_str(), &w, &h, &channels, static_cast<int>(k_num_channels));
    if (data == nullptr) {
        error.set(ErrorCode::DecodeError, "Failed to decode " + path.string() + ": " + failure_reason());
        return false;
    }
    if (!adopt_stbi_pixels(data, w, h, out)) {
        error.set(ErrorCode::DecodeError, "Image has no pixels: " + path.string());
        return false;
    }
    return true;
}

bool decode_image_memory(const unsigned char* bytes, size_t size, ImagePtr& out, Error& error) {
    if (bytes == nullptr || size == 0 || size > static_cast<size_t>(std::numeric_limits<int>::max())) {
        error.set(ErrorCode::DecodeError, "Invalid image buffer");
        return false;
    }
    int w = 0;
    int h = 0;
    int channels = 0;
    unsigned char* data = stbi_load_from_memory(bytes, static_cast<int>(size), &w, &h, &channels,
                                                static_cast<int>(k_num_channels));
    if (data == nullptr) {
        error.set(ErrorCode::DecodeError, "Failed to decode image buffer: " + failure_reason());
        return false;
    }
    if (!adopt_stbi_pixels(data, w, h, out)) {
        error.set(ErrorCode::DecodeError, "Image buffer has no pixels");
        return false;
    }
    return true;
}

bool encode_png(const Canvas& canvas, std::ostream& out, Error& error) {
    if (canvas.width() <= 0 || canvas.height() <= 0) {
        error.set(ErrorCode::OutputError, "Cannot encode an empty canvas");
        return false;
    }
    auto write_callback = [](void* context, void* data, int size) {
        auto* stream = static_cast<std::ostream*>(context);
        stream->write(static_cast<char*>(data), size);
    };
    if (stbi_write_png_to_func(write_callback, &out, canvas.width(), canvas.height(),
                               static_cast<int>(k_num_channels), canvas.data(),
                               static_cast<int>(canvas.stride())) == 0) {
        error.set(ErrorCode::OutputError, "Failed to write PNG");
        return false;
    }
    if (!out) {
        error.set(ErrorCode::OutputError, "Failed to write PNG: output stream error");
        return false;
    }
    return true;
}

bool write_png_file(const Canvas& canvas, const fs::path& path, Error& error) {
    if (canvas.width() <= 0 || canvas.height() <= 0) {
        error.set(ErrorCode::OutputError, "Cannot encode an empty canvas");
        return false;
    }
    if (stbi_write_png(path.string().c_str(), canvas.width(), canvas.height(), static_cast<int>(k_num_channels),
                       canvas.data(), static_cast<int>(canvas.stride())) == 0) {
        error.set(ErrorCode::OutputError, "Failed to write PNG: " + path.string());
        return false;
    }
    return true;
}

} // namespace collager::core
