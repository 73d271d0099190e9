#pragma once

#include <cstddef>
#include <filesystem>
#include <ostream>

#include "canvas.h"
#include "errors.h"
#include "image.h"

namespace collager::core {

namespace fs = std::filesystem;

// Decoding goes through stb_image and is always expanded to RGBA8.
bool decode_image_file(const fs::path& path, ImagePtr& out, Error& error);
bool decode_image_memory(const unsigned char* bytes, size_t size, ImagePtr& out, Error& error);

// PNG output through stb_image_write.
bool encode_png(const Canvas& canvas, std::ostream& out, Error& error);
bool write_png_file(const Canvas& canvas, const fs::path& path, Error& error);

} // namespace collager::core
