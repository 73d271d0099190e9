#pragma once

#include "image.h"

namespace collager::core {

// Scales src to exactly width x height. Downscaling averages every covered
// source pixel (tent filter widened by the scale ratio); upscaling is
// bilinear. A zero target dimension yields an empty image.
Image resample(const Image& src, unsigned int width, unsigned int height);

} // namespace collager::core
