#pragma once

#include <string>

#include "canvas.h"
#include "collage_driver.h"
#include "geometry.h"

namespace collager::core {

bool parse_positive_int(const std::string& value, int& out);
bool parse_non_negative_uint(const std::string& value, unsigned int& out);

// "Rectangle" / "Circle", any case.
bool parse_shape(const std::string& value, Shape& out);
bool parse_draw_mode(const std::string& value, DrawMode& out);
// R,G,B or R,G,B,A with 0-255 channels; alpha defaults to 255.
bool parse_color(const std::string& value, Color& out);

std::string trim_copy(const std::string& s);
std::string to_lower_copy(std::string value);

} // namespace collager::core
