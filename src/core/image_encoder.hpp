#pragma once

#include "colormap.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace field_mapper
{

class image_encoder_t
{
public:
  // RGBA PNG, row 0 at the top (north-up). Empty on failure.
  static auto encode_png(const rgba_image_t &image) -> std::vector<std::uint8_t>;
  static auto save_png(const rgba_image_t &image, const std::string &path) -> bool;

  // Standard alphabet with '=' padding
  static auto base64_encode(const std::vector<std::uint8_t> &bytes) -> std::string;
  static auto encode_png_base64(const rgba_image_t &image) -> std::string;
};

} // namespace field_mapper
