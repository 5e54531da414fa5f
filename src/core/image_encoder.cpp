#include "image_encoder.hpp"
#include <iostream>

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include "stb_image_write.h"

namespace field_mapper
{

static auto append_bytes(void *context, void *data, int size) -> void
{
  auto *out = static_cast<std::vector<std::uint8_t> *>(context);
  const auto *bytes = static_cast<const std::uint8_t *>(data);
  out->insert(out->end(), bytes, bytes + size);
}

auto image_encoder_t::encode_png(const rgba_image_t &image) -> std::vector<std::uint8_t>
{
  std::vector<std::uint8_t> png;
  if (image.width <= 0 || image.height <= 0 || image.pixels.size() != static_cast<size_t>(image.width) * image.height * 4)
    return png;

  // Grid rows already run north to south, no flip needed
  int result = stbi_write_png_to_func(append_bytes, &png, image.width, image.height, 4, image.pixels.data(), image.width * 4);
  if (result == 0)
    png.clear();
  return png;
}

auto image_encoder_t::save_png(const rgba_image_t &image, const std::string &path) -> bool
{
  if (image.width <= 0 || image.height <= 0 || image.pixels.size() != static_cast<size_t>(image.width) * image.height * 4)
    return false;

  int result = stbi_write_png(path.c_str(), image.width, image.height, 4, image.pixels.data(), image.width * 4);
  if (result == 0)
    std::cerr << "[ERROR] Failed to write " << path << std::endl;
  return result != 0;
}

auto image_encoder_t::base64_encode(const std::vector<std::uint8_t> &bytes) -> std::string
{
  static constexpr char ALPHABET[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

  std::string out;
  out.reserve((bytes.size() + 2) / 3 * 4);

  size_t i = 0;
  for (; i + 2 < bytes.size(); i += 3)
  {
    std::uint32_t n = (bytes[i] << 16) | (bytes[i + 1] << 8) | bytes[i + 2];
    out += ALPHABET[(n >> 18) & 63];
    out += ALPHABET[(n >> 12) & 63];
    out += ALPHABET[(n >> 6) & 63];
    out += ALPHABET[n & 63];
  }

  size_t rest = bytes.size() - i;
  if (rest == 1)
  {
    std::uint32_t n = bytes[i] << 16;
    out += ALPHABET[(n >> 18) & 63];
    out += ALPHABET[(n >> 12) & 63];
    out += "==";
  }
  else if (rest == 2)
  {
    std::uint32_t n = (bytes[i] << 16) | (bytes[i + 1] << 8);
    out += ALPHABET[(n >> 18) & 63];
    out += ALPHABET[(n >> 12) & 63];
    out += ALPHABET[(n >> 6) & 63];
    out += '=';
  }
  return out;
}

auto image_encoder_t::encode_png_base64(const rgba_image_t &image) -> std::string
{
  return base64_encode(encode_png(image));
}

} // namespace field_mapper
