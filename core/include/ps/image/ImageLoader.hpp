#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace ps {

enum class PixelFormat { Grey, Rgb, Rgba };

// Decoded image, rows top to bottom. 16-bit samples are host-endian uint16.
struct Image {
  int width{0};
  int height{0};
  PixelFormat format{PixelFormat::Rgba};
  int bitDepth{8};  // 8 or 16
  std::vector<std::uint8_t> pixels;

  int channels() const;
};

struct ImageResult {
  bool ok{true};
  std::string error;
  Image image;
};

// Fields of the PNG IHDR chunk.
struct PngHeader {
  std::uint32_t width{0};
  std::uint32_t height{0};
  int bitDepth{0};
  int colorType{0};  // 0 grey, 2 rgb, 3 indexed, 4 grey+alpha, 6 rgba
};

bool readPngHeader(const std::uint8_t* data, std::size_t len, PngHeader& out);

// Greyscale, RGB and RGBA at 8 or 16 bits per channel. Indexed colour,
// grey+alpha and sub-byte depths are rejected before decoding.
ImageResult decodePng(const std::uint8_t* data, std::size_t len);

ImageResult loadPngFile(const std::string& path);

} // namespace ps
