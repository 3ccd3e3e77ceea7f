#include "ps/image/ImageLoader.hpp"

#include <cstring>
#include <fstream>
#include <iterator>

#define STB_IMAGE_IMPLEMENTATION
#define STBI_ONLY_PNG
#include "stb_image.h"

namespace ps {

int Image::channels() const {
  switch (format) {
    case PixelFormat::Grey: return 1;
    case PixelFormat::Rgb:  return 3;
    case PixelFormat::Rgba: return 4;
  }
  return 4;
}

static std::uint32_t readU32BE(const std::uint8_t* p) {
  return (static_cast<std::uint32_t>(p[0]) << 24) |
         (static_cast<std::uint32_t>(p[1]) << 16) |
         (static_cast<std::uint32_t>(p[2]) << 8) |
          static_cast<std::uint32_t>(p[3]);
}

bool readPngHeader(const std::uint8_t* data, std::size_t len, PngHeader& out) {
  static const std::uint8_t kSignature[8] = {0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n'};
  // signature(8) + length(4) + "IHDR"(4) + 13 bytes of header data
  if (!data || len < 8 + 8 + 13) return false;
  if (std::memcmp(data, kSignature, 8) != 0) return false;
  if (std::memcmp(data + 12, "IHDR", 4) != 0) return false;

  out.width = readU32BE(data + 16);
  out.height = readU32BE(data + 20);
  out.bitDepth = data[24];
  out.colorType = data[25];
  return true;
}

static ImageResult fail(const std::string& msg) {
  ImageResult r;
  r.ok = false;
  r.error = msg;
  return r;
}

ImageResult decodePng(const std::uint8_t* data, std::size_t len) {
  PngHeader hdr;
  if (!readPngHeader(data, len, hdr)) return fail("not a PNG stream");

  PixelFormat format;
  switch (hdr.colorType) {
    case 0: format = PixelFormat::Grey; break;
    case 2: format = PixelFormat::Rgb; break;
    case 6: format = PixelFormat::Rgba; break;
    case 3: return fail("indexed colour PNGs are unsupported");
    case 4: return fail("greyscale+alpha PNGs are unsupported");
    default: return fail("unknown PNG colour type " + std::to_string(hdr.colorType));
  }
  if (hdr.bitDepth != 8 && hdr.bitDepth != 16) {
    return fail("unsupported PNG bit depth " + std::to_string(hdr.bitDepth));
  }

  ImageResult r;
  r.image.format = format;
  r.image.bitDepth = hdr.bitDepth;
  const int want = r.image.channels();

  int w = 0, h = 0, comp = 0;
  auto stbLen = static_cast<int>(len);
  if (hdr.bitDepth == 16) {
    stbi_us* px = stbi_load_16_from_memory(data, stbLen, &w, &h, &comp, want);
    if (!px) return fail(std::string("PNG decode failed: ") + stbi_failure_reason());
    std::size_t bytes = static_cast<std::size_t>(w) * h * want * sizeof(stbi_us);
    r.image.pixels.resize(bytes);
    std::memcpy(r.image.pixels.data(), px, bytes);
    stbi_image_free(px);
  } else {
    stbi_uc* px = stbi_load_from_memory(data, stbLen, &w, &h, &comp, want);
    if (!px) return fail(std::string("PNG decode failed: ") + stbi_failure_reason());
    std::size_t bytes = static_cast<std::size_t>(w) * h * want;
    r.image.pixels.assign(px, px + bytes);
    stbi_image_free(px);
  }

  r.image.width = w;
  r.image.height = h;
  return r;
}

ImageResult loadPngFile(const std::string& path) {
  std::ifstream f(path, std::ios::binary);
  if (!f) return fail("cannot open " + path);
  std::vector<std::uint8_t> bytes((std::istreambuf_iterator<char>(f)),
                                  std::istreambuf_iterator<char>());
  if (f.bad()) return fail("read error on " + path);
  return decodePng(bytes.data(), bytes.size());
}

} // namespace ps
