#include <ycomp/image.h>
#include <algorithm>
#include <cstring>
#include <string>

namespace ycomp {

Result<Image> Image::fromRgba8(uint32_t width, uint32_t height, std::vector<uint8_t> pixels) {
    uint64_t expected = static_cast<uint64_t>(width) * height * BYTES_PER_PIXEL;
    if (pixels.size() != expected) {
        return Err<Image>("Image: expected " + std::to_string(expected) +
                          " bytes for " + std::to_string(width) + "x" +
                          std::to_string(height) + " RGBA8, got " +
                          std::to_string(pixels.size()));
    }
    Image img;
    img.width = width;
    img.height = height;
    img.pixels = std::move(pixels);
    return Ok(std::move(img));
}

Image Image::filled(uint32_t width, uint32_t height, uint32_t rgba) {
    Image img;
    img.width = width;
    img.height = height;
    img.pixels.resize(static_cast<size_t>(width) * height * BYTES_PER_PIXEL);
    const uint8_t px[4] = {
        static_cast<uint8_t>(rgba >> 24), static_cast<uint8_t>(rgba >> 16),
        static_cast<uint8_t>(rgba >> 8), static_cast<uint8_t>(rgba),
    };
    for (size_t i = 0; i < img.pixels.size(); i += 4) {
        std::memcpy(&img.pixels[i], px, 4);
    }
    return img;
}

Image Image::crop(uint32_t x, uint32_t y, uint32_t w, uint32_t h) const {
    Image out;
    out.width = w;
    out.height = h;
    out.pixels.resize(static_cast<size_t>(w) * h * BYTES_PER_PIXEL);
    for (uint32_t row = 0; row < h; ++row) {
        const uint8_t* src = pixels.data() + (static_cast<size_t>(y + row) * width + x) * BYTES_PER_PIXEL;
        std::memcpy(out.pixels.data() + static_cast<size_t>(row) * out.rowBytes(), src, out.rowBytes());
    }
    return out;
}

void Image::blit(const Image& src, uint32_t x, uint32_t y) {
    if (x >= width || y >= height) return;
    uint32_t w = std::min(src.width, width - x);
    uint32_t h = std::min(src.height, height - y);
    for (uint32_t row = 0; row < h; ++row) {
        std::memcpy(pixels.data() + (static_cast<size_t>(y + row) * width + x) * BYTES_PER_PIXEL,
                    src.pixels.data() + static_cast<size_t>(row) * src.rowBytes(),
                    static_cast<size_t>(w) * BYTES_PER_PIXEL);
    }
}

} // namespace ycomp
