#pragma once

#include <ycomp/result.hpp>
#include <cstdint>
#include <vector>

namespace ycomp {

// Decoded RGBA8 image, rows top to bottom, no padding.
struct Image {
    static constexpr uint32_t BYTES_PER_PIXEL = 4;

    uint32_t width = 0;
    uint32_t height = 0;
    std::vector<uint8_t> pixels;

    static Result<Image> fromRgba8(uint32_t width, uint32_t height, std::vector<uint8_t> pixels);
    static Image filled(uint32_t width, uint32_t height, uint32_t rgba);

    bool empty() const { return width == 0 || height == 0; }
    uint64_t area() const { return static_cast<uint64_t>(width) * height; }
    uint32_t rowBytes() const { return width * BYTES_PER_PIXEL; }

    // Sub-image copy; the rectangle must lie inside the image
    Image crop(uint32_t x, uint32_t y, uint32_t w, uint32_t h) const;

    // Copy src into this image at (x, y), clipped to bounds
    void blit(const Image& src, uint32_t x, uint32_t y);
};

} // namespace ycomp
