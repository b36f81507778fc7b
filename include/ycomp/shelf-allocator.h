#pragma once

#include <ycomp/types.h>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ycomp {

/**
 * ShelfAllocator packs rectangles into a square region using shelves.
 *
 * A shelf is a horizontal strip whose height is fixed by the first rectangle
 * placed on it. Later rectangles go onto the shelf that wastes the least
 * height, or open a new shelf below the last one. Placement depends only on
 * the sequence of requests, so the same inputs give the same layout.
 *
 * grow() enlarges the region in place: existing placements stay valid,
 * shelves get wider and there is more room for new shelves.
 */
class ShelfAllocator {
public:
    explicit ShelfAllocator(uint32_t size);

    std::optional<AtlasRect> allocate(uint32_t width, uint32_t height);

    // newSize must not be smaller than the current size
    void grow(uint32_t newSize);

    uint32_t size() const { return _size; }
    bool isEmpty() const { return _allocations.empty(); }
    uint64_t usedArea() const { return _usedArea; }
    const std::vector<AtlasRect>& allocations() const { return _allocations; }

    // Human-inspection dump of the packing as an SVG document
    std::string dumpSvg() const;

private:
    struct Shelf {
        uint32_t y;
        uint32_t height;
        uint32_t cursorX;
    };

    uint32_t _size;
    uint32_t _nextShelfY = 0;
    uint64_t _usedArea = 0;
    std::vector<Shelf> _shelves;
    std::vector<AtlasRect> _allocations;
};

} // namespace ycomp
