#include <ycomp/shelf-allocator.h>
#include <sstream>

namespace ycomp {

ShelfAllocator::ShelfAllocator(uint32_t size)
    : _size(size) {}

std::optional<AtlasRect> ShelfAllocator::allocate(uint32_t width, uint32_t height) {
    if (width == 0 || height == 0 || width > _size || height > _size) {
        return std::nullopt;
    }

    // Best fit: the shelf with the least leftover height, first one on ties
    Shelf* best = nullptr;
    for (auto& shelf : _shelves) {
        if (shelf.height < height || shelf.cursorX + width > _size) continue;
        if (!best || shelf.height - height < best->height - height) {
            best = &shelf;
        }
    }

    if (!best) {
        if (_nextShelfY + height > _size) {
            return std::nullopt;
        }
        _shelves.push_back({_nextShelfY, height, 0});
        _nextShelfY += height;
        best = &_shelves.back();
    }

    AtlasRect rect{best->cursorX, best->y, width, height};
    best->cursorX += width;
    _usedArea += static_cast<uint64_t>(width) * height;
    _allocations.push_back(rect);
    return rect;
}

void ShelfAllocator::grow(uint32_t newSize) {
    if (newSize > _size) {
        _size = newSize;
    }
}

std::string ShelfAllocator::dumpSvg() const {
    std::ostringstream svg;
    svg << "<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"" << _size
        << "\" height=\"" << _size << "\" viewBox=\"0 0 " << _size << " " << _size << "\">\n";
    svg << "  <rect x=\"0\" y=\"0\" width=\"" << _size << "\" height=\"" << _size
        << "\" fill=\"#202020\"/>\n";

    for (const auto& shelf : _shelves) {
        svg << "  <rect x=\"0\" y=\"" << shelf.y << "\" width=\"" << _size
            << "\" height=\"" << shelf.height
            << "\" fill=\"none\" stroke=\"#505050\" stroke-dasharray=\"2\"/>\n";
    }

    for (size_t i = 0; i < _allocations.size(); ++i) {
        const auto& r = _allocations[i];
        svg << "  <rect x=\"" << r.x << "\" y=\"" << r.y << "\" width=\"" << r.width
            << "\" height=\"" << r.height
            << "\" fill=\"#3070c0\" fill-opacity=\"0.6\" stroke=\"#a0c8ff\"/>\n";
        svg << "  <text x=\"" << r.x + 2 << "\" y=\"" << r.y + 10
            << "\" font-size=\"8\" fill=\"white\">" << i << "</text>\n";
    }

    svg << "</svg>\n";
    return svg.str();
}

} // namespace ycomp
