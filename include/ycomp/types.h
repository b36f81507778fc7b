#pragma once

#include <array>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace ycomp {

//=============================================================================
// Z levels - four fixed layers, drawn ascending (First lowest)
//=============================================================================

enum class ZLevel : uint8_t {
    First = 0,
    Second,
    Third,
    Fourth,
};

constexpr uint32_t Z_LEVEL_COUNT = 4;

constexpr std::array<ZLevel, Z_LEVEL_COUNT> ALL_Z_LEVELS = {
    ZLevel::First, ZLevel::Second, ZLevel::Third, ZLevel::Fourth,
};

constexpr uint32_t zIndex(ZLevel z) { return static_cast<uint32_t>(z); }

inline const char* zLevelName(ZLevel z) {
    switch (z) {
        case ZLevel::First: return "first";
        case ZLevel::Second: return "second";
        case ZLevel::Third: return "third";
        case ZLevel::Fourth: return "fourth";
    }
    return "?";
}

//=============================================================================
// Area handle
//=============================================================================

// Nonzero, assigned from 1 upwards and never reused.
// 0 is what the picking target holds where no area was drawn.
struct UiAreaHandle {
    uint32_t id = 0;

    bool isValid() const { return id != 0; }
    static UiAreaHandle none() { return {0}; }

    bool operator==(const UiAreaHandle& o) const { return id == o.id; }
    bool operator!=(const UiAreaHandle& o) const { return id != o.id; }
    bool operator<(const UiAreaHandle& o) const { return id < o.id; }
};

//=============================================================================
// Atlas records
//=============================================================================

struct AtlasRect {
    uint32_t x = 0;
    uint32_t y = 0;
    uint32_t width = 0;
    uint32_t height = 0;

    bool operator==(const AtlasRect& o) const {
        return x == o.x && y == o.y && width == o.width && height == o.height;
    }
    bool operator!=(const AtlasRect& o) const { return !(*this == o); }
};

// One sprite frame as the shader sees it (storage buffer, 20 byte stride).
// UVs are normalized by the edge of the texture array.
struct AtlasAllocation {
    float xMin;
    float xMax;
    float yMin;
    float yMax;
    uint32_t atlasIndex;
};
static_assert(sizeof(AtlasAllocation) == 20, "AtlasAllocation must match the WGSL layout");

// Offset table entry: frames of a sprite in the allocation table
struct SpriteRange {
    uint32_t offset;
    uint32_t count;
};
static_assert(sizeof(SpriteRange) == 8, "SpriteRange must match vec2<u32>");

//=============================================================================
// GPU instance records
//=============================================================================

constexpr uint32_t NO_SPRITE = 0xFFFFFFFFu;

struct AreaInstance {
    float xMin;
    float yMin;
    float xMax;
    float yMax;
    uint32_t spriteIndex;  // NO_SPRITE for text-only areas
    uint32_t areaId;
    uint32_t _pad[2];

    bool operator==(const AreaInstance& o) const {
        return xMin == o.xMin && yMin == o.yMin && xMax == o.xMax && yMax == o.yMax
            && spriteIndex == o.spriteIndex && areaId == o.areaId;
    }
};
static_assert(sizeof(AreaInstance) == 32, "AreaInstance must match the WGSL layout");

struct GlyphInstance {
    float x0, y0, x1, y1;   // screen pixels
    float u0, v0, u1, v1;   // glyph atlas UV
    uint32_t layer;
    uint32_t areaId;
    uint32_t _pad[2];
};
static_assert(sizeof(GlyphInstance) == 48, "GlyphInstance must match the WGSL layout");

//=============================================================================
// Type-erased area description (below the templated facade)
//=============================================================================

struct TextDesc {
    std::string text;
    uint32_t fontKey = 0;
    uint16_t size = 0;
};

struct AreaDesc {
    float xMin = 0.0f;
    float xMax = 0.0f;
    float yMin = 0.0f;
    float yMax = 0.0f;
    ZLevel z = ZLevel::First;
    std::optional<uint32_t> spriteKey;
    std::optional<TextDesc> text;
    bool enabled = true;

    bool hasPayload() const { return spriteKey.has_value() || text.has_value(); }
};

} // namespace ycomp

namespace std {
template<>
struct hash<ycomp::UiAreaHandle> {
    size_t operator()(const ycomp::UiAreaHandle& h) const noexcept {
        return std::hash<uint32_t>{}(h.id);
    }
};
} // namespace std
