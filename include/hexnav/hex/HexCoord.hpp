#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace hexnav {

// Round to nearest, exact halves go to the even integer.
[[nodiscard]] int32_t RoundHalfEven(float v) noexcept;

// World-space position. Hex layout lives on the XZ plane; y is always 0.
struct WorldPos {
    float x{}, y{}, z{};
    constexpr bool operator==(const WorldPos&) const = default;
};

// Axial hex coordinate, pointy-top orientation. s is derived so q + r + s == 0 always holds.
class HexCoord {
public:
    static constexpr int kDirectionCount = 6;

    constexpr HexCoord() = default;
    constexpr HexCoord(int32_t q, int32_t r) noexcept : q_(q), r_(r) {}

    [[nodiscard]] constexpr int32_t q() const noexcept { return q_; }
    [[nodiscard]] constexpr int32_t r() const noexcept { return r_; }
    [[nodiscard]] constexpr int32_t s() const noexcept { return -q_ - r_; }

    [[nodiscard]] WorldPos ToWorld(float hexSize) const noexcept;
    // hexSize <= 0 (or NaN) yields the origin.
    [[nodiscard]] static HexCoord FromWorld(const WorldPos& pos, float hexSize) noexcept;

    // Cube rounding of fractional axial coordinates. Components round half-to-even, then the
    // one with the largest error is rebuilt from the other two: q if its error is strictly
    // the largest, else r if it beats s, else s.
    [[nodiscard]] static HexCoord Round(float q, float r) noexcept;

    // Row-major map cell (col, row) to axial: q = col - row/2, r = row.
    [[nodiscard]] static constexpr HexCoord FromOffset(int32_t col, int32_t row) noexcept {
        return { col - row / 2, row };
    }

    [[nodiscard]] int32_t DistanceTo(const HexCoord& other) const noexcept;

    // E, NE, NW, W, SW, SE
    [[nodiscard]] std::array<HexCoord, kDirectionCount> Neighbors() const noexcept;
    // direction is taken modulo 6; negative values wrap forward.
    [[nodiscard]] HexCoord Neighbor(int direction) const noexcept;

    [[nodiscard]] std::string ToString() const;

    constexpr bool operator==(const HexCoord& o) const noexcept { return q_ == o.q_ && r_ == o.r_; }
    constexpr bool operator!=(const HexCoord& o) const noexcept { return !(*this == o); }

private:
    int32_t q_ = 0;
    int32_t r_ = 0;
};

struct HexCoordHash {
    size_t operator()(const HexCoord& c) const noexcept {
        const uint64_t uq = static_cast<uint64_t>(static_cast<uint32_t>(c.q()));
        const uint64_t ur = static_cast<uint64_t>(static_cast<uint32_t>(c.r()));
        uint64_t k = (uq << 32) | ur;
        // SplitMix64 finalizer
        k += 0x9e3779b97f4a7c15ull;
        k = (k ^ (k >> 30)) * 0xbf58476d1ce4e5b9ull;
        k = (k ^ (k >> 27)) * 0x94d049bb133111ebull;
        k ^= (k >> 31);
        if constexpr (sizeof(size_t) < sizeof(uint64_t)) {
            return static_cast<size_t>(k ^ (k >> 32));
        } else {
            return static_cast<size_t>(k);
        }
    }
};

} // namespace hexnav
