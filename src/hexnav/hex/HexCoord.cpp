#include "hexnav/hex/HexCoord.hpp"

#include <cmath>
#include <cstdlib>

namespace hexnav {

namespace {

constexpr float kSqrt3 = 1.7320508075688772f;

constexpr std::array<HexCoord, HexCoord::kDirectionCount> kDirections = {
    HexCoord{ 1,  0}, // E
    HexCoord{ 1, -1}, // NE
    HexCoord{ 0, -1}, // NW
    HexCoord{-1,  0}, // W
    HexCoord{-1,  1}, // SW
    HexCoord{ 0,  1}, // SE
};

} // namespace

int32_t RoundHalfEven(float v) noexcept
{
    const float fl = std::floor(v);
    const float diff = v - fl;
    int32_t i = static_cast<int32_t>(fl);
    if (diff > 0.5f)
        return i + 1;
    if (diff < 0.5f)
        return i;
    return (i % 2 == 0) ? i : i + 1;
}

HexCoord HexCoord::Round(float q, float r) noexcept
{
    const float s = -q - r;

    int32_t rq = RoundHalfEven(q);
    int32_t rr = RoundHalfEven(r);
    const int32_t rs = RoundHalfEven(s);

    const float qDiff = std::abs(static_cast<float>(rq) - q);
    const float rDiff = std::abs(static_cast<float>(rr) - r);
    const float sDiff = std::abs(static_cast<float>(rs) - s);

    if (qDiff > rDiff && qDiff > sDiff)
        rq = -rr - rs;
    else if (rDiff > sDiff)
        rr = -rq - rs;

    return { rq, rr };
}

WorldPos HexCoord::ToWorld(float hexSize) const noexcept
{
    const float fq = static_cast<float>(q_);
    const float fr = static_cast<float>(r_);
    return {
        hexSize * (kSqrt3 * fq + kSqrt3 / 2.0f * fr),
        0.0f,
        hexSize * (3.0f / 2.0f * fr),
    };
}

HexCoord HexCoord::FromWorld(const WorldPos& pos, float hexSize) noexcept
{
    if (!(hexSize > 0.0f))
        return {};

    const float q = (kSqrt3 / 3.0f * pos.x - 1.0f / 3.0f * pos.z) / hexSize;
    const float r = (2.0f / 3.0f * pos.z) / hexSize;
    return Round(q, r);
}

int32_t HexCoord::DistanceTo(const HexCoord& other) const noexcept
{
    return (std::abs(q_ - other.q_) + std::abs(r_ - other.r_) + std::abs(s() - other.s())) / 2;
}

std::array<HexCoord, HexCoord::kDirectionCount> HexCoord::Neighbors() const noexcept
{
    std::array<HexCoord, kDirectionCount> out{};
    for (int i = 0; i < kDirectionCount; ++i)
        out[i] = { q_ + kDirections[i].q(), r_ + kDirections[i].r() };
    return out;
}

HexCoord HexCoord::Neighbor(int direction) const noexcept
{
    direction %= kDirectionCount;
    if (direction < 0)
        direction += kDirectionCount;

    const HexCoord& d = kDirections[static_cast<size_t>(direction)];
    return { q_ + d.q(), r_ + d.r() };
}

std::string HexCoord::ToString() const
{
    return "Hex(" + std::to_string(q_) + ", " + std::to_string(r_) + ")";
}

} // namespace hexnav
