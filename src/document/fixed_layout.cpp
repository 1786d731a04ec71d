#include "document/fixed_layout.h"
#include <algorithm>
#include <cmath>

namespace docsan {
namespace document {

Rect Rect::intersect(const Rect& other) const {
    Rect r{std::max(x0, other.x0), std::max(y0, other.y0),
           std::min(x1, other.x1), std::min(y1, other.y1)};
    if (r.isEmpty()) {
        return Rect{};
    }
    return r;
}

Rect Rect::unite(const Rect& other) const {
    if (isEmpty()) return other;
    if (other.isEmpty()) return *this;
    return Rect{std::min(x0, other.x0), std::min(y0, other.y0),
                std::max(x1, other.x1), std::max(y1, other.y1)};
}

bool Rect::intersects(const Rect& other) const {
    return x1 > other.x0 && x0 < other.x1 && y1 > other.y0 && y0 < other.y1;
}

bool Rect::contains(double x, double y) const {
    return x >= x0 && x <= x1 && y >= y0 && y <= y1;
}

RgbColor RgbColor::fromInt(uint32_t color) {
    return RgbColor{((color >> 16) & 0xFF) / 255.0,
                    ((color >> 8) & 0xFF) / 255.0,
                    (color & 0xFF) / 255.0};
}

uint32_t RgbColor::toInt() const {
    auto channel = [](double v) {
        double clamped = std::min(1.0, std::max(0.0, v));
        return static_cast<uint32_t>(std::lround(clamped * 255.0));
    };
    return (channel(r) << 16) | (channel(g) << 8) | channel(b);
}

} // namespace document
} // namespace docsan
