#pragma once

#include <cstddef>
#include <functional>
#include <nlohmann/json.hpp>
#include <string>

namespace GardenSim {

/**
 * Templated 2D vector used for tile coordinates and offsets.
 */
template <typename T>
struct Vector2 {
    T x = T{};
    T y = T{};

    Vector2 add(const Vector2& other) const { return { x + other.x, y + other.y }; }

    Vector2 subtract(const Vector2& other) const { return { x - other.x, y - other.y }; }

    T magnitudeSquared() const { return x * x + y * y; }

    // Chebyshev (king-move) length: max(|x|, |y|).
    T chebyshev() const
    {
        T ax = x < T{} ? -x : x;
        T ay = y < T{} ? -y : y;
        return ax > ay ? ax : ay;
    }

    std::string toString() const
    {
        return "(" + std::to_string(x) + ", " + std::to_string(y) + ")";
    }

    Vector2 operator+(const Vector2& other) const { return add(other); }

    Vector2 operator-(const Vector2& other) const { return subtract(other); }

    bool operator==(const Vector2& other) const { return x == other.x && y == other.y; }

    bool operator!=(const Vector2& other) const { return !(*this == other); }
};

using Vector2i = Vector2<int>;

template <typename T>
inline void to_json(nlohmann::json& j, const Vector2<T>& v)
{
    j = nlohmann::json{ { "x", v.x }, { "y", v.y } };
}

} // namespace GardenSim

namespace std {
template <typename T>
struct hash<GardenSim::Vector2<T>> {
    std::size_t operator()(const GardenSim::Vector2<T>& v) const noexcept
    {
        std::size_t h1 = std::hash<T>{}(v.x);
        std::size_t h2 = std::hash<T>{}(v.y);
        return h1 ^ (h2 << 1);
    }
};
} // namespace std
