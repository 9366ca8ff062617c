/// @file validate.cpp
/// @brief Argument validation helpers.

#include "core/validate.hpp"

#include "core/error.hpp"

#include <cmath>
#include <string>

namespace zenith::core
{

namespace
{
constexpr f64 kUnitTolerance = 1e-4;

std::string range_text(const char* open, f64 min, f64 max, const char* close)
{
    return fmt::format("should be in {}{}, {}{}", open, min, max, close);
}
} // namespace

void Validate::in_range(f64 value, std::string_view name, f64 min, f64 max)
{
    if (!(value >= min && value <= max)) {
        throw InvalidArgument(name, range_text("[", min, max, "]"), value);
    }
}

void Validate::in_open_range(f64 value, std::string_view name, f64 min, f64 max)
{
    if (!(value > min && value < max)) {
        throw InvalidArgument(name, range_text("(", min, max, ")"), value);
    }
}

void Validate::in_half_open_range(f64 value, std::string_view name, f64 min, f64 max)
{
    if (!(value >= min && value < max)) {
        throw InvalidArgument(name, range_text("[", min, max, ")"), value);
    }
}

void Validate::positive(f64 value, std::string_view name)
{
    if (!(value > 0.0)) {
        throw InvalidArgument(name, "should be positive", value);
    }
}

void Validate::non_negative(f64 value, std::string_view name)
{
    if (!(value >= 0.0)) {
        throw InvalidArgument(name, "should not be negative", value);
    }
}

void Validate::fraction(f64 value, std::string_view name)
{
    in_range(value, name, 0.0, 1.0);
}

void Validate::index_in_range(i32 value, std::string_view name, i32 min, i32 max)
{
    if (value < min || value > max) {
        throw InvalidArgument(fmt::format("{} should be between {} and {}, got {}",
                                          name, min, max, value));
    }
}

void Validate::unit_vector(const Vec3f& value, std::string_view name)
{
    unit_vector(Vec3d(value), name);
}

void Validate::unit_vector(const Vec3d& value, std::string_view name)
{
    const f64 length = glm::length(value);
    if (!std::isfinite(length) || std::abs(length - 1.0) > kUnitTolerance) {
        throw InvalidArgument(fmt::format("{} should be a unit vector, got ({}, {}, {})",
                                          name, value.x, value.y, value.z));
    }
}

void Validate::non_zero(const Vec2f& value, std::string_view name)
{
    if (value.x == 0.0f && value.y == 0.0f) {
        throw InvalidArgument(fmt::format("{} should not be zero", name));
    }
}

void Validate::uv(const Vec2f& value, std::string_view name)
{
    if (!(value.x >= 0.0f && value.x <= 1.0f && value.y >= 0.0f && value.y <= 1.0f)) {
        throw InvalidArgument(fmt::format("{} should lie in [0, 1]^2, got ({}, {})",
                                          name, value.x, value.y));
    }
}

} // namespace zenith::core
