#pragma once

/// @file error.hpp
/// @brief Exception hierarchy for contract violations.

#include "core/types.hpp"

#include <spdlog/fmt/fmt.h>

#include <stdexcept>
#include <string>
#include <string_view>

namespace zenith::core
{
    /// @brief Base class for every error Zenith throws.
    class Error : public std::runtime_error
    {
    public:
        explicit Error(const std::string& message)
            : std::runtime_error(message)
        {
        }
    };

    /// @brief A value lies outside its documented range.
    class InvalidArgument : public Error
    {
    public:
        explicit InvalidArgument(const std::string& message)
            : Error(message)
        {
        }

        InvalidArgument(std::string_view name, std::string_view requirement, f64 actual)
            : Error(build_message(name, requirement, actual))
        {
        }

    private:
        static std::string build_message(std::string_view name, std::string_view requirement, f64 actual)
        {
            return fmt::format("{} {}, got {}", name, requirement, actual);
        }
    };

    /// @brief An operation was requested in a state that does not allow it.
    class IllegalState : public Error
    {
    public:
        explicit IllegalState(const std::string& message)
            : Error(message)
        {
        }
    };

    /// @brief Requested slot counts exceed every supported parameter-set shape.
    class ConfigurationOverflow : public Error
    {
    public:
        ConfigurationOverflow(unsigned objects, unsigned cloud_layers)
            : Error(build_message(objects, cloud_layers))
        {
        }

    private:
        static std::string build_message(unsigned objects, unsigned cloud_layers)
        {
            return fmt::format("no material shape holds {} objects and {} cloud layers",
                               objects, cloud_layers);
        }
    };

    /// @brief The image service could not supply a texture.
    class ResourceError : public Error
    {
    public:
        explicit ResourceError(std::string_view path)
            : Error(fmt::format("texture not available: \"{}\"", path))
        {
        }
    };

} // namespace zenith::core
