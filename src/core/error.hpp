#pragma once

/// @file error.hpp
/// @brief Exception type raised when chart input or configuration is rejected.

#include <stdexcept>
#include <string>

namespace astrolabe::core
{
    /// @brief Raised at entry to the engine when positions, aspect tables or
    /// rule tables violate their invariants. Nothing is computed once this is thrown.
    class InvalidInputError : public std::invalid_argument
    {
    public:
        explicit InvalidInputError(const std::string& what)
            : std::invalid_argument(what)
        {
        }
    };

} // namespace astrolabe::core
