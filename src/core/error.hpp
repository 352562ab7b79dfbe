#pragma once

/// @file error.hpp
/// @brief Exception type for malformed textual input.

#include "core/types.hpp"

#include <stdexcept>
#include <string>

namespace orbis
{
    /// @brief Thrown when a catalog angle string or a numeric field
    /// in an observation file cannot be parsed.
    class ParseError : public std::runtime_error
    {
    public:
        /// @param message Human-readable description, including the offending text.
        /// @param line 1-based line number in the source file, or 0 if not from a file.
        explicit ParseError(const std::string& message, u32 line = 0)
            : std::runtime_error(line == 0 ? message
                                           : "line " + std::to_string(line) + ": " + message)
            , m_line(line)
        {
        }

        /// @brief Line the error was found on (0 when not from a file).
        [[nodiscard]] u32 line() const noexcept { return m_line; }

    private:
        u32 m_line;
    };

} // namespace orbis
