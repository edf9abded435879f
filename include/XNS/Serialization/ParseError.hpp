#pragma once

#include <XNS/Defines.hpp>
#include <XNS/Primitives.hpp>

#include <string>
#include <string_view>

namespace XNS::Serialization
{
    /// @brief Structured parse error with location and human-readable context.
    enum class ParseErrorCode : UInt8
    {
        None,
        UnexpectedEnd,
        UnexpectedCharacter,
        InvalidToken,
        InvalidEntity,
        DepthExceeded,
        MismatchedTag,
        MissingRoot,
        InvalidSchemaLocation,
    };

    /// @brief Byte offset and optional line/column position for parse errors.
    struct ParseLocation
    {
        UIntSize offset {0};
        UIntSize line {0};
        UIntSize column {0};

        [[nodiscard]] static constexpr ParseLocation Unknown() noexcept
        {
            return ParseLocation {};
        }
    };

    /// @brief Parsing error payload with code, location, and message.
    struct ParseError
    {
        ParseErrorCode code {ParseErrorCode::None};
        ParseLocation  location {};
        std::string    message {};
    };

    [[nodiscard]] XNS_API std::string_view ToString(ParseErrorCode code) noexcept;
}// namespace XNS::Serialization
