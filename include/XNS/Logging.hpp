#pragma once

#include <XNS/Defines.hpp>
#include <XNS/Primitives.hpp>

#include <ostream>

namespace XNS::Logging
{
    /// @brief Mirrors dlib's log levels so that callers need not include dlib.
    enum class LogLevel : UInt8
    {
        All,
        Trace,
        Debug,
        Info,
        Warn,
        Error,
        Fatal,
        None,
    };

    /// @brief Set the level of every `xns.*` logger.
    XNS_API void SetLevel(LogLevel level);

    /// @brief Set the level and destination of every `xns.*` logger.
    XNS_API void Configure(LogLevel level, std::ostream& output);
}// namespace XNS::Logging
