#pragma once

#include <XNS/Primitives.hpp>
#include <XNS/Serialization/ParseError.hpp>

#include <string_view>

namespace XNS::Serialization
{
    /// @brief Forward-only view over XML text that reports positions for diagnostics.
    ///
    /// Reads past the end yield '\0'. Line and column are 1-based; a CRLF pair counts as one line break.
    class InputCursor
    {
    public:
        explicit InputCursor(std::string_view text, bool trackLocation = false) noexcept
            : m_text(text), m_trackLocation(trackLocation)
        {
        }

        [[nodiscard]] bool IsEof() const noexcept { return m_position >= m_text.size(); }

        [[nodiscard]] char Peek(UIntSize ahead = 0) const noexcept
        {
            return ahead < m_text.size() - m_position ? m_text[m_position + ahead] : '\0';
        }

        [[nodiscard]] std::string_view Remaining() const noexcept { return m_text.substr(m_position); }

        [[nodiscard]] bool StartsWith(std::string_view token) const noexcept { return Remaining().starts_with(token); }

        /// @brief Step over `token` when the input starts with it.
        bool Consume(std::string_view token) noexcept
        {
            if (!StartsWith(token))
                return false;
            Advance(token.size());
            return true;
        }

        /// @brief Step over the longest run of characters accepted by `accept` and return it.
        template<class Predicate>
        std::string_view TakeWhile(Predicate accept) noexcept
        {
            const UIntSize start = m_position;
            while (!IsEof() && accept(m_text[m_position]))
                Advance();
            return m_text.substr(start, m_position - start);
        }

        void Advance(UIntSize count = 1) noexcept
        {
            for (; count > 0 && !IsEof(); --count)
                Step();
        }

        /// @brief Returns true when any whitespace was skipped.
        bool SkipWhitespace() noexcept
        {
            return !TakeWhile([](char c) noexcept { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; }).empty();
        }

        [[nodiscard]] ParseLocation Location() const noexcept
        {
            if (!m_trackLocation)
                return ParseLocation {m_position, 0, 0};
            return ParseLocation {m_position, m_line, m_column};
        }

    private:
        void Step() noexcept
        {
            const char c = m_text[m_position++];
            if (!m_trackLocation)
                return;
            if (c == '\r' && Peek() == '\n')
                ++m_position;
            if (c == '\r' || c == '\n')
            {
                ++m_line;
                m_column = 1;
            }
            else
            {
                ++m_column;
            }
        }

        std::string_view m_text;
        UIntSize         m_position {0};
        bool             m_trackLocation {false};
        UIntSize         m_line {1};
        UIntSize         m_column {1};
    };
}// namespace XNS::Serialization
