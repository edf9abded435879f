#include <XNS/Serialization/SourceDeclarationReader.hpp>

#include <XNS/Serialization/InputCursor.hpp>

#include <dlib/logger.h>

#include <string>
#include <vector>

namespace XNS::Serialization
{
    namespace
    {
        dlib::logger g_logger("xns.source");

        using VoidResult     = Utilities::Expected<void, ParseError>;
        using NameResult     = Utilities::Expected<std::string_view, ParseError>;
        using ValueResult    = Utilities::Expected<std::string, ParseError>;
        using LocationResult = Utilities::Expected<Namespaces::SchemaLocationMap, ParseError>;

        constexpr std::string_view kXmlnsPrefix = "xmlns:";

        struct ReadContext
        {
            InputCursor                  cursor;
            SourceReadOptions            options;
            UIntSize                     depth {0};
            Namespaces::SourceNamespaces result {};
        };

        struct Attribute
        {
            std::string_view name;
            std::string      value;
        };

        [[nodiscard]] ParseError MakeError(ParseErrorCode code, ParseLocation location, std::string message)
        {
            ParseError err;
            err.code     = code;
            err.location = location;
            err.message  = std::move(message);
            return err;
        }

        [[nodiscard]] ParseError MakeError(const ReadContext& ctx, ParseErrorCode code, std::string message)
        {
            return MakeError(code, ctx.cursor.Location(), std::move(message));
        }

        template<class T>
        [[nodiscard]] Utilities::Expected<T, ParseError> Fail(ParseError error)
        {
            return Utilities::Expected<T, ParseError>(Utilities::Unexpected<ParseError>(std::move(error)));
        }

        [[nodiscard]] bool IsAsciiAlpha(char c) noexcept
        {
            return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
        }

        [[nodiscard]] bool IsAsciiDigit(char c) noexcept
        {
            return c >= '0' && c <= '9';
        }

        // Bytes >= 0x80 are accepted so UTF-8 names pass through undecoded.
        [[nodiscard]] bool IsNameStart(char c) noexcept
        {
            return c == ':' || c == '_' || IsAsciiAlpha(c) || static_cast<unsigned char>(c) >= 0x80;
        }

        [[nodiscard]] bool IsNameChar(char c) noexcept
        {
            return IsNameStart(c) || IsAsciiDigit(c) || c == '-' || c == '.';
        }

        [[nodiscard]] bool IsWhitespace(char c) noexcept
        {
            return c == ' ' || c == '\t' || c == '\r' || c == '\n';
        }

        VoidResult SkipUntil(ReadContext& ctx, std::string_view endMarker)
        {
            while (!ctx.cursor.IsEof())
            {
                if (ctx.cursor.Consume(endMarker))
                    return {};
                ctx.cursor.Advance();
            }
            return Fail<void>(MakeError(ctx, ParseErrorCode::UnexpectedEnd, "Unexpected end of XML"));
        }

        VoidResult SkipDoctype(ReadContext& ctx)
        {
            int bracketDepth = 0;
            while (!ctx.cursor.IsEof())
            {
                const char c = ctx.cursor.Peek();
                if (c == '[')
                    ++bracketDepth;
                else if (c == ']')
                    --bracketDepth;
                else if (c == '>' && bracketDepth <= 0)
                {
                    ctx.cursor.Advance();
                    return {};
                }
                ctx.cursor.Advance();
            }
            return Fail<void>(MakeError(ctx, ParseErrorCode::UnexpectedEnd, "Unterminated DOCTYPE"));
        }

        /// Skip one comment, processing instruction or DOCTYPE at the cursor. Returns false when none starts here.
        Utilities::Expected<bool, ParseError> SkipMarkup(ReadContext& ctx)
        {
            if (ctx.cursor.Consume("<!--"))
            {
                if (auto skipped = SkipUntil(ctx, "-->"); !skipped)
                    return Fail<bool>(std::move(skipped).Error());
                return Utilities::Expected<bool, ParseError>(true);
            }
            if (ctx.cursor.Consume("<?"))
            {
                if (auto skipped = SkipUntil(ctx, "?>"); !skipped)
                    return Fail<bool>(std::move(skipped).Error());
                return Utilities::Expected<bool, ParseError>(true);
            }
            if (ctx.cursor.Consume("<!DOCTYPE"))
            {
                if (auto skipped = SkipDoctype(ctx); !skipped)
                    return Fail<bool>(std::move(skipped).Error());
                return Utilities::Expected<bool, ParseError>(true);
            }
            return Utilities::Expected<bool, ParseError>(false);
        }

        /// Skip whitespace, comments, processing instructions and DOCTYPE declarations.
        VoidResult SkipMisc(ReadContext& ctx)
        {
            while (true)
            {
                ctx.cursor.SkipWhitespace();
                auto skipped = SkipMarkup(ctx);
                if (!skipped)
                    return Fail<void>(std::move(skipped).Error());
                if (!skipped.ValueUnsafe())
                    return {};
            }
        }

        NameResult ParseName(ReadContext& ctx)
        {
            if (!IsNameStart(ctx.cursor.Peek()))
            {
                if (ctx.cursor.IsEof())
                    return Fail<std::string_view>(MakeError(ctx, ParseErrorCode::UnexpectedEnd, "Unexpected end of XML"));
                return Fail<std::string_view>(MakeError(ctx, ParseErrorCode::InvalidToken, "Invalid name"));
            }
            return NameResult(ctx.cursor.TakeWhile(IsNameChar));
        }

        [[nodiscard]] UInt32 HexValue(char c) noexcept
        {
            if (c >= '0' && c <= '9')
                return static_cast<UInt32>(c - '0');
            if (c >= 'a' && c <= 'f')
                return static_cast<UInt32>(c - 'a' + 10);
            return static_cast<UInt32>(c - 'A' + 10);
        }

        [[nodiscard]] bool IsHexDigit(char c) noexcept
        {
            return IsAsciiDigit(c) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
        }

        // XML 1.0 Char production: no surrogates, no C0 controls besides tab, LF and CR, no U+FFFE/U+FFFF.
        [[nodiscard]] bool IsXmlChar(UInt32 codepoint) noexcept
        {
            if (codepoint < 0x20)
                return codepoint == 0x9 || codepoint == 0xA || codepoint == 0xD;
            if (codepoint >= 0xD800 && codepoint <= 0xDFFF)
                return false;
            return codepoint != 0xFFFE && codepoint != 0xFFFF && codepoint <= 0x10FFFF;
        }

        bool DecodeNumber(std::string_view digits, UInt32& out, bool hex) noexcept
        {
            out = 0;
            if (digits.empty())
                return false;
            for (const char c: digits)
            {
                if (hex ? !IsHexDigit(c) : !IsAsciiDigit(c))
                    return false;
                out = hex ? ((out << 4) | HexValue(c)) : (out * 10U + static_cast<UInt32>(c - '0'));
                if (out > 0x10FFFF)
                    return false;
            }
            return IsXmlChar(out);
        }

        void AppendUtf8(std::string& out, UInt32 codepoint)
        {
            if (codepoint <= 0x7F)
            {
                out.push_back(static_cast<char>(codepoint));
            }
            else if (codepoint <= 0x7FF)
            {
                out.push_back(static_cast<char>(0xC0 | (codepoint >> 6)));
                out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
            }
            else if (codepoint <= 0xFFFF)
            {
                out.push_back(static_cast<char>(0xE0 | (codepoint >> 12)));
                out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
            }
            else
            {
                out.push_back(static_cast<char>(0xF0 | (codepoint >> 18)));
                out.push_back(static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
            }
        }

        ValueResult DecodeEntities(const ReadContext& ctx, std::string_view input)
        {
            std::string out;
            out.reserve(input.size());

            UIntSize pos = 0;
            while (pos < input.size())
            {
                const UIntSize amp = input.find('&', pos);
                if (amp == std::string_view::npos)
                {
                    out.append(input.substr(pos));
                    break;
                }
                out.append(input.substr(pos, amp - pos));

                const UIntSize semicolon = input.find(';', amp + 1);
                if (semicolon == std::string_view::npos)
                    return Fail<std::string>(MakeError(ctx, ParseErrorCode::InvalidEntity, "Unterminated entity"));

                const std::string_view entity = input.substr(amp + 1, semicolon - amp - 1);
                pos                           = semicolon + 1;

                if (entity == "lt")
                    out.push_back('<');
                else if (entity == "gt")
                    out.push_back('>');
                else if (entity == "amp")
                    out.push_back('&');
                else if (entity == "apos")
                    out.push_back('\'');
                else if (entity == "quot")
                    out.push_back('"');
                else if (entity.starts_with('#'))
                {
                    const bool hex       = entity.size() > 1 && (entity[1] == 'x' || entity[1] == 'X');
                    UInt32     codepoint = 0;
                    if (!DecodeNumber(entity.substr(hex ? 2 : 1), codepoint, hex))
                        return Fail<std::string>(MakeError(ctx, ParseErrorCode::InvalidEntity, "Invalid numeric entity"));
                    AppendUtf8(out, codepoint);
                }
                else
                {
                    return Fail<std::string>(MakeError(ctx, ParseErrorCode::InvalidEntity,
                                                       "Unknown entity '&" + std::string {entity} + ";'"));
                }
            }
            return ValueResult(std::move(out));
        }

        ValueResult ParseAttributeValue(ReadContext& ctx)
        {
            const char quote = ctx.cursor.Peek();
            if (quote != '"' && quote != '\'')
                return Fail<std::string>(MakeError(ctx, ParseErrorCode::InvalidToken, "Expected attribute quote"));
            ctx.cursor.Advance();

            const std::string_view raw = ctx.cursor.TakeWhile([quote](char c) noexcept { return c != quote && c != '<'; });
            if (ctx.cursor.Peek() == '<')
                return Fail<std::string>(MakeError(ctx, ParseErrorCode::UnexpectedCharacter, "'<' in attribute value"));
            if (ctx.cursor.IsEof())
                return Fail<std::string>(MakeError(ctx, ParseErrorCode::UnexpectedEnd, "Unterminated attribute"));
            ctx.cursor.Advance();
            return DecodeEntities(ctx, raw);
        }

        LocationResult ParseSchemaLocationTokens(std::string_view value, ParseLocation location)
        {
            std::vector<std::string_view> tokens;
            UIntSize                      pos = 0;
            while (pos < value.size())
            {
                while (pos < value.size() && IsWhitespace(value[pos]))
                    ++pos;
                const UIntSize start = pos;
                while (pos < value.size() && !IsWhitespace(value[pos]))
                    ++pos;
                if (pos > start)
                    tokens.push_back(value.substr(start, pos - start));
            }

            if (tokens.size() % 2 != 0)
            {
                return Fail<Namespaces::SchemaLocationMap>(MakeError(
                        ParseErrorCode::InvalidSchemaLocation, location,
                        "schemaLocation has an odd number of entries (" + std::to_string(tokens.size()) + ")"));
            }

            Namespaces::SchemaLocationMap locations;
            for (UIntSize i = 0; i < tokens.size(); i += 2)
                locations.try_emplace(std::string {tokens[i]}, tokens[i + 1]);
            return LocationResult(std::move(locations));
        }

        /// Parse `<name attr="value" ...` up to and including `>` or `/>`.
        VoidResult ReadStartTag(ReadContext& ctx, std::string_view& name, std::vector<Attribute>& attributes, bool& selfClosing)
        {
            if (ctx.cursor.Peek() != '<')
                return Fail<void>(MakeError(ctx, ParseErrorCode::InvalidToken, "Expected element start"));
            ctx.cursor.Advance();

            auto nameResult = ParseName(ctx);
            if (!nameResult)
                return Fail<void>(std::move(nameResult).Error());
            name = nameResult.ValueUnsafe();

            while (true)
            {
                const bool separated = ctx.cursor.SkipWhitespace();
                if (ctx.cursor.Consume("/>"))
                {
                    selfClosing = true;
                    return {};
                }
                if (ctx.cursor.Consume(">"))
                {
                    selfClosing = false;
                    return {};
                }
                if (ctx.cursor.IsEof())
                    return Fail<void>(MakeError(ctx, ParseErrorCode::UnexpectedEnd, "Unterminated start tag"));
                if (!separated)
                    return Fail<void>(MakeError(ctx, ParseErrorCode::UnexpectedCharacter, "Expected whitespace before attribute"));

                auto attrName = ParseName(ctx);
                if (!attrName)
                    return Fail<void>(std::move(attrName).Error());

                ctx.cursor.SkipWhitespace();
                if (ctx.cursor.Peek() != '=')
                    return Fail<void>(MakeError(ctx, ParseErrorCode::InvalidToken, "Expected '='"));
                ctx.cursor.Advance();
                ctx.cursor.SkipWhitespace();

                auto attrValue = ParseAttributeValue(ctx);
                if (!attrValue)
                    return Fail<void>(std::move(attrValue).Error());

                attributes.push_back(Attribute {attrName.ValueUnsafe(), std::move(attrValue).ValueUnsafe()});
            }
        }

        /// Record the element's declarations into `ctx.result`, extending `scope` with its bindings.
        VoidResult ApplyDeclarations(ReadContext& ctx, const std::vector<Attribute>& attributes, Namespaces::PrefixMap& scope)
        {
            for (const Attribute& attribute: attributes)
            {
                if (!attribute.name.starts_with(kXmlnsPrefix))
                    continue;

                const std::string_view prefix = attribute.name.substr(kXmlnsPrefix.size());
                if (prefix.empty() || prefix.find(':') != std::string_view::npos)
                    return Fail<void>(MakeError(ctx, ParseErrorCode::InvalidToken, "Invalid namespace prefix '" + std::string {prefix} + "'"));
                if (attribute.value.empty())
                {
                    g_logger << dlib::LDEBUG << "ignored empty declaration for prefix '" << prefix << "'";
                    continue;
                }

                scope.insert_or_assign(std::string {prefix}, attribute.value);

                const auto [it, inserted] = ctx.result.namespaces.try_emplace(std::string {prefix}, attribute.value);
                if (!inserted && it->second != attribute.value)
                {
                    g_logger << dlib::LWARN << "prefix '" << prefix << "' redeclared as '" << attribute.value
                             << "'; keeping '" << it->second << "'";
                }
            }

            for (const Attribute& attribute: attributes)
            {
                const UIntSize colon = attribute.name.find(':');
                if (colon == std::string_view::npos || attribute.name.substr(colon + 1) != "schemaLocation")
                    continue;

                const auto bound = scope.find(attribute.name.substr(0, colon));
                if (bound == scope.end() || bound->second != SourceDeclarationReader::SchemaInstanceNamespace)
                    continue;

                auto locations = ParseSchemaLocationTokens(attribute.value, ctx.cursor.Location());
                if (!locations)
                    return Fail<void>(std::move(locations).Error());
                for (auto& [namespaceUri, location]: locations.ValueUnsafe())
                    ctx.result.schemaLocations.try_emplace(namespaceUri, std::move(location));
            }
            return {};
        }

        VoidResult ReadElement(ReadContext& ctx, const Namespaces::PrefixMap& inherited);

        VoidResult ReadContent(ReadContext& ctx, std::string_view elementName, const Namespaces::PrefixMap& scope)
        {
            while (!ctx.cursor.IsEof())
            {
                if (ctx.cursor.Peek() != '<')
                {
                    ctx.cursor.Advance();
                    continue;
                }
                if (ctx.cursor.Peek(1) == '/')
                {
                    ctx.cursor.Advance(2);
                    auto endName = ParseName(ctx);
                    if (!endName)
                        return Fail<void>(std::move(endName).Error());
                    ctx.cursor.SkipWhitespace();
                    if (ctx.cursor.Peek() != '>')
                        return Fail<void>(MakeError(ctx, ParseErrorCode::InvalidToken, "Expected '>'"));
                    ctx.cursor.Advance();
                    if (endName.ValueUnsafe() != elementName)
                    {
                        return Fail<void>(MakeError(ctx, ParseErrorCode::MismatchedTag,
                                                    "Mismatched end tag '" + std::string {endName.ValueUnsafe()} +
                                                            "' for '" + std::string {elementName} + "'"));
                    }
                    return {};
                }
                if (ctx.cursor.Consume("<![CDATA["))
                {
                    if (auto skipped = SkipUntil(ctx, "]]>"); !skipped)
                        return skipped;
                    continue;
                }

                auto skipped = SkipMarkup(ctx);
                if (!skipped)
                    return Fail<void>(std::move(skipped).Error());
                if (skipped.ValueUnsafe())
                    continue;
                if (ctx.cursor.Peek(1) == '!')
                    return Fail<void>(MakeError(ctx, ParseErrorCode::InvalidToken, "Invalid markup declaration"));

                if (auto child = ReadElement(ctx, scope); !child)
                    return child;
            }
            return Fail<void>(MakeError(ctx, ParseErrorCode::UnexpectedEnd, "Unexpected end of XML"));
        }

        VoidResult ReadElement(ReadContext& ctx, const Namespaces::PrefixMap& inherited)
        {
            if (ctx.depth >= ctx.options.maxDepth)
                return Fail<void>(MakeError(ctx, ParseErrorCode::DepthExceeded, "Element nesting too deep"));
            ++ctx.depth;

            std::string_view       name;
            std::vector<Attribute> attributes;
            bool                   selfClosing = false;
            if (auto tag = ReadStartTag(ctx, name, attributes, selfClosing); !tag)
                return tag;

            Namespaces::PrefixMap scope = inherited;
            if (auto applied = ApplyDeclarations(ctx, attributes, scope); !applied)
                return applied;

            if (!selfClosing)
            {
                if (auto content = ReadContent(ctx, name, scope); !content)
                    return content;
            }
            --ctx.depth;
            return {};
        }
    }// namespace

    std::string_view ToString(ParseErrorCode code) noexcept
    {
        switch (code)
        {
            case ParseErrorCode::None:
                return "None";
            case ParseErrorCode::UnexpectedEnd:
                return "UnexpectedEnd";
            case ParseErrorCode::UnexpectedCharacter:
                return "UnexpectedCharacter";
            case ParseErrorCode::InvalidToken:
                return "InvalidToken";
            case ParseErrorCode::InvalidEntity:
                return "InvalidEntity";
            case ParseErrorCode::DepthExceeded:
                return "DepthExceeded";
            case ParseErrorCode::MismatchedTag:
                return "MismatchedTag";
            case ParseErrorCode::MissingRoot:
                return "MissingRoot";
            case ParseErrorCode::InvalidSchemaLocation:
                return "InvalidSchemaLocation";
        }
        Unreachable();
    }

    Utilities::Expected<Namespaces::SourceNamespaces, ParseError>
    SourceDeclarationReader::Read(std::string_view xml, const SourceReadOptions& options)
    {
        using ReadResult = Utilities::Expected<Namespaces::SourceNamespaces, ParseError>;

        ReadContext ctx {InputCursor(xml, options.trackLocation), options};

        // A UTF-8 byte order mark may precede the prolog.
        ctx.cursor.Consume("\xEF\xBB\xBF");

        if (auto prolog = SkipMisc(ctx); !prolog)
            return Fail<Namespaces::SourceNamespaces>(std::move(prolog).Error());
        if (ctx.cursor.Peek() != '<' || !IsNameStart(ctx.cursor.Peek(1)))
            return Fail<Namespaces::SourceNamespaces>(MakeError(ctx, ParseErrorCode::MissingRoot, "No root element"));

        if (options.scanDescendants)
        {
            if (auto root = ReadElement(ctx, {}); !root)
                return Fail<Namespaces::SourceNamespaces>(std::move(root).Error());
            if (auto epilog = SkipMisc(ctx); !epilog)
                return Fail<Namespaces::SourceNamespaces>(std::move(epilog).Error());
            if (!ctx.cursor.IsEof())
            {
                return Fail<Namespaces::SourceNamespaces>(
                        MakeError(ctx, ParseErrorCode::UnexpectedCharacter, "Trailing characters after root element"));
            }
        }
        else
        {
            std::string_view       name;
            std::vector<Attribute> attributes;
            bool                   selfClosing = false;
            if (auto tag = ReadStartTag(ctx, name, attributes, selfClosing); !tag)
                return Fail<Namespaces::SourceNamespaces>(std::move(tag).Error());

            Namespaces::PrefixMap scope;
            if (auto applied = ApplyDeclarations(ctx, attributes, scope); !applied)
                return Fail<Namespaces::SourceNamespaces>(std::move(applied).Error());
        }

        g_logger << dlib::LDEBUG << "read " << ctx.result.namespaces.size() << " namespace declarations and "
                 << ctx.result.schemaLocations.size() << " schema locations";
        return ReadResult(std::move(ctx.result));
    }

    Utilities::Expected<Namespaces::SchemaLocationMap, ParseError> SourceDeclarationReader::ParseSchemaLocation(std::string_view value)
    {
        return ParseSchemaLocationTokens(value, ParseLocation::Unknown());
    }
}// namespace XNS::Serialization
