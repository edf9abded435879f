/// @file SourceDeclarationReader.hpp
/// @brief Extracts namespace declarations and schema locations from existing XML documents.
#pragma once

#include <XNS/Defines.hpp>
#include <XNS/Namespaces/NamespaceTypes.hpp>
#include <XNS/Primitives.hpp>
#include <XNS/Serialization/ParseError.hpp>
#include <XNS/Utilities/Expected.hpp>

#include <string_view>

namespace XNS::Serialization
{
    /// @brief Declaration reading configuration.
    struct SourceReadOptions
    {
        /// Read declarations of every element instead of the root start tag only.
        bool     scanDescendants {false};
        bool     trackLocation {true};
        UIntSize maxDepth {256};
    };

    /// @brief Reader for the `SourceNamespaces` an entity parsed from `xml` should carry.
    ///
    /// @details
    /// Collects `xmlns:prefix="uri"` declarations and the `schemaLocation` attribute whose prefix is
    /// bound to the XML Schema instance namespace. Default namespace declarations have no prefix and are
    /// not reported. Without `scanDescendants` reading stops after the root start tag and the rest of the
    /// document is not checked. With it, a prefix declared twice keeps its first binding.
    class XNS_API SourceDeclarationReader
    {
    public:
        static constexpr std::string_view SchemaInstanceNamespace = "http://www.w3.org/2001/XMLSchema-instance";

        static Utilities::Expected<Namespaces::SourceNamespaces, ParseError>
        Read(std::string_view xml, const SourceReadOptions& options = {});

        /// @brief Split a whitespace-separated `namespace location ...` list into pairs.
        static Utilities::Expected<Namespaces::SchemaLocationMap, ParseError>
        ParseSchemaLocation(std::string_view value);
    };
}// namespace XNS::Serialization
