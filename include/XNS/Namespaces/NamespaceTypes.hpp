#pragma once

#include <XNS/Defines.hpp>
#include <XNS/Primitives.hpp>

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace XNS::Namespaces
{
    /// @brief prefix -> namespace URI. The form every finalized mapping takes.
    using PrefixMap = std::map<std::string, std::string, std::less<>>;

    /// @brief namespace URI -> prefix. The form vocabulary tables and hand-written overrides take.
    using NamespacePrefixMap = std::map<std::string, std::string, std::less<>>;

    /// @brief namespace URI -> schema location URL.
    using SchemaLocationMap = std::map<std::string, std::string, std::less<>>;

    /// @brief Namespace declarations carried by an entity parsed from an existing XML document.
    struct SourceNamespaces
    {
        PrefixMap         namespaces {};
        SchemaLocationMap schemaLocations {};

        [[nodiscard]] bool IsEmpty() const noexcept { return namespaces.empty() && schemaLocations.empty(); }
    };

    /// @brief Fatal namespace resolution failures.
    enum class NamespaceErrorCode : UInt8
    {
        None,
        PrefixConflict,
        UnknownNamespace,
        AlreadyFinalized,
        InvalidDocumentIdentifier,
    };

    /// @brief Error payload for namespace finalization and registry merges.
    ///
    /// For `PrefixConflict`, `prefix` is the contested prefix, `existingNamespace` the namespace it was
    /// already bound to and `newNamespace` the one that tried to claim it.
    struct NamespaceError
    {
        NamespaceErrorCode code {NamespaceErrorCode::None};
        std::string        prefix {};
        std::string        existingNamespace {};
        std::string        newNamespace {};
        std::string        message {};
    };

    /// @brief Advisory findings. They never stop finalization.
    enum class DiagnosticKind : UInt8
    {
        UnresolvedSchemaLocation,
        DuplicateAlias,
    };

    struct NamespaceDiagnostic
    {
        DiagnosticKind kind {DiagnosticKind::UnresolvedSchemaLocation};
        std::string    namespaceUri {};
        std::string    prefix {};
        std::string    otherNamespace {};
        std::string    message {};
    };

    [[nodiscard]] XNS_API std::string_view ToString(NamespaceErrorCode code) noexcept;
    [[nodiscard]] XNS_API std::string_view ToString(DiagnosticKind kind) noexcept;
}// namespace XNS::Namespaces
