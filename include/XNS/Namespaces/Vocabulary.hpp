#pragma once

#include <XNS/Defines.hpp>
#include <XNS/Namespaces/NamespaceTypes.hpp>

#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>

namespace XNS::Namespaces
{
    /// @brief Namespace and prefix used to mint identifiers for the document being written.
    struct DocumentIdentifier
    {
        static constexpr std::string_view DefaultNamespace = "http://example.com";
        static constexpr std::string_view DefaultPrefix    = "example";

        std::string namespaceUri {DefaultNamespace};
        std::string prefix {DefaultPrefix};

        [[nodiscard]] bool IsValid() const noexcept { return !namespaceUri.empty() && !prefix.empty(); }
    };

    /// @brief Immutable namespace -> prefix and namespace -> schema-location tables of the supported vocabularies.
    ///
    /// @details
    /// Tables are built once through `VocabularyTables::Builder` and shared read-only between registries.
    /// Every namespace of the prefix table is "well known"; the XML infrastructure namespaces (xsi, xs,
    /// xlink, ds) are also tracked separately because no schema location is expected for them. The
    /// baseline prefixes are declared in every output document.
    class XNS_API VocabularyTables
    {
    public:
        class Builder;

        /// @brief STIX 1.1.1 / CybOX 2.1 tables plus the extension vocabularies hosted alongside them.
        [[nodiscard]] static std::shared_ptr<const VocabularyTables> Default();

        [[nodiscard]] std::optional<std::string_view> FindPrefix(std::string_view namespaceUri) const noexcept;
        [[nodiscard]] std::optional<std::string_view> FindSchemaLocation(std::string_view namespaceUri) const noexcept;

        [[nodiscard]] bool IsWellKnown(std::string_view namespaceUri) const noexcept;
        [[nodiscard]] bool IsXmlInfrastructure(std::string_view namespaceUri) const noexcept;

        [[nodiscard]] const NamespacePrefixMap& NamespacePrefixes() const noexcept { return m_prefixes; }
        [[nodiscard]] const SchemaLocationMap&  SchemaLocations() const noexcept { return m_schemaLocations; }
        [[nodiscard]] const PrefixMap&          BaselinePrefixes() const noexcept { return m_baseline; }

    private:
        VocabularyTables() = default;

        NamespacePrefixMap                    m_prefixes {};
        SchemaLocationMap                     m_schemaLocations {};
        std::set<std::string, std::less<>>    m_xmlNamespaces {};
        PrefixMap                             m_baseline {};
    };

    /// @brief Accumulates vocabulary entries; later additions replace earlier ones for the same namespace.
    class XNS_API VocabularyTables::Builder
    {
    public:
        Builder() = default;

        /// @brief Start from a copy of existing tables, typically `*VocabularyTables::Default()`.
        explicit Builder(const VocabularyTables& base);

        /// @brief Add a vocabulary namespace. An empty `schemaLocation` registers the prefix only.
        Builder& AddNamespace(std::string_view namespaceUri, std::string_view prefix, std::string_view schemaLocation = {});
        Builder& AddSchemaLocation(std::string_view namespaceUri, std::string_view schemaLocation);
        Builder& AddXmlNamespace(std::string_view namespaceUri, std::string_view prefix);
        Builder& AddBaselinePrefix(std::string_view prefix, std::string_view namespaceUri);
        Builder& RemoveNamespace(std::string_view namespaceUri);

        Builder& AddXmlInfrastructure();
        Builder& AddStixVocabulary();
        Builder& AddCyboxVocabulary();
        Builder& AddExtensionVocabulary();
        Builder& AddStixBaseline();

        /// @brief MAEC 4.1 bindings. The MAEC default-vocabularies namespace gets a schema location but no prefix.
        Builder& AddMaecExtension();

        [[nodiscard]] std::shared_ptr<const VocabularyTables> Build() const;

    private:
        VocabularyTables m_tables {};
    };
}// namespace XNS::Namespaces
