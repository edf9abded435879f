/// @file NamespaceResolver.hpp
/// @brief Walks a document, finalizes its namespaces and renders the root-element declarations.
#pragma once

#include <XNS/Defines.hpp>
#include <XNS/Entities/Entity.hpp>
#include <XNS/Entities/EntityStream.hpp>
#include <XNS/Entities/EntityTypeTable.hpp>
#include <XNS/Namespaces/NamespaceRegistry.hpp>
#include <XNS/Namespaces/NamespaceTypes.hpp>
#include <XNS/Namespaces/Vocabulary.hpp>
#include <XNS/Utilities/Expected.hpp>

#include <memory>
#include <span>
#include <string>
#include <vector>

namespace XNS::Namespaces
{
    /// @brief Resolver configuration.
    struct ResolverOptions
    {
        RegistryOptions registry {};
        /// Check namespace -> prefix overrides passed to `ResolveWithAliases` for shared prefixes.
        bool validateOverrideAliases {true};
    };

    /// @brief Finalized namespace data of one document.
    struct ResolvedNamespaces
    {
        PrefixMap                        namespaces {};
        SchemaLocationMap                schemaLocations {};
        std::vector<NamespaceDiagnostic> diagnostics {};
    };

    /// @brief Façade over `NamespaceRegistry`: one registry per call, collected from a full walk.
    class XNS_API NamespaceResolver
    {
    public:
        using ResolveResult = Utilities::Expected<ResolvedNamespaces, NamespaceError>;

        explicit NamespaceResolver(std::shared_ptr<const Entities::EntityTypeTable> types,
                                   std::shared_ptr<const VocabularyTables>          vocabulary = VocabularyTables::Default(),
                                   ResolverOptions                                  options    = {});

        [[nodiscard]] ResolveResult Resolve(const Entities::Entity&   root,
                                            const PrefixMap*          prefixOverrides         = nullptr,
                                            const SchemaLocationMap*  schemaLocationOverrides = nullptr) const;

        /// @brief Resolve from an arbitrary traversal. The stream is consumed.
        [[nodiscard]] ResolveResult Resolve(Entities::EntityStream&  entities,
                                            const PrefixMap*         prefixOverrides         = nullptr,
                                            const SchemaLocationMap* schemaLocationOverrides = nullptr) const;

        /// @brief Resolve with overrides written as namespace -> prefix.
        ///
        /// @details
        /// Two namespaces sharing one prefix in `namespaceAliases` are reported as `DuplicateAlias`
        /// diagnostics (when enabled) and the later namespace in URI order keeps the prefix.
        [[nodiscard]] ResolveResult ResolveWithAliases(const Entities::Entity&   root,
                                                       const NamespacePrefixMap& namespaceAliases,
                                                       const SchemaLocationMap*  schemaLocationOverrides = nullptr) const;

        /// @brief Collect each sub-document into its own registry, merge them, finalize once.
        [[nodiscard]] ResolveResult ResolvePackage(std::span<const Entities::Entity* const> documents,
                                                   const PrefixMap*                         prefixOverrides         = nullptr,
                                                   const SchemaLocationMap*                 schemaLocationOverrides = nullptr) const;

        [[nodiscard]] Utilities::Expected<PrefixMap, NamespaceError>
        GetNamespaces(const Entities::Entity& root, const PrefixMap* prefixOverrides = nullptr) const;

        [[nodiscard]] Utilities::Expected<SchemaLocationMap, NamespaceError>
        GetSchemaLocations(const Entities::Entity&  root,
                           const PrefixMap*         prefixOverrides         = nullptr,
                           const SchemaLocationMap* schemaLocationOverrides = nullptr) const;

        [[nodiscard]] NamespaceRegistry CreateRegistry() const;

        [[nodiscard]] const ResolverOptions& Options() const noexcept { return m_options; }

        /// @brief `xmlns:prefix="namespace"` lines sorted by namespace URI, joined with "\n\t".
        [[nodiscard]] static std::string RenderXmlns(const PrefixMap& namespaces);

        /// @brief `xsi:schemaLocation="..."` with one `namespace location` pair per line, or "" when empty.
        [[nodiscard]] static std::string RenderSchemaLocation(const SchemaLocationMap& schemaLocations);

        /// @brief Both renderings joined with "\n\t", skipping empty parts.
        [[nodiscard]] static std::string RenderNamespaceDefinitions(const PrefixMap& namespaces, const SchemaLocationMap& schemaLocations);

    private:
        [[nodiscard]] ResolveResult Finish(NamespaceRegistry&               registry,
                                           const PrefixMap*                 prefixOverrides,
                                           const SchemaLocationMap*         schemaLocationOverrides,
                                           std::vector<NamespaceDiagnostic> diagnostics) const;

        std::shared_ptr<const Entities::EntityTypeTable> m_types;
        std::shared_ptr<const VocabularyTables>          m_vocabulary;
        ResolverOptions                                  m_options;
    };
}// namespace XNS::Namespaces
