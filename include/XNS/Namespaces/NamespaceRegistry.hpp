/// @file NamespaceRegistry.hpp
/// @brief Collects namespace usage from entities and computes the final prefix and schema-location maps.
#pragma once

#include <XNS/Defines.hpp>
#include <XNS/Entities/Entity.hpp>
#include <XNS/Entities/EntityTypeTable.hpp>
#include <XNS/Namespaces/NamespaceTypes.hpp>
#include <XNS/Namespaces/Vocabulary.hpp>
#include <XNS/Primitives.hpp>
#include <XNS/Utilities/Expected.hpp>

#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace XNS::Namespaces
{
    /// @brief Registry configuration.
    struct RegistryOptions
    {
        DocumentIdentifier documentIdentifier {};
        bool               reportUnresolvedSchemaLocations {true};
    };

    /// @brief Per-document accumulator of namespace facts.
    ///
    /// @details
    /// Lifecycle: any number of `Collect` / `Merge` calls, then exactly one `Finalize`. A registry is
    /// read-only afterwards; a second `Finalize` (or a `Merge` involving a finalized registry) fails with
    /// `NamespaceErrorCode::AlreadyFinalized` and leaves the first result in place. A failed `Finalize`
    /// publishes nothing and also counts as the one allowed call.
    ///
    /// Alias derivation from the visited entity types is deferred to `Finalize`, so collecting the same
    /// type many times costs one set lookup per entity. Parsed-source data is unioned per entity.
    ///
    /// Not thread-safe. Collect sub-trees into separate registries and `Merge` them instead.
    class XNS_API NamespaceRegistry
    {
    public:
        using Result = Utilities::Expected<void, NamespaceError>;

        NamespaceRegistry(std::shared_ptr<const VocabularyTables>          vocabulary,
                          std::shared_ptr<const Entities::EntityTypeTable> types,
                          RegistryOptions                                  options = {});

        /// @brief Record the entity's type lineage and any namespace declarations it was parsed with.
        void Collect(const Entities::Entity& entity);

        /// @brief Union `other`'s visited types and parsed-source data into this registry.
        Result Merge(const NamespaceRegistry& other);

        /// @brief Compute the finalized namespace and schema-location maps.
        ///
        /// Every prefix maps to exactly one namespace. Two visited entity types that bind the same prefix
        /// to different namespaces fail with `PrefixConflict` instead of letting the later type win.
        /// Entries with an empty prefix, in parsed declarations or in `prefixOverrides`, are skipped
        /// with a warning.
        ///
        /// @param prefixOverrides Caller prefix -> namespace bindings; may be null.
        /// @param schemaLocationOverrides Caller namespace -> location hints; may be null. Default table
        ///        locations still take precedence over them.
        Result Finalize(const PrefixMap* prefixOverrides = nullptr, const SchemaLocationMap* schemaLocationOverrides = nullptr);

        [[nodiscard]] bool IsFinalized() const noexcept { return m_finalized; }

        /// @brief Empty until a successful `Finalize`.
        [[nodiscard]] const PrefixMap&         FinalizedNamespaces() const noexcept { return m_finalizedNamespaces; }
        [[nodiscard]] const SchemaLocationMap& FinalizedSchemaLocations() const noexcept { return m_finalizedSchemaLocations; }

        [[nodiscard]] const std::vector<NamespaceDiagnostic>& Diagnostics() const noexcept { return m_diagnostics; }

        [[nodiscard]] UIntSize               VisitedTypeCount() const noexcept { return m_visitedTypes.size(); }
        [[nodiscard]] const RegistryOptions& Options() const noexcept { return m_options; }

        /// @brief Report every prefix that `namespaces` (namespace -> prefix) assigns to more than one namespace.
        [[nodiscard]] static std::vector<NamespaceDiagnostic> ValidateAliases(const NamespacePrefixMap& namespaces);

    private:
        struct CollectedNamespaces
        {
            PrefixMap                          aliased {};
            std::set<std::string, std::less<>> unaliased {};
        };

        using StringPair = std::pair<std::string, std::string>;

        [[nodiscard]] Utilities::Expected<CollectedNamespaces, NamespaceError> DeriveAliases() const;

        [[nodiscard]] Utilities::Expected<PrefixMap, NamespaceError>
        FinalizeNamespaces(const CollectedNamespaces& collected, const PrefixMap* prefixOverrides) const;

        [[nodiscard]] SchemaLocationMap FinalizeSchemaLocations(const PrefixMap&                  namespaces,
                                                                const SchemaLocationMap*          schemaLocationOverrides,
                                                                std::vector<NamespaceDiagnostic>& diagnostics) const;

        std::shared_ptr<const VocabularyTables>          m_vocabulary;
        std::shared_ptr<const Entities::EntityTypeTable> m_types;
        RegistryOptions                                  m_options;

        std::set<Entities::EntityTypeTag> m_visitedTypes {};
        std::set<StringPair>              m_inputNamespaces {};      // (prefix, namespace)
        std::set<StringPair>              m_inputSchemaLocations {}; // (namespace, location)

        PrefixMap                        m_finalizedNamespaces {};
        SchemaLocationMap                m_finalizedSchemaLocations {};
        std::vector<NamespaceDiagnostic> m_diagnostics {};
        bool                             m_finalizeCalled {false};
        bool                             m_finalized {false};
    };
}// namespace XNS::Namespaces
