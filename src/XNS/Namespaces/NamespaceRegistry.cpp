#include <XNS/Namespaces/NamespaceRegistry.hpp>

#include <dlib/logger.h>

#include <map>
#include <optional>

namespace XNS::Namespaces
{
    namespace
    {
        dlib::logger g_logger("xns.registry");

        using VoidResult      = Utilities::Expected<void, NamespaceError>;
        using PrefixMapResult = Utilities::Expected<PrefixMap, NamespaceError>;

        [[nodiscard]] NamespaceError MakeError(NamespaceErrorCode code, std::string message)
        {
            NamespaceError error;
            error.code    = code;
            error.message = std::move(message);
            return error;
        }

        [[nodiscard]] NamespaceError MakeConflict(std::string_view prefix, std::string_view existing, std::string_view incoming)
        {
            NamespaceError error;
            error.code              = NamespaceErrorCode::PrefixConflict;
            error.prefix            = std::string {prefix};
            error.existingNamespace = std::string {existing};
            error.newNamespace      = std::string {incoming};
            error.message           = "cannot map namespace prefix '" + error.prefix + "' to '" + error.newNamespace +
                            "': prefix already mapped to '" + error.existingNamespace + "'";
            return error;
        }

        /// Insert `prefix -> namespaceUri` unless `prefix` is already bound to a different namespace.
        [[nodiscard]] VoidResult CheckAndInsert(PrefixMap& map, std::string_view prefix, std::string_view namespaceUri)
        {
            const auto it = map.find(prefix);
            if (it == map.end())
            {
                map.emplace(std::string {prefix}, std::string {namespaceUri});
                return {};
            }
            if (it->second == namespaceUri)
                return {};
            return VoidResult(Utilities::Unexpected<NamespaceError>(MakeConflict(prefix, it->second, namespaceUri)));
        }

        /// Prefix part of `prefix:LocalName`, or nothing when the name does not split into two parts.
        [[nodiscard]] std::optional<std::string_view> QualifiedNamePrefix(std::string_view qualifiedName) noexcept
        {
            const auto colon = qualifiedName.find(':');
            if (colon == std::string_view::npos || colon == 0)
                return std::nullopt;
            if (qualifiedName.find(':', colon + 1) != std::string_view::npos)
                return std::nullopt;
            return qualifiedName.substr(0, colon);
        }

        [[nodiscard]] NamespaceDiagnostic MakeDiagnostic(DiagnosticKind kind, std::string_view namespaceUri, std::string message)
        {
            NamespaceDiagnostic diagnostic;
            diagnostic.kind         = kind;
            diagnostic.namespaceUri = std::string {namespaceUri};
            diagnostic.message      = std::move(message);
            return diagnostic;
        }
    }// namespace

    NamespaceRegistry::NamespaceRegistry(std::shared_ptr<const VocabularyTables>          vocabulary,
                                         std::shared_ptr<const Entities::EntityTypeTable> types,
                                         RegistryOptions                                  options)
        : m_vocabulary(std::move(vocabulary)), m_types(std::move(types)), m_options(std::move(options))
    {
        XNS_ASSERT(m_vocabulary != nullptr);
        XNS_ASSERT(m_types != nullptr);
    }

    void NamespaceRegistry::Collect(const Entities::Entity& entity)
    {
        if (m_finalizeCalled)
        {
            g_logger << dlib::LWARN << "entity collected after finalize was ignored";
            return;
        }

        const Entities::EntityTypeTag tag = entity.TypeTag();
        if (!m_visitedTypes.contains(tag))
        {
            if (const Entities::EntityTypeRecord* record = m_types->Find(tag))
            {
                m_visitedTypes.insert(record->lineage.begin(), record->lineage.end());
            }
            else
            {
                g_logger << dlib::LDEBUG << "entity type " << tag << " has no registered namespace metadata";
                m_visitedTypes.insert(tag);
            }
        }

        const SourceNamespaces* source = entity.Source();
        if (!source)
            return;
        for (const auto& [prefix, namespaceUri]: source->namespaces)
        {
            if (prefix.empty())
            {
                g_logger << dlib::LWARN << "ignored parsed declaration of '" << namespaceUri << "' with an empty prefix";
                continue;
            }
            m_inputNamespaces.emplace(prefix, namespaceUri);
        }
        for (const auto& [namespaceUri, location]: source->schemaLocations)
            m_inputSchemaLocations.emplace(namespaceUri, location);
    }

    NamespaceRegistry::Result NamespaceRegistry::Merge(const NamespaceRegistry& other)
    {
        if (m_finalizeCalled || other.m_finalizeCalled)
        {
            return Result(Utilities::Unexpected<NamespaceError>(
                    MakeError(NamespaceErrorCode::AlreadyFinalized, "cannot merge a finalized namespace registry")));
        }
        if (&other == this)
            return {};

        m_visitedTypes.insert(other.m_visitedTypes.begin(), other.m_visitedTypes.end());
        m_inputNamespaces.insert(other.m_inputNamespaces.begin(), other.m_inputNamespaces.end());
        m_inputSchemaLocations.insert(other.m_inputSchemaLocations.begin(), other.m_inputSchemaLocations.end());

        g_logger << dlib::LTRACE << "merged registry: " << m_visitedTypes.size() << " visited types, "
                 << m_inputNamespaces.size() << " input namespaces";
        return {};
    }

    NamespaceRegistry::Result NamespaceRegistry::Finalize(const PrefixMap* prefixOverrides, const SchemaLocationMap* schemaLocationOverrides)
    {
        if (m_finalizeCalled)
        {
            return Result(Utilities::Unexpected<NamespaceError>(
                    MakeError(NamespaceErrorCode::AlreadyFinalized, "namespace registry was already finalized")));
        }
        m_finalizeCalled = true;

        const DocumentIdentifier& identifier = m_options.documentIdentifier;
        if (!identifier.IsValid())
        {
            return Result(Utilities::Unexpected<NamespaceError>(MakeError(
                    NamespaceErrorCode::InvalidDocumentIdentifier,
                    "document identifier needs both a namespace and a prefix (got '" + identifier.namespaceUri + "', '" +
                            identifier.prefix + "')")));
        }

        auto collected = DeriveAliases();
        if (!collected)
        {
            g_logger << dlib::LERROR << collected.ErrorUnsafe().message;
            return Result(Utilities::Unexpected<NamespaceError>(std::move(collected).Error()));
        }

        auto namespaces = FinalizeNamespaces(collected.ValueUnsafe(), prefixOverrides);
        if (!namespaces)
        {
            g_logger << dlib::LERROR << namespaces.ErrorUnsafe().message;
            return Result(Utilities::Unexpected<NamespaceError>(std::move(namespaces).Error()));
        }

        std::vector<NamespaceDiagnostic> diagnostics;
        SchemaLocationMap schemaLocations = FinalizeSchemaLocations(namespaces.ValueUnsafe(), schemaLocationOverrides, diagnostics);

        m_finalizedNamespaces      = std::move(namespaces).ValueUnsafe();
        m_finalizedSchemaLocations = std::move(schemaLocations);
        m_diagnostics              = std::move(diagnostics);
        m_finalized                = true;

        g_logger << dlib::LDEBUG << "finalized " << m_finalizedNamespaces.size() << " namespace prefixes and "
                 << m_finalizedSchemaLocations.size() << " schema locations";
        return {};
    }

    Utilities::Expected<NamespaceRegistry::CollectedNamespaces, NamespaceError> NamespaceRegistry::DeriveAliases() const
    {
        using DeriveResult = Utilities::Expected<CollectedNamespaces, NamespaceError>;

        CollectedNamespaces collected;
        for (const Entities::EntityTypeTag tag: m_visitedTypes)
        {
            const Entities::EntityTypeRecord* record = m_types->Find(tag);
            if (!record || !record->namespaceUri || record->namespaceUri->empty())
                continue;

            const std::string& namespaceUri = *record->namespaceUri;

            std::optional<std::string_view> prefix;
            if (record->explicitPrefix && !record->explicitPrefix->empty())
                prefix = *record->explicitPrefix;
            else if (record->qualifiedName)
                prefix = QualifiedNamePrefix(*record->qualifiedName);

            if (!prefix)
            {
                collected.unaliased.insert(namespaceUri);
                continue;
            }

            auto inserted = CheckAndInsert(collected.aliased, *prefix, namespaceUri);
            if (!inserted)
                return DeriveResult(Utilities::Unexpected<NamespaceError>(std::move(inserted).Error()));
        }
        return DeriveResult(std::move(collected));
    }

    Utilities::Expected<PrefixMap, NamespaceError>
    NamespaceRegistry::FinalizeNamespaces(const CollectedNamespaces& collected, const PrefixMap* prefixOverrides) const
    {
        const DocumentIdentifier& identifier = m_options.documentIdentifier;

        PrefixMap working = m_vocabulary->BaselinePrefixes();
        if (auto seeded = CheckAndInsert(working, identifier.prefix, identifier.namespaceUri); !seeded)
            return PrefixMapResult(Utilities::Unexpected<NamespaceError>(std::move(seeded).Error()));

        // Older documents declare the identifier namespace with a trailing slash under the same prefix.
        std::set<StringPair> input = m_inputNamespaces;
        if (!identifier.namespaceUri.ends_with('/'))
        {
            const auto bound = working.find(identifier.prefix);
            if (bound != working.end() && bound->second == identifier.namespaceUri)
            {
                if (input.erase(StringPair {identifier.prefix, identifier.namespaceUri + "/"}) > 0)
                {
                    g_logger << dlib::LDEBUG << "dropped slash-terminated '" << identifier.namespaceUri
                             << "/' declaration for prefix '" << identifier.prefix << "'";
                }
            }
        }

        for (const auto& [prefix, namespaceUri]: input)
        {
            if (m_vocabulary->IsWellKnown(namespaceUri))
                continue;
            if (auto inserted = CheckAndInsert(working, prefix, namespaceUri); !inserted)
                return PrefixMapResult(Utilities::Unexpected<NamespaceError>(std::move(inserted).Error()));
        }

        for (const std::string& namespaceUri: collected.unaliased)
        {
            const auto prefix = m_vocabulary->FindPrefix(namespaceUri);
            if (!prefix)
            {
                NamespaceError error = MakeError(NamespaceErrorCode::UnknownNamespace,
                                                 "no default prefix is known for namespace '" + namespaceUri + "'");
                error.newNamespace = namespaceUri;
                return PrefixMapResult(Utilities::Unexpected<NamespaceError>(std::move(error)));
            }
            if (auto inserted = CheckAndInsert(working, *prefix, namespaceUri); !inserted)
                return PrefixMapResult(Utilities::Unexpected<NamespaceError>(std::move(inserted).Error()));
        }

        for (const auto& [prefix, namespaceUri]: collected.aliased)
        {
            if (auto inserted = CheckAndInsert(working, prefix, namespaceUri); !inserted)
                return PrefixMapResult(Utilities::Unexpected<NamespaceError>(std::move(inserted).Error()));
        }

        // Caller bindings are the base; computed bindings are laid over them.
        PrefixMap result;
        if (prefixOverrides)
        {
            for (const auto& [prefix, namespaceUri]: *prefixOverrides)
            {
                if (prefix.empty())
                {
                    g_logger << dlib::LWARN << "ignored override of '" << namespaceUri << "' with an empty prefix";
                    continue;
                }
                result.emplace(prefix, namespaceUri);
            }
        }
        for (const auto& [prefix, namespaceUri]: working)
        {
            if (auto inserted = CheckAndInsert(result, prefix, namespaceUri); !inserted)
                return PrefixMapResult(Utilities::Unexpected<NamespaceError>(std::move(inserted).Error()));
        }
        return PrefixMapResult(std::move(result));
    }

    SchemaLocationMap NamespaceRegistry::FinalizeSchemaLocations(const PrefixMap&                  namespaces,
                                                                 const SchemaLocationMap*          schemaLocationOverrides,
                                                                 std::vector<NamespaceDiagnostic>& diagnostics) const
    {
        SchemaLocationMap result = schemaLocationOverrides ? *schemaLocationOverrides : SchemaLocationMap {};

        // Pairs are ordered, so the lowest location wins when a namespace was parsed with several.
        for (const auto& [namespaceUri, location]: m_inputSchemaLocations)
            result.try_emplace(namespaceUri, location);

        const DocumentIdentifier&          identifier = m_options.documentIdentifier;
        std::set<std::string, std::less<>> reported;
        for (const auto& [prefix, namespaceUri]: namespaces)
        {
            if (const auto location = m_vocabulary->FindSchemaLocation(namespaceUri))
            {
                result.insert_or_assign(namespaceUri, std::string {*location});
                continue;
            }
            if (result.contains(namespaceUri))
                continue;
            if (namespaceUri == identifier.namespaceUri || m_vocabulary->IsXmlInfrastructure(namespaceUri))
                continue;
            if (!m_options.reportUnresolvedSchemaLocations || !reported.insert(namespaceUri).second)
                continue;

            NamespaceDiagnostic diagnostic = MakeDiagnostic(DiagnosticKind::UnresolvedSchemaLocation, namespaceUri,
                                                            "unable to map namespace '" + namespaceUri + "' to a schemaLocation");
            diagnostic.prefix = prefix;
            g_logger << dlib::LWARN << diagnostic.message;
            diagnostics.push_back(std::move(diagnostic));
        }
        return result;
    }

    std::vector<NamespaceDiagnostic> NamespaceRegistry::ValidateAliases(const NamespacePrefixMap& namespaces)
    {
        std::vector<NamespaceDiagnostic> diagnostics;
        std::map<std::string_view, std::string_view> owners;
        for (const auto& [namespaceUri, prefix]: namespaces)
        {
            const auto [it, inserted] = owners.emplace(prefix, namespaceUri);
            if (inserted)
                continue;

            NamespaceDiagnostic diagnostic = MakeDiagnostic(DiagnosticKind::DuplicateAlias, namespaceUri,
                                                            "namespace alias '" + prefix + "' mapped to '" +
                                                                    std::string {it->second} + "' and '" + namespaceUri + "'");
            diagnostic.prefix         = prefix;
            diagnostic.otherNamespace = std::string {it->second};
            g_logger << dlib::LWARN << diagnostic.message;
            diagnostics.push_back(std::move(diagnostic));
        }
        return diagnostics;
    }
}// namespace XNS::Namespaces
