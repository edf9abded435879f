#include <XNS/Namespaces/NamespaceResolver.hpp>

#include <dlib/logger.h>

#include <algorithm>
#include <string_view>
#include <utility>

namespace XNS::Namespaces
{
    namespace
    {
        dlib::logger g_logger("xns.resolver");

        /// Append `value` with the characters that cannot appear inside a double-quoted attribute escaped.
        void AppendAttributeValue(std::string& out, std::string_view value)
        {
            for (const char c: value)
            {
                switch (c)
                {
                    case '&':
                        out += "&amp;";
                        break;
                    case '<':
                        out += "&lt;";
                        break;
                    case '>':
                        out += "&gt;";
                        break;
                    case '"':
                        out += "&quot;";
                        break;
                    default:
                        out.push_back(c);
                        break;
                }
            }
        }
    }// namespace

    NamespaceResolver::NamespaceResolver(std::shared_ptr<const Entities::EntityTypeTable> types,
                                         std::shared_ptr<const VocabularyTables>          vocabulary,
                                         ResolverOptions                                  options)
        : m_types(std::move(types)), m_vocabulary(std::move(vocabulary)), m_options(std::move(options))
    {
        XNS_ASSERT(m_types != nullptr);
        XNS_ASSERT(m_vocabulary != nullptr);
    }

    NamespaceRegistry NamespaceResolver::CreateRegistry() const
    {
        return NamespaceRegistry(m_vocabulary, m_types, m_options.registry);
    }

    NamespaceResolver::ResolveResult NamespaceResolver::Resolve(const Entities::Entity&  root,
                                                                const PrefixMap*         prefixOverrides,
                                                                const SchemaLocationMap* schemaLocationOverrides) const
    {
        Entities::EntityStream entities = Entities::WalkEntities(root);
        return Resolve(entities, prefixOverrides, schemaLocationOverrides);
    }

    NamespaceResolver::ResolveResult NamespaceResolver::Resolve(Entities::EntityStream&  entities,
                                                                const PrefixMap*         prefixOverrides,
                                                                const SchemaLocationMap* schemaLocationOverrides) const
    {
        NamespaceRegistry registry = CreateRegistry();
        for (const Entities::Entity* entity: entities)
            registry.Collect(*entity);

        g_logger << dlib::LTRACE << "collected " << entities.YieldedCount() << " entities, "
                 << registry.VisitedTypeCount() << " distinct types";
        return Finish(registry, prefixOverrides, schemaLocationOverrides, {});
    }

    NamespaceResolver::ResolveResult NamespaceResolver::ResolveWithAliases(const Entities::Entity&   root,
                                                                           const NamespacePrefixMap& namespaceAliases,
                                                                           const SchemaLocationMap*  schemaLocationOverrides) const
    {
        std::vector<NamespaceDiagnostic> diagnostics;
        if (m_options.validateOverrideAliases)
            diagnostics = NamespaceRegistry::ValidateAliases(namespaceAliases);

        PrefixMap prefixOverrides;
        for (const auto& [namespaceUri, prefix]: namespaceAliases)
            prefixOverrides.insert_or_assign(prefix, namespaceUri);

        NamespaceRegistry      registry = CreateRegistry();
        Entities::EntityStream entities = Entities::WalkEntities(root);
        for (const Entities::Entity* entity: entities)
            registry.Collect(*entity);

        return Finish(registry, &prefixOverrides, schemaLocationOverrides, std::move(diagnostics));
    }

    NamespaceResolver::ResolveResult NamespaceResolver::ResolvePackage(std::span<const Entities::Entity* const> documents,
                                                                       const PrefixMap*                         prefixOverrides,
                                                                       const SchemaLocationMap* schemaLocationOverrides) const
    {
        NamespaceRegistry package = CreateRegistry();
        for (const Entities::Entity* document: documents)
        {
            if (!document)
                continue;

            NamespaceRegistry      part     = CreateRegistry();
            Entities::EntityStream entities = Entities::WalkEntities(*document);
            for (const Entities::Entity* entity: entities)
                part.Collect(*entity);

            if (auto merged = package.Merge(part); !merged)
                return ResolveResult(Utilities::Unexpected<NamespaceError>(std::move(merged).Error()));
        }

        g_logger << dlib::LDEBUG << "merged " << documents.size() << " documents into one package registry";
        return Finish(package, prefixOverrides, schemaLocationOverrides, {});
    }

    Utilities::Expected<PrefixMap, NamespaceError> NamespaceResolver::GetNamespaces(const Entities::Entity& root,
                                                                                    const PrefixMap*        prefixOverrides) const
    {
        using NamespacesResult = Utilities::Expected<PrefixMap, NamespaceError>;

        auto resolved = Resolve(root, prefixOverrides, nullptr);
        if (!resolved)
            return NamespacesResult(Utilities::Unexpected<NamespaceError>(std::move(resolved).Error()));
        return NamespacesResult(std::move(resolved.ValueUnsafe().namespaces));
    }

    Utilities::Expected<SchemaLocationMap, NamespaceError>
    NamespaceResolver::GetSchemaLocations(const Entities::Entity&  root,
                                          const PrefixMap*         prefixOverrides,
                                          const SchemaLocationMap* schemaLocationOverrides) const
    {
        using LocationsResult = Utilities::Expected<SchemaLocationMap, NamespaceError>;

        auto resolved = Resolve(root, prefixOverrides, schemaLocationOverrides);
        if (!resolved)
            return LocationsResult(Utilities::Unexpected<NamespaceError>(std::move(resolved).Error()));
        return LocationsResult(std::move(resolved.ValueUnsafe().schemaLocations));
    }

    NamespaceResolver::ResolveResult NamespaceResolver::Finish(NamespaceRegistry&               registry,
                                                               const PrefixMap*                 prefixOverrides,
                                                               const SchemaLocationMap*         schemaLocationOverrides,
                                                               std::vector<NamespaceDiagnostic> diagnostics) const
    {
        if (auto finalized = registry.Finalize(prefixOverrides, schemaLocationOverrides); !finalized)
            return ResolveResult(Utilities::Unexpected<NamespaceError>(std::move(finalized).Error()));

        ResolvedNamespaces resolved;
        resolved.namespaces      = registry.FinalizedNamespaces();
        resolved.schemaLocations = registry.FinalizedSchemaLocations();
        resolved.diagnostics     = std::move(diagnostics);
        resolved.diagnostics.insert(resolved.diagnostics.end(), registry.Diagnostics().begin(), registry.Diagnostics().end());
        return ResolveResult(std::move(resolved));
    }

    std::string NamespaceResolver::RenderXmlns(const PrefixMap& namespaces)
    {
        std::vector<std::pair<std::string_view, std::string_view>> ordered; // (namespace, prefix)
        ordered.reserve(namespaces.size());
        for (const auto& [prefix, namespaceUri]: namespaces)
            ordered.emplace_back(namespaceUri, prefix);
        std::sort(ordered.begin(), ordered.end());

        std::string out;
        for (const auto& [namespaceUri, prefix]: ordered)
        {
            if (!out.empty())
                out += "\n\t";
            out += "xmlns:";
            out += prefix;
            out += "=\"";
            AppendAttributeValue(out, namespaceUri);
            out.push_back('"');
        }
        return out;
    }

    std::string NamespaceResolver::RenderSchemaLocation(const SchemaLocationMap& schemaLocations)
    {
        if (schemaLocations.empty())
            return {};

        std::string out = "xsi:schemaLocation=\"\n\t";
        bool        first = true;
        for (const auto& [namespaceUri, location]: schemaLocations)
        {
            if (!first)
                out += "\n\t";
            first = false;
            AppendAttributeValue(out, namespaceUri);
            out.push_back(' ');
            AppendAttributeValue(out, location);
        }
        out.push_back('"');
        return out;
    }

    std::string NamespaceResolver::RenderNamespaceDefinitions(const PrefixMap& namespaces, const SchemaLocationMap& schemaLocations)
    {
        std::string       out       = RenderXmlns(namespaces);
        const std::string locations = RenderSchemaLocation(schemaLocations);
        if (!locations.empty())
        {
            if (!out.empty())
                out += "\n\t";
            out += locations;
        }
        return out;
    }
}// namespace XNS::Namespaces
