// main.cpp
#include <iostream>
#include <memory>
#include <string_view>
#include <utility>

#include <XNS/Entities/Entity.hpp>
#include <XNS/Entities/EntityTypeTable.hpp>
#include <XNS/Logging.hpp>
#include <XNS/Namespaces/NamespaceResolver.hpp>
#include <XNS/Serialization/SourceDeclarationReader.hpp>

using namespace XNS::Entities;
using namespace XNS::Namespaces;
using namespace XNS::Serialization;

// A few STIX / CybOX types with the namespace metadata their bindings declare
std::shared_ptr<const EntityTypeTable> BuildTypes()
{
    EntityTypeTable::Builder builder;
    const EntityTypeInfo     types[] = {
            {"STIXPackage", "http://stix.mitre.org/stix-1", "stix", {}, {}},
            {"Indicator", "http://stix.mitre.org/Indicator-2", {}, "indicator:IndicatorType", {}},
            {"Observable", "http://cybox.mitre.org/cybox-2", "cybox", {}, {}},
            {"ObjectProperties", "http://cybox.mitre.org/common-2", {}, {}, {}},
            {"Address", "http://cybox.mitre.org/objects#AddressObject-2", {}, "AddressObj:AddressObjectType", "ObjectProperties"},
            {"File", "http://cybox.mitre.org/objects#FileObject-2", {}, {}, "ObjectProperties"},
    };
    for (const EntityTypeInfo& info: types)
    {
        if (auto registered = builder.Register(info); !registered)
        {
            std::cerr << "type registration failed: " << registered.ErrorUnsafe().message << "\n";
            return nullptr;
        }
    }
    return builder.Build();
}

constexpr std::string_view kSourceDocument = R"(<?xml version="1.0" encoding="UTF-8"?>
<stix:STIX_Package
    xmlns:stix="http://stix.mitre.org/stix-1"
    xmlns:acme="http://acme.example/schemas/acme-1"
    xmlns:xsi="http://www.w3.org/2001/XMLSchema-instance"
    xsi:schemaLocation="http://acme.example/schemas/acme-1 http://acme.example/schemas/acme.xsd"/>)";

int main()
{
    XNS::Logging::Configure(XNS::Logging::LogLevel::Warn, std::cerr);

    auto types = BuildTypes();
    if (!types)
        return 1;

    auto source = SourceDeclarationReader::Read(kSourceDocument);
    if (!source)
    {
        const ParseError& error = source.ErrorUnsafe();
        std::cerr << "source document: " << error.message << " at " << error.location.line << ":"
                  << error.location.column << "\n";
        return 1;
    }

    EntityNode package {"STIXPackage"};
    package.SetSource(std::move(source).ValueUnsafe());

    EntityNode& indicator  = package.EmplaceChild("Indicator");
    EntityNode& observable = indicator.EmplaceChild("Observable");
    observable.EmplaceChild("Address");
    observable.EmplaceChild("File");
    // Shared observable referenced from the package as well
    package.AddReference(observable);

    NamespaceResolver resolver {types};
    auto              resolved = resolver.Resolve(package);
    if (!resolved)
    {
        std::cerr << "namespace resolution failed: " << resolved.ErrorUnsafe().message << "\n";
        return 1;
    }

    const ResolvedNamespaces& result = resolved.ValueUnsafe();
    std::cout << "<stix:STIX_Package\n\t"
              << NamespaceResolver::RenderNamespaceDefinitions(result.namespaces, result.schemaLocations)
              << "/>\n";

    for (const NamespaceDiagnostic& diagnostic: result.diagnostics)
        std::cout << "[" << ToString(diagnostic.kind) << "] " << diagnostic.message << "\n";
    return 0;
}
