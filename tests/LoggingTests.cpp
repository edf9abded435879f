#include <XNS/Logging.hpp>

#include <catch2/catch_test_macros.hpp>

#include <XNS/Entities/Entity.hpp>
#include <XNS/Namespaces/NamespaceRegistry.hpp>

#include <iostream>
#include <sstream>

using namespace XNS;

namespace
{
    struct LogCapture
    {
        std::ostringstream output;

        explicit LogCapture(Logging::LogLevel level) { Logging::Configure(level, output); }
        ~LogCapture() { Logging::Configure(Logging::LogLevel::Error, std::cerr); }
    };
}// namespace

TEST_CASE("Warnings from every component reach the configured stream", "[logging]")
{
    LogCapture capture {Logging::LogLevel::Warn};

    const Namespaces::NamespacePrefixMap aliases {
            {"urn:a", "dup"},
            {"urn:b", "dup"},
    };
    REQUIRE(Namespaces::NamespaceRegistry::ValidateAliases(aliases).size() == 1);

    Entities::EntityTypeTable::Builder builder;
    Namespaces::NamespaceRegistry      registry(Namespaces::VocabularyTables::Default(), builder.Build());
    Entities::EntityNode               parsed {"ParsedDocument"};
    parsed.SetSource(Namespaces::SourceNamespaces {{{"acme", "http://acme.example/schemas/acme-1"}}, {}});
    registry.Collect(parsed);
    REQUIRE(registry.Finalize().HasValue());

    const std::string text = capture.output.str();
    CHECK(text.find("xns.registry") != std::string::npos);
    CHECK(text.find("namespace alias 'dup'") != std::string::npos);
    CHECK(text.find("unable to map namespace 'http://acme.example/schemas/acme-1'") != std::string::npos);
}

TEST_CASE("SetLevel silences records below the level", "[logging]")
{
    LogCapture capture {Logging::LogLevel::Warn};
    Logging::SetLevel(Logging::LogLevel::Error);

    const Namespaces::NamespacePrefixMap aliases {
            {"urn:a", "dup"},
            {"urn:b", "dup"},
    };
    REQUIRE(Namespaces::NamespaceRegistry::ValidateAliases(aliases).size() == 1);
    CHECK(capture.output.str().empty());
}
