#include <XNS/Serialization/SourceDeclarationReader.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <string_view>

using namespace XNS::Serialization;

TEST_CASE("SourceDeclarationReader reads root declarations and schema locations", "[serialization][source]")
{
    const char* input = R"(<?xml version="1.0" encoding="UTF-8"?>
<!-- exported by acme -->
<!DOCTYPE stix:STIX_Package [ <!ENTITY acme "acme"> ]>
<stix:STIX_Package
    xmlns="urn:default"
    xmlns:stix="http://stix.mitre.org/stix-1"
    xmlns:acme="http://acme.example/schemas/acme-1"
    xmlns:xsi="http://www.w3.org/2001/XMLSchema-instance"
    id="acme:package-1"
    xsi:schemaLocation="
        http://stix.mitre.org/stix-1 http://stix.mitre.org/XMLSchema/core/1.1.1/stix_core.xsd
        http://acme.example/schemas/acme-1 http://acme.example/schemas/acme.xsd">
  <stix:Indicators xmlns:ind="http://stix.mitre.org/Indicator-2"/>
</stix:STIX_Package>)";

    auto result = SourceDeclarationReader::Read(std::string_view {input});
    REQUIRE(result.HasValue());

    const auto& source = result.ValueUnsafe();
    REQUIRE(source.namespaces.size() == 3);
    CHECK(source.namespaces.at("stix") == "http://stix.mitre.org/stix-1");
    CHECK(source.namespaces.at("acme") == "http://acme.example/schemas/acme-1");
    CHECK(source.namespaces.at("xsi") == "http://www.w3.org/2001/XMLSchema-instance");
    // Descendant declarations are not read by default.
    CHECK_FALSE(source.namespaces.contains("ind"));

    REQUIRE(source.schemaLocations.size() == 2);
    CHECK(source.schemaLocations.at("http://acme.example/schemas/acme-1") == "http://acme.example/schemas/acme.xsd");
    CHECK(source.schemaLocations.at("http://stix.mitre.org/stix-1") ==
          "http://stix.mitre.org/XMLSchema/core/1.1.1/stix_core.xsd");
}

TEST_CASE("SourceDeclarationReader resolves the schema-instance prefix by binding", "[serialization][source]")
{
    SECTION("non-standard prefix")
    {
        const char* input  = R"(<root xmlns:i="http://www.w3.org/2001/XMLSchema-instance" i:schemaLocation="urn:a a.xsd"/>)";
        auto        result = SourceDeclarationReader::Read(std::string_view {input});
        REQUIRE(result.HasValue());
        CHECK(result.ValueUnsafe().schemaLocations.at("urn:a") == "a.xsd");
    }

    SECTION("unbound prefix is not the schema instance")
    {
        const char* input  = R"(<root xsi:schemaLocation="urn:a a.xsd"/>)";
        auto        result = SourceDeclarationReader::Read(std::string_view {input});
        REQUIRE(result.HasValue());
        CHECK(result.ValueUnsafe().IsEmpty());
    }
}

TEST_CASE("SourceDeclarationReader decodes entities in attribute values", "[serialization][source]")
{
    const char* input  = R"(<root xmlns:q='urn:a&amp;b&#x2F;c&#47;d'/>)";
    auto        result = SourceDeclarationReader::Read(std::string_view {input});
    REQUIRE(result.HasValue());
    CHECK(result.ValueUnsafe().namespaces.at("q") == "urn:a&b/c/d");
}

TEST_CASE("SourceDeclarationReader rejects character references outside the XML character range", "[serialization][source]")
{
    const char* rejected[] = {
            "<root xmlns:q=\"urn:&#xD800;\"/>",
            "<root xmlns:q=\"urn:&#57343;\"/>",
            "<root xmlns:q=\"urn:&#x1;\"/>",
            "<root xmlns:q=\"urn:&#0;\"/>",
            "<root xmlns:q=\"urn:&#xFFFE;\"/>",
            "<root xmlns:q=\"urn:&#x110000;\"/>",
    };
    for (const char* input: rejected)
    {
        auto result = SourceDeclarationReader::Read(std::string_view {input});
        REQUIRE_FALSE(result.HasValue());
        CHECK(result.Error().code == ParseErrorCode::InvalidEntity);
    }

    auto accepted = SourceDeclarationReader::Read(std::string_view {"<root xmlns:q=\"urn:a&#x9;b&#xE9;&#x1F600;\"/>"});
    REQUIRE(accepted.HasValue());
    CHECK(accepted.ValueUnsafe().namespaces.at("q") == "urn:a\tb\xC3\xA9\xF0\x9F\x98\x80");
}

TEST_CASE("SourceDeclarationReader scans descendants when asked", "[serialization][source]")
{
    const char* input = R"(<root xmlns:a="urn:a">
  <a:child xmlns:b="urn:b" xmlns:a="urn:shadow">text &amp; more<![CDATA[ <not:element xmlns:c="urn:c"/> ]]>
    <?pi data?><!-- <c:ignored xmlns:c="urn:c"/> -->
    <b:leaf xmlns:s="http://www.w3.org/2001/XMLSchema-instance" s:schemaLocation="urn:b b.xsd"/>
  </a:child>
</root>
<!-- trailing comment -->)";

    SourceReadOptions options;
    options.scanDescendants = true;

    auto result = SourceDeclarationReader::Read(std::string_view {input}, options);
    REQUIRE(result.HasValue());

    const auto& source = result.ValueUnsafe();
    CHECK(source.namespaces.size() == 3);
    // The first binding of a redeclared prefix is kept.
    CHECK(source.namespaces.at("a") == "urn:a");
    CHECK(source.namespaces.at("b") == "urn:b");
    CHECK(source.namespaces.at("s") == "http://www.w3.org/2001/XMLSchema-instance");
    CHECK_FALSE(source.namespaces.contains("c"));
    CHECK(source.schemaLocations.at("urn:b") == "b.xsd");
}

TEST_CASE("SourceDeclarationReader reports malformed input", "[serialization][source]")
{
    SECTION("no root element")
    {
        auto result = SourceDeclarationReader::Read(std::string_view {"<?xml version=\"1.0\"?><!-- empty -->"});
        REQUIRE_FALSE(result.HasValue());
        CHECK(result.Error().code == ParseErrorCode::MissingRoot);
    }

    SECTION("unterminated attribute")
    {
        auto result = SourceDeclarationReader::Read(std::string_view {"<root xmlns:a=\"urn:a"});
        REQUIRE_FALSE(result.HasValue());
        CHECK(result.Error().code == ParseErrorCode::UnexpectedEnd);
    }

    SECTION("odd schemaLocation entries")
    {
        const char* input  = R"(<root xmlns:xsi="http://www.w3.org/2001/XMLSchema-instance" xsi:schemaLocation="urn:a a.xsd urn:b"/>)";
        auto        result = SourceDeclarationReader::Read(std::string_view {input});
        REQUIRE_FALSE(result.HasValue());
        CHECK(result.Error().code == ParseErrorCode::InvalidSchemaLocation);
    }

    SECTION("unknown entity")
    {
        auto result = SourceDeclarationReader::Read(std::string_view {"<root xmlns:a=\"urn:&bogus;\"/>"});
        REQUIRE_FALSE(result.HasValue());
        CHECK(result.Error().code == ParseErrorCode::InvalidEntity);
    }

    SECTION("mismatched end tag while scanning")
    {
        SourceReadOptions options;
        options.scanDescendants = true;
        auto result             = SourceDeclarationReader::Read(std::string_view {"<root><child></root>"}, options);
        REQUIRE_FALSE(result.HasValue());
        CHECK(result.Error().code == ParseErrorCode::MismatchedTag);
    }

    SECTION("nesting too deep")
    {
        SourceReadOptions options;
        options.scanDescendants = true;
        options.maxDepth        = 2;
        auto result             = SourceDeclarationReader::Read(std::string_view {"<a><b><c/></b></a>"}, options);
        REQUIRE_FALSE(result.HasValue());
        CHECK(result.Error().code == ParseErrorCode::DepthExceeded);
    }
}

TEST_CASE("SourceDeclarationReader tracks error locations", "[serialization][source]")
{
    auto result = SourceDeclarationReader::Read(std::string_view {"<root\n  xmlns:a=urn:a/>"});
    REQUIRE_FALSE(result.HasValue());
    CHECK(result.Error().code == ParseErrorCode::InvalidToken);
    CHECK(result.Error().location.line == 2);
    CHECK(result.Error().location.column == 11);
}

TEST_CASE("ParseSchemaLocation splits on any whitespace", "[serialization][source]")
{
    auto result = SourceDeclarationReader::ParseSchemaLocation("\n\turn:a  a.xsd\r\n urn:b\tb.xsd ");
    REQUIRE(result.HasValue());
    REQUIRE(result.ValueUnsafe().size() == 2);
    CHECK(result.ValueUnsafe().at("urn:a") == "a.xsd");
    CHECK(result.ValueUnsafe().at("urn:b") == "b.xsd");

    auto empty = SourceDeclarationReader::ParseSchemaLocation("   ");
    REQUIRE(empty.HasValue());
    CHECK(empty.ValueUnsafe().empty());
}
