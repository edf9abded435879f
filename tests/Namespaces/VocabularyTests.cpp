#include <XNS/Namespaces/Vocabulary.hpp>

#include <catch2/catch_message.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace XNS::Namespaces;

TEST_CASE("Default vocabulary is shared and built once", "[namespaces][vocabulary]")
{
    const auto first  = VocabularyTables::Default();
    const auto second = VocabularyTables::Default();
    REQUIRE(first != nullptr);
    REQUIRE(first.get() == second.get());
}

TEST_CASE("Default vocabulary knows STIX, CybOX and XML namespaces", "[namespaces][vocabulary]")
{
    const auto tables = VocabularyTables::Default();

    CHECK(tables->FindPrefix("http://stix.mitre.org/stix-1") == "stix");
    CHECK(tables->FindPrefix("http://cybox.mitre.org/objects#AddressObject-2") == "AddressObj");
    CHECK(tables->FindPrefix("urn:oasis:names:tc:ciq:xpil:3") == "xpil");
    CHECK(tables->FindPrefix("http://www.w3.org/2001/XMLSchema-instance") == "xsi");
    CHECK_FALSE(tables->FindPrefix("http://acme.example/schemas/acme-1").has_value());

    CHECK(tables->FindSchemaLocation("http://stix.mitre.org/Indicator-2") ==
          "http://stix.mitre.org/XMLSchema/indicator/2.1.1/indicator.xsd");
    CHECK(tables->FindSchemaLocation("urn:oasis:names:tc:ciq:xal:3") ==
          "http://stix.mitre.org/XMLSchema/external/oasis_ciq_3.0/xAL.xsd");
    // Extension vocabularies without a hosted schema have a prefix only.
    CHECK(tables->FindPrefix("http://capec.mitre.org/capec-2") == "capec");
    CHECK_FALSE(tables->FindSchemaLocation("http://capec.mitre.org/capec-2").has_value());

    CHECK(tables->IsWellKnown("http://cybox.mitre.org/cybox-2"));
    CHECK_FALSE(tables->IsWellKnown("http://example.com"));
    CHECK(tables->IsXmlInfrastructure("http://www.w3.org/1999/xlink"));
    CHECK_FALSE(tables->IsXmlInfrastructure("http://stix.mitre.org/stix-1"));
}

TEST_CASE("Default baseline prefixes", "[namespaces][vocabulary]")
{
    const PrefixMap expected {
            {"xsi", "http://www.w3.org/2001/XMLSchema-instance"},
            {"stix", "http://stix.mitre.org/stix-1"},
            {"stixCommon", "http://stix.mitre.org/common-1"},
            {"stixVocabs", "http://stix.mitre.org/default_vocabularies-1"},
            {"cybox", "http://cybox.mitre.org/cybox-2"},
            {"cyboxCommon", "http://cybox.mitre.org/common-2"},
            {"cyboxVocabs", "http://cybox.mitre.org/default_vocabularies-2"},
    };
    REQUIRE(VocabularyTables::Default()->BaselinePrefixes() == expected);
}

TEST_CASE("VocabularyTables::Builder extends a base table", "[namespaces][vocabulary]")
{
    const auto base = VocabularyTables::Default();
    const auto tables = VocabularyTables::Builder {*base}
                                .AddNamespace("http://acme.example/schemas/acme-1", "acme", "http://acme.example/schemas/acme.xsd")
                                .RemoveNamespace("http://capec.mitre.org/capec-2")
                                .Build();

    CHECK(tables->FindPrefix("http://acme.example/schemas/acme-1") == "acme");
    CHECK(tables->FindSchemaLocation("http://acme.example/schemas/acme-1") == "http://acme.example/schemas/acme.xsd");
    CHECK_FALSE(tables->IsWellKnown("http://capec.mitre.org/capec-2"));

    // The base is untouched.
    CHECK_FALSE(base->IsWellKnown("http://acme.example/schemas/acme-1"));
    CHECK(base->IsWellKnown("http://capec.mitre.org/capec-2"));
}

TEST_CASE("MAEC extension leaves the default-vocabularies namespace unprefixed", "[namespaces][vocabulary]")
{
    const auto tables = VocabularyTables::Builder {*VocabularyTables::Default()}.AddMaecExtension().Build();

    CHECK(tables->FindPrefix("http://maec.mitre.org/XMLSchema/maec-bundle-4") == "maecBundle");
    CHECK(tables->FindSchemaLocation("http://maec.mitre.org/XMLSchema/maec-package-2") ==
          "http://maec.mitre.org/language/version4.1/maec_package_schema.xsd");

    CHECK_FALSE(tables->FindPrefix("http://maec.mitre.org/default_vocabularies-1").has_value());
    CHECK(tables->FindSchemaLocation("http://maec.mitre.org/default_vocabularies-1") ==
          "http://maec.mitre.org/language/version4.1/maec_default_vocabularies.xsd");
}

TEST_CASE("Default vocabulary covers the CybOX 2.1 object namespaces", "[namespaces][vocabulary]")
{
    const auto tables = VocabularyTables::Default();

    struct Expectation
    {
        const char* namespaceUri;
        const char* prefix;
        const char* schemaLocation;
    };
    const Expectation expectations[] = {
            {"http://cybox.mitre.org/objects#SystemObject-2", "SystemObj",
             "http://cybox.mitre.org/XMLSchema/objects/System/2.1/System_Object.xsd"},
            {"http://cybox.mitre.org/objects#WinProcessObject-2", "WinProcessObj",
             "http://cybox.mitre.org/XMLSchema/objects/Win_Process/2.1/Win_Process_Object.xsd"},
            {"http://cybox.mitre.org/objects#UserAccountObject-2", "UserAccountObj",
             "http://cybox.mitre.org/XMLSchema/objects/User_Account/2.1/User_Account_Object.xsd"},
            {"http://cybox.mitre.org/objects#DNSRecordObject-2", "DNSRecordObj",
             "http://cybox.mitre.org/XMLSchema/objects/DNS_Record/2.1/DNS_Record_Object.xsd"},
            {"http://cybox.mitre.org/objects#PacketObject-2", "PacketObj",
             "http://cybox.mitre.org/XMLSchema/objects/Network_Packet/2.1/Network_Packet_Object.xsd"},
            {"http://cybox.mitre.org/objects#WinFileObject-2", "WinFileObj",
             "http://cybox.mitre.org/XMLSchema/objects/Win_File/2.1/Win_File_Object.xsd"},
            {"http://cybox.mitre.org/objects#WinDriverObject-3", "WinDriverObj",
             "http://cybox.mitre.org/XMLSchema/objects/Win_Driver/3.0/Win_Driver_Object.xsd"},
    };

    for (const Expectation& expected: expectations)
    {
        INFO(expected.namespaceUri);
        CHECK(tables->IsWellKnown(expected.namespaceUri));
        CHECK(tables->FindPrefix(expected.namespaceUri) == expected.prefix);
        CHECK(tables->FindSchemaLocation(expected.namespaceUri) == expected.schemaLocation);
    }
}
