#include <XNS/Entities/EntityTypeTable.hpp>

#include <catch2/catch_test_macros.hpp>

#include <algorithm>

using namespace XNS::Entities;

TEST_CASE("MakeEntityTypeTag is FNV-1a 64", "[entities][types]")
{
    STATIC_REQUIRE(MakeEntityTypeTag("") == 14695981039346656037ull);
    STATIC_REQUIRE(MakeEntityTypeTag("a") == 0xaf63dc4c8601ec8cull);
    STATIC_REQUIRE(MakeEntityTypeTag("Indicator") != MakeEntityTypeTag("indicator"));
}

TEST_CASE("EntityTypeTable registers and finds types", "[entities][types]")
{
    EntityTypeTable::Builder builder;
    auto tag = builder.Register({"Indicator", "http://stix.mitre.org/Indicator-2", {}, "indicator:IndicatorType", {}});
    REQUIRE(tag.HasValue());
    REQUIRE(tag.Value() == MakeEntityTypeTag("Indicator"));

    const auto table = builder.Build();
    REQUIRE(table->Size() == 1);

    const EntityTypeRecord* record = table->Find(tag.Value());
    REQUIRE(record != nullptr);
    CHECK(record->name == "Indicator");
    CHECK(record->namespaceUri == "http://stix.mitre.org/Indicator-2");
    CHECK_FALSE(record->explicitPrefix.has_value());
    CHECK(record->qualifiedName == "indicator:IndicatorType");
    REQUIRE(record->lineage.size() == 1);
    CHECK(record->lineage.front() == tag.Value());

    CHECK(table->Find("Indicator") == record);
    CHECK(table->Find("Campaign") == nullptr);
    CHECK(table->Find(MakeEntityTypeTag("Campaign")) == nullptr);
}

TEST_CASE("EntityTypeTable inherits unset metadata from the base type", "[entities][types]")
{
    EntityTypeTable::Builder builder;
    REQUIRE(builder.Register({"ObjectProperties", "http://cybox.mitre.org/common-2", "cyboxCommon", {}, {}}).HasValue());
    REQUIRE(builder.Register({"Address", "http://cybox.mitre.org/objects#AddressObject-2", {}, "AddressObj:AddressObjectType", "ObjectProperties"}).HasValue());
    REQUIRE(builder.Register({"EmailAddress", {}, {}, {}, "Address"}).HasValue());

    const auto table = builder.Build();

    const EntityTypeRecord* address = table->Find("Address");
    REQUIRE(address != nullptr);
    CHECK(address->namespaceUri == "http://cybox.mitre.org/objects#AddressObject-2");
    // The base's explicit prefix is inherited because Address declares none of its own.
    CHECK(address->explicitPrefix == "cyboxCommon");
    REQUIRE(address->lineage.size() == 2);
    CHECK(address->lineage[1] == MakeEntityTypeTag("ObjectProperties"));

    const EntityTypeRecord* email = table->Find("EmailAddress");
    REQUIRE(email != nullptr);
    CHECK(email->namespaceUri == "http://cybox.mitre.org/objects#AddressObject-2");
    CHECK(email->qualifiedName == "AddressObj:AddressObjectType");
    REQUIRE(email->lineage.size() == 3);
    CHECK(email->lineage[0] == MakeEntityTypeTag("EmailAddress"));
    CHECK(email->lineage[1] == MakeEntityTypeTag("Address"));
    CHECK(email->lineage[2] == MakeEntityTypeTag("ObjectProperties"));
}

TEST_CASE("EntityTypeTable rejects invalid registrations", "[entities][types]")
{
    EntityTypeTable::Builder builder;
    REQUIRE(builder.Register({"Indicator", {}, {}, {}, {}}).HasValue());

    SECTION("empty name")
    {
        auto result = builder.Register({});
        REQUIRE_FALSE(result.HasValue());
        CHECK(result.Error().code == EntityTypeErrorCode::EmptyName);
    }

    SECTION("duplicate name")
    {
        auto result = builder.Register({"Indicator", "http://stix.mitre.org/Indicator-2", {}, {}, {}});
        REQUIRE_FALSE(result.HasValue());
        CHECK(result.Error().code == EntityTypeErrorCode::DuplicateType);
        CHECK(result.Error().name == "Indicator");
    }

    SECTION("unknown base")
    {
        auto result = builder.Register({"Address", {}, {}, {}, "ObjectProperties"});
        REQUIRE_FALSE(result.HasValue());
        CHECK(result.Error().code == EntityTypeErrorCode::UnknownBase);
        CHECK(builder.Build()->Find("Address") == nullptr);
    }
}
