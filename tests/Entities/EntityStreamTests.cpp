#include <catch2/catch_test_macros.hpp>

#include <cstddef>
#include <utility>
#include <vector>

#include <XNS/Entities/Entity.hpp>
#include <XNS/Entities/EntityStream.hpp>

using namespace XNS::Entities;

namespace
{
    std::vector<EntityTypeTag> Collect(EntityStream& stream)
    {
        std::vector<EntityTypeTag> tags;
        for (const Entity* entity: stream)
            tags.push_back(entity->TypeTag());
        return tags;
    }
}// namespace

TEST_CASE("WalkEntities yields nodes depth-first in declaration order", "[entities][stream]")
{
    EntityNode  root {"Package"};
    EntityNode& indicator = root.EmplaceChild("Indicator");
    indicator.EmplaceChild("Observable");
    root.EmplaceChild("Campaign");

    auto       stream = WalkEntities(root);
    const auto tags   = Collect(stream);

    const std::vector<EntityTypeTag> expected {
            MakeEntityTypeTag("Package"),
            MakeEntityTypeTag("Indicator"),
            MakeEntityTypeTag("Observable"),
            MakeEntityTypeTag("Campaign"),
    };
    REQUIRE(tags == expected);
    REQUIRE(stream.YieldedCount() == 4);
    REQUIRE(stream.IsDone());
}

TEST_CASE("WalkEntities yields a shared node once", "[entities][stream]")
{
    EntityNode  root {"Package"};
    EntityNode& first  = root.EmplaceChild("Indicator");
    EntityNode& second = root.EmplaceChild("Indicator");
    EntityNode& shared = first.EmplaceChild("Observable");
    second.AddReference(shared);
    root.AddReference(shared);

    auto stream = WalkEntities(root);
    std::vector<const Entity*> visited;
    for (const Entity* entity: stream)
        visited.push_back(entity);

    REQUIRE(visited.size() == 4);
    std::size_t sharedVisits = 0;
    for (const Entity* entity: visited)
    {
        if (entity == &shared)
            ++sharedVisits;
    }
    REQUIRE(sharedVisits == 1);
}

TEST_CASE("WalkEntities terminates on cycles", "[entities][stream]")
{
    EntityNode  root {"Package"};
    EntityNode& child = root.EmplaceChild("Indicator");
    child.AddReference(root);

    auto stream = WalkEntities(root);
    REQUIRE(Collect(stream).size() == 2);
}

TEST_CASE("EntityStream is not restartable", "[entities][stream]")
{
    EntityNode root {"Package"};
    root.EmplaceChild("Indicator");

    auto stream = WalkEntities(root);
    REQUIRE(Collect(stream).size() == 2);
    REQUIRE(Collect(stream).empty());
    REQUIRE(stream.YieldedCount() == 2);
}

TEST_CASE("EntityStream moves ownership of the coroutine", "[entities][stream]")
{
    EntityNode root {"Package"};

    auto         source = WalkEntities(root);
    EntityStream target {std::move(source)};

    REQUIRE(source.IsDone());
    REQUIRE(Collect(source).empty());
    REQUIRE(Collect(target).size() == 1);
}
