#include <XNS/Entities/EntityStream.hpp>

#include <unordered_set>
#include <vector>

namespace XNS::Entities
{
    EntityStream WalkEntities(const Entity& root)
    {
        std::unordered_set<const Entity*> seen;
        std::vector<const Entity*>        pending {&root};

        while (!pending.empty())
        {
            const Entity* entity = pending.back();
            pending.pop_back();
            if (!seen.insert(entity).second)
                continue;

            co_yield entity;

            // Reverse push keeps children in declaration order.
            for (UIntSize i = entity->ChildCount(); i > 0; --i)
            {
                const Entity* child = entity->ChildAt(i - 1);
                if (child && !seen.contains(child))
                    pending.push_back(child);
            }
        }
    }
}// namespace XNS::Entities
