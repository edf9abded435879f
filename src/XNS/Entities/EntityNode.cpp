#include <XNS/Entities/Entity.hpp>

namespace XNS::Entities
{
    EntityNode::EntityNode(EntityTypeTag tag) noexcept
        : m_tag(tag)
    {
    }

    EntityNode::EntityNode(std::string_view typeName) noexcept
        : m_tag(MakeEntityTypeTag(typeName))
    {
    }

    const Namespaces::SourceNamespaces* EntityNode::Source() const noexcept
    {
        return m_source ? &*m_source : nullptr;
    }

    const Entity* EntityNode::ChildAt(UIntSize index) const noexcept
    {
        if (index >= m_children.size())
            return nullptr;
        return m_children[index];
    }

    EntityNode& EntityNode::AddChild(std::unique_ptr<EntityNode> child)
    {
        XNS_ASSERT(child != nullptr);
        EntityNode& ref = *child;
        m_children.push_back(&ref);
        m_owned.push_back(std::move(child));
        return ref;
    }

    EntityNode& EntityNode::EmplaceChild(std::string_view typeName)
    {
        return AddChild(std::make_unique<EntityNode>(typeName));
    }

    void EntityNode::AddReference(const Entity& entity)
    {
        m_children.push_back(&entity);
    }

    void EntityNode::SetSource(Namespaces::SourceNamespaces source)
    {
        m_source = std::move(source);
    }
}// namespace XNS::Entities
