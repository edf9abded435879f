#pragma once

#include <XNS/Defines.hpp>
#include <XNS/Entities/EntityTypeTable.hpp>
#include <XNS/Namespaces/NamespaceTypes.hpp>
#include <XNS/Primitives.hpp>

#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace XNS::Entities
{
    /// @brief A node of a document tree.
    ///
    /// @details
    /// Namespace metadata belongs to the node's type and is looked up through `TypeTag()` in an
    /// `EntityTypeTable`. Only nodes built by parsing an existing XML document return a non-null `Source()`.
    class XNS_API Entity
    {
    public:
        virtual ~Entity() = default;

        [[nodiscard]] virtual EntityTypeTag TypeTag() const noexcept = 0;

        [[nodiscard]] virtual const Namespaces::SourceNamespaces* Source() const noexcept { return nullptr; }

        [[nodiscard]] virtual UIntSize      ChildCount() const noexcept { return 0; }
        [[nodiscard]] virtual const Entity* ChildAt(UIntSize) const noexcept { return nullptr; }
    };

    /// @brief General-purpose entity owning its children.
    ///
    /// @details
    /// `AddReference` links an entity owned elsewhere, which turns the tree into a graph; walks still visit
    /// a shared node once.
    class XNS_API EntityNode final : public Entity
    {
    public:
        explicit EntityNode(EntityTypeTag tag) noexcept;
        explicit EntityNode(std::string_view typeName) noexcept;

        EntityNode(const EntityNode&)            = delete;
        EntityNode& operator=(const EntityNode&) = delete;

        [[nodiscard]] EntityTypeTag TypeTag() const noexcept override { return m_tag; }

        [[nodiscard]] const Namespaces::SourceNamespaces* Source() const noexcept override;

        [[nodiscard]] UIntSize      ChildCount() const noexcept override { return m_children.size(); }
        [[nodiscard]] const Entity* ChildAt(UIntSize index) const noexcept override;

        EntityNode& AddChild(std::unique_ptr<EntityNode> child);
        EntityNode& EmplaceChild(std::string_view typeName);

        void AddReference(const Entity& entity);

        void SetSource(Namespaces::SourceNamespaces source);

    private:
        EntityTypeTag                                m_tag {0};
        std::optional<Namespaces::SourceNamespaces>  m_source {};
        std::vector<std::unique_ptr<EntityNode>>     m_owned {};
        std::vector<const Entity*>                   m_children {};
    };
}// namespace XNS::Entities
