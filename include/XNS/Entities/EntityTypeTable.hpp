/// @file EntityTypeTable.hpp
/// @brief Statically registered namespace metadata for entity types.
#pragma once

#include <XNS/Defines.hpp>
#include <XNS/Primitives.hpp>
#include <XNS/Utilities/Expected.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace XNS::Entities
{
    /// @brief Identifier of an entity type: FNV-1a 64 of the registered type name.
    using EntityTypeTag = UInt64;

    [[nodiscard]] constexpr EntityTypeTag MakeEntityTypeTag(std::string_view name) noexcept
    {
        UInt64 hash = 14695981039346656037ull;
        for (UIntSize i = 0; i < name.size(); ++i)
            hash = (hash ^ static_cast<UInt8>(name[i])) * 1099511628211ull;
        return hash;
    }

    /// @brief Registration input for one entity type.
    ///
    /// @details
    /// `qualifiedName` is the `prefix:LocalName` xsi:type of the type, if it has one. When `baseName` is set,
    /// every field left unset is inherited from the base, and the base's lineage is appended to this type's.
    struct EntityTypeInfo
    {
        std::string                name {};
        std::optional<std::string> namespaceUri {};
        std::optional<std::string> explicitPrefix {};
        std::optional<std::string> qualifiedName {};
        std::optional<std::string> baseName {};
    };

    /// @brief Flattened metadata of a registered type.
    struct EntityTypeRecord
    {
        EntityTypeTag              tag {0};
        std::string                name {};
        std::optional<std::string> namespaceUri {};
        std::optional<std::string> explicitPrefix {};
        std::optional<std::string> qualifiedName {};
        /// This type first, then its ancestors nearest-first.
        std::vector<EntityTypeTag> lineage {};
    };

    enum class EntityTypeErrorCode : UInt8
    {
        None,
        EmptyName,
        DuplicateType,
        UnknownBase,
    };

    struct EntityTypeError
    {
        EntityTypeErrorCode code {EntityTypeErrorCode::None};
        std::string         name {};
        std::string         message {};
    };

    /// @brief Immutable lookup table from type tag to namespace metadata.
    class XNS_API EntityTypeTable
    {
    public:
        class Builder;

        [[nodiscard]] const EntityTypeRecord* Find(EntityTypeTag tag) const noexcept;
        [[nodiscard]] const EntityTypeRecord* Find(std::string_view name) const noexcept;

        [[nodiscard]] UIntSize Size() const noexcept { return m_records.size(); }

    private:
        EntityTypeTable() = default;

        std::unordered_map<EntityTypeTag, EntityTypeRecord> m_records {};
    };

    /// @brief Registers entity types once at startup. Bases must be registered before derived types.
    class XNS_API EntityTypeTable::Builder
    {
    public:
        Builder() = default;

        Utilities::Expected<EntityTypeTag, EntityTypeError> Register(EntityTypeInfo info);

        [[nodiscard]] std::shared_ptr<const EntityTypeTable> Build() const;

    private:
        EntityTypeTable m_table {};
    };
}// namespace XNS::Entities
