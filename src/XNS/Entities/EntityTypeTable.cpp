#include <XNS/Entities/EntityTypeTable.hpp>

#include <dlib/logger.h>

namespace XNS::Entities
{
    namespace
    {
        dlib::logger g_logger("xns.types");

        using RegisterResult = Utilities::Expected<EntityTypeTag, EntityTypeError>;

        [[nodiscard]] RegisterResult MakeError(EntityTypeErrorCode code, std::string_view name, std::string message)
        {
            EntityTypeError error;
            error.code    = code;
            error.name    = std::string {name};
            error.message = std::move(message);
            return RegisterResult(Utilities::Unexpected<EntityTypeError>(std::move(error)));
        }

        void Inherit(std::optional<std::string>& field, const std::optional<std::string>& base)
        {
            if (!field && base)
                field = base;
        }
    }// namespace

    const EntityTypeRecord* EntityTypeTable::Find(EntityTypeTag tag) const noexcept
    {
        const auto it = m_records.find(tag);
        return it == m_records.end() ? nullptr : &it->second;
    }

    const EntityTypeRecord* EntityTypeTable::Find(std::string_view name) const noexcept
    {
        const EntityTypeRecord* record = Find(MakeEntityTypeTag(name));
        if (!record || record->name != name)
            return nullptr;
        return record;
    }

    Utilities::Expected<EntityTypeTag, EntityTypeError> EntityTypeTable::Builder::Register(EntityTypeInfo info)
    {
        if (info.name.empty())
            return MakeError(EntityTypeErrorCode::EmptyName, info.name, "entity type name must not be empty");

        const EntityTypeTag tag = MakeEntityTypeTag(info.name);
        if (const EntityTypeRecord* existing = m_table.Find(tag))
        {
            return MakeError(EntityTypeErrorCode::DuplicateType, info.name,
                             "entity type '" + info.name + "' collides with registered type '" + existing->name + "'");
        }

        EntityTypeRecord record;
        record.tag            = tag;
        record.name           = info.name;
        record.namespaceUri   = std::move(info.namespaceUri);
        record.explicitPrefix = std::move(info.explicitPrefix);
        record.qualifiedName  = std::move(info.qualifiedName);
        record.lineage.push_back(tag);

        if (info.baseName)
        {
            const EntityTypeRecord* base = m_table.Find(*info.baseName);
            if (!base)
            {
                return MakeError(EntityTypeErrorCode::UnknownBase, info.name,
                                 "base type '" + *info.baseName + "' of '" + info.name + "' is not registered");
            }
            Inherit(record.namespaceUri, base->namespaceUri);
            Inherit(record.explicitPrefix, base->explicitPrefix);
            Inherit(record.qualifiedName, base->qualifiedName);
            record.lineage.insert(record.lineage.end(), base->lineage.begin(), base->lineage.end());
        }

        g_logger << dlib::LTRACE << "registered entity type " << record.name << " (lineage depth "
                 << record.lineage.size() << ")";
        m_table.m_records.emplace(tag, std::move(record));
        return RegisterResult(tag);
    }

    std::shared_ptr<const EntityTypeTable> EntityTypeTable::Builder::Build() const
    {
        return std::shared_ptr<const EntityTypeTable>(new EntityTypeTable(m_table));
    }
}// namespace XNS::Entities
