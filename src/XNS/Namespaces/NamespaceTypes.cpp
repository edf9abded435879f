#include <XNS/Namespaces/NamespaceTypes.hpp>

namespace XNS::Namespaces
{
    std::string_view ToString(NamespaceErrorCode code) noexcept
    {
        switch (code)
        {
            case NamespaceErrorCode::None:
                return "None";
            case NamespaceErrorCode::PrefixConflict:
                return "PrefixConflict";
            case NamespaceErrorCode::UnknownNamespace:
                return "UnknownNamespace";
            case NamespaceErrorCode::AlreadyFinalized:
                return "AlreadyFinalized";
            case NamespaceErrorCode::InvalidDocumentIdentifier:
                return "InvalidDocumentIdentifier";
        }
        Unreachable();
    }

    std::string_view ToString(DiagnosticKind kind) noexcept
    {
        switch (kind)
        {
            case DiagnosticKind::UnresolvedSchemaLocation:
                return "UnresolvedSchemaLocation";
            case DiagnosticKind::DuplicateAlias:
                return "DuplicateAlias";
        }
        Unreachable();
    }
}// namespace XNS::Namespaces
