#include "styleverify/core/ErrorCode.hpp"

namespace styleverify {
namespace core {

Error::Error(ErrorCode c) : code(c), message(toString(c)) {}

const char* toString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Ok:                     return "Success";

        // 通用错误 (1-19)
        case ErrorCode::InvalidArgument:        return "Invalid argument";
        case ErrorCode::InternalError:          return "Internal error";
        case ErrorCode::InvalidStateTransition: return "Invalid state transition";
        case ErrorCode::Cancelled:              return "Operation cancelled";

        // 文件/归档错误 (20-39)
        case ErrorCode::FileNotFound:           return "File not found";
        case ErrorCode::FileReadError:          return "File read error";
        case ErrorCode::ZipError:               return "ZIP error";

        // 文档解析错误 (40-59)
        case ErrorCode::ExtractionFailed:       return "Document extraction failed";
        case ErrorCode::XmlParseError:          return "XML parse error";
        case ErrorCode::XmlMissingElement:      return "Missing XML element";

        // 模板与结果存储 (60-79)
        case ErrorCode::TemplateNotFound:       return "Template not found";
        case ErrorCode::TemplateInactive:       return "Template is not active";
        case ErrorCode::TemplateInUse:          return "Template is referenced by verification results";
        case ErrorCode::DuplicateTemplate:      return "Duplicate template";
        case ErrorCode::ResultNotFound:         return "Verification result not found";

        // 比较引擎 (80-99)
        case ErrorCode::SignatureTruncated:     return "Style signature truncated";
        case ErrorCode::ComparatorDefect:       return "Comparator defect";

        default:                                return "Unknown error";
    }
}

const char* errorCodeName(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Ok:                     return "Ok";
        case ErrorCode::InvalidArgument:        return "InvalidArgument";
        case ErrorCode::InternalError:          return "InternalError";
        case ErrorCode::InvalidStateTransition: return "InvalidStateTransition";
        case ErrorCode::Cancelled:              return "Cancelled";
        case ErrorCode::FileNotFound:           return "FileNotFound";
        case ErrorCode::FileReadError:          return "FileReadError";
        case ErrorCode::ZipError:               return "ZipError";
        case ErrorCode::ExtractionFailed:       return "ExtractionFailed";
        case ErrorCode::XmlParseError:          return "XmlParseError";
        case ErrorCode::XmlMissingElement:      return "XmlMissingElement";
        case ErrorCode::TemplateNotFound:       return "TemplateNotFound";
        case ErrorCode::TemplateInactive:       return "TemplateInactive";
        case ErrorCode::TemplateInUse:          return "TemplateInUse";
        case ErrorCode::DuplicateTemplate:      return "DuplicateTemplate";
        case ErrorCode::ResultNotFound:         return "ResultNotFound";
        case ErrorCode::SignatureTruncated:     return "SignatureTruncated";
        case ErrorCode::ComparatorDefect:       return "ComparatorDefect";
        default:                                return "Unknown";
    }
}

}} // namespace styleverify::core
