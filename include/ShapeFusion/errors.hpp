#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

#include "path.hpp"

namespace ShapeFusion {


enum class ErrorKind {
    NOT_A_MAPPING,
    NOT_A_SEQUENCE,
    SEQUENCE_LENGTH_MISMATCH,
    REQUIRED_FIELD_MISSING,
    UNKNOWN_FIELD,
    LITERAL_MISMATCH,
    ENUM_NO_MATCH,
    CONVERSION,
    TYPE_MISMATCH,
    INCLUSIVE_GROUP_INCOMPLETE,
    DUPLICATE_TARGET_KEY,
    OBJECT_CONSTRUCTION
};

constexpr std::string_view error_to_string(ErrorKind e) {
    switch(e) {
    case ErrorKind::NOT_A_MAPPING: return "NOT_A_MAPPING"; break;
    case ErrorKind::NOT_A_SEQUENCE: return "NOT_A_SEQUENCE"; break;
    case ErrorKind::SEQUENCE_LENGTH_MISMATCH: return "SEQUENCE_LENGTH_MISMATCH"; break;
    case ErrorKind::REQUIRED_FIELD_MISSING: return "REQUIRED_FIELD_MISSING"; break;
    case ErrorKind::UNKNOWN_FIELD: return "UNKNOWN_FIELD"; break;
    case ErrorKind::LITERAL_MISMATCH: return "LITERAL_MISMATCH"; break;
    case ErrorKind::ENUM_NO_MATCH: return "ENUM_NO_MATCH"; break;
    case ErrorKind::CONVERSION: return "CONVERSION"; break;
    case ErrorKind::TYPE_MISMATCH: return "TYPE_MISMATCH"; break;
    case ErrorKind::INCLUSIVE_GROUP_INCOMPLETE: return "INCLUSIVE_GROUP_INCOMPLETE"; break;
    case ErrorKind::DUPLICATE_TARGET_KEY: return "DUPLICATE_TARGET_KEY"; break;
    case ErrorKind::OBJECT_CONSTRUCTION: return "OBJECT_CONSTRUCTION"; break;
    }
    return "N/A";
}


// A single data-time failure at `path`.
struct ValidationError {
    ErrorKind kind = ErrorKind::CONVERSION;
    std::string message;
    path::Path path;
};


// ============================================================================
// Schema Errors
// ============================================================================

// The schema itself is malformed. Raised only while compiling a schema,
// never while evaluating input.
class SchemaDefinitionError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

} // namespace ShapeFusion
