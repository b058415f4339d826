#pragma once

// Tests rely on assert() being active in every build type.
#undef NDEBUG
#include <cassert>

#include <ShapeFusion/shapefusion.hpp>
#include <cstddef>
#include <iostream>
#include <string>

namespace TestHelpers {

using namespace ShapeFusion;

// ============================================================================
// Transcoding Helpers
// ============================================================================

/// Check that the input is accepted
inline bool Succeeds(const Schema & schema, const Value & input) {
    return static_cast<bool>(schema(input));
}

/// Check that the input is accepted and converted to `expected`
inline bool TranscodesTo(const Schema & schema, const Value & input, const Value & expected) {
    Result r = schema(input);
    if(!r) {
        std::cerr << "\n  unexpected failure:\n" << ResultToString(r) << "\n";
        return false;
    }
    return r.value() == expected;
}

/// Check that the input is rejected and the first error has the given kind
inline bool FailsWith(const Schema & schema, const Value & input, ErrorKind expected) {
    Result r = schema(input);
    return !r && r.error() == expected;
}

/// Check that the input is rejected with the given kind at the given path
inline bool FailsAt(const Schema & schema, const Value & input, ErrorKind expected, const path::Path & at) {
    Result r = schema(input);
    return !r && r.error() == expected && r.errorPath() == at;
}

// ============================================================================
// Error List Helpers
// ============================================================================

/// Check that the error list holds an error of `kind` at `at`
inline bool HasError(const Result & r, ErrorKind kind, const path::Path & at) {
    for(const ValidationError & e : r.errors()) {
        if(e.kind == kind && e.path == at) return true;
    }
    return false;
}

/// Count errors of one kind
inline std::size_t CountErrors(const Result & r, ErrorKind kind) {
    std::size_t n = 0;
    for(const ValidationError & e : r.errors()) {
        if(e.kind == kind) n ++;
    }
    return n;
}

// ============================================================================
// Schema Definition Helpers
// ============================================================================

/// Check that building a schema is rejected
template<class F>
bool RejectsSchema(F && build) {
    try {
        build();
    } catch(const SchemaDefinitionError &) {
        return true;
    }
    return false;
}

/// Check that building a schema is rejected with a message containing `fragment`
template<class F>
bool RejectsSchemaWith(F && build, const std::string & fragment) {
    try {
        build();
    } catch(const SchemaDefinitionError & e) {
        return std::string(e.what()).find(fragment) != std::string::npos;
    }
    return false;
}

} // namespace TestHelpers
