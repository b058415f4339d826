#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace ShapeFusion {

namespace options {

constexpr std::size_t value_preview_limit() {
#ifdef SHAPEFUSION_VALUE_PREVIEW_LIMIT
    return SHAPEFUSION_VALUE_PREVIEW_LIMIT;
#else
    return 64;
#endif
}

// Max characters of a value quoted inside an error message.
static constexpr std::size_t ValuePreviewLimit = value_preview_limit();

} // namespace options


// Treatment of input mapping keys not covered by any marker.
enum class ExtrasPolicy : std::uint8_t {
    Prevent,  // each extra key is an UnknownField error
    Allow,    // copied verbatim into the result
    Remove    // dropped silently
};

constexpr std::string_view extras_policy_to_string(ExtrasPolicy p) {
    switch(p) {
    case ExtrasPolicy::Prevent: return "Prevent"; break;
    case ExtrasPolicy::Allow: return "Allow"; break;
    case ExtrasPolicy::Remove: return "Remove"; break;
    }
    return "N/A";
}

// Settings active while compiling one schema node. Mapping nodes that set
// their own values override these for themselves and their descendants.
struct CompileOptions {
    ExtrasPolicy extras = ExtrasPolicy::Prevent;
    bool enforce_inclusive_groups = false;
};

} // namespace ShapeFusion
