#pragma once

#include <string>

#include "errors.hpp"
#include "path.hpp"
#include "result.hpp"

namespace ShapeFusion {

// `data['items'][2]['qty']`
inline std::string PathToString(const path::Path & p) {
    std::string out = "data";
    for(const path::PathElement & el : p) {
        if(el.is_index()) {
            out += "[" + std::to_string(el.array_index) + "]";
        } else {
            out += "['" + el.field_name + "']";
        }
    }
    return out;
}

// `$.items[2].qty`
inline std::string PathToJsonPath(const path::Path & p) {
    std::string jsonPath = "$";
    for(const path::PathElement & el : p) {
        if(!el.is_index()) {
            jsonPath += "." + el.field_name;
        } else {
            jsonPath += "[" + std::to_string(el.array_index) + "]";
        }
    }
    return jsonPath;
}

// `message @ data['items'][2]['qty']`; the location is omitted at the root.
inline std::string ErrorToString(const ValidationError & e) {
    if(e.path.empty()) {
        return e.message;
    }
    return e.message + " @ " + PathToString(e.path);
}

// One line per error, in the order they were collected.
inline std::string ResultToString(const Result & res) {
    if(res) {
        return "OK";
    }
    std::string out;
    for(const ValidationError & e : res.errors()) {
        if(!out.empty()) out += "\n";
        out += "When transcoding " + PathToJsonPath(e.path) + ", error '"
               + std::string(error_to_string(e.kind)) + "': " + e.message;
    }
    return out;
}

} // namespace ShapeFusion
