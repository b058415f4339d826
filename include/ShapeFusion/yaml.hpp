#pragma once
#include <rapidyaml.hpp>
#include <charconv>
#include <cstdint>
#include <exception>
#include <stdexcept>
#include <string>
#include <string_view>

#include "load_result.hpp"
#include "value.hpp"

namespace ShapeFusion {

namespace yaml {

namespace yaml_detail {

[[noreturn]] inline void throw_on_yaml_error(const char * msg, std::size_t msg_len, ryml::Location, void *) {
    throw std::runtime_error(std::string(msg, msg_len));
}

// rapidyaml aborts on errors unless told otherwise. These callbacks are handed
// to each parse, the process-wide defaults stay untouched.
inline ryml::Callbacks throwing_callbacks() {
    return ryml::Callbacks(nullptr, nullptr, nullptr, &throw_on_yaml_error);
}

class ValueBuilder {
    LoadError err_ = LoadError::NO_ERROR;
    std::string message_;

    bool setError(LoadError e, std::string message) {
        err_ = e;
        message_ = std::move(message);
        return false;
    }

    static std::string toString(c4::csubstr s) {
        return std::string(s.str, s.len);
    }

    static bool hasUnsupportedFeatures(ryml::ConstNodeRef node) {
        if(node.has_anchor()) return true;
        if(node.is_ref()) return true;
        if(node.has_key_tag() || node.has_val_tag()) return true;
        return false;
    }

    // Plain scalars are typed by their text; quoted ones stay strings.
    static void readScalar(c4::csubstr text, bool quoted, Value & out) {
        if(quoted) {
            out = toString(text);
            return;
        }
        if(text.empty() || text == "null" || text == "~") {
            out = nullptr;
            return;
        }
        if(text == "true") {
            out = true;
            return;
        }
        if(text == "false") {
            out = false;
            return;
        }
        const char * begin = text.str;
        const char * end = text.str + text.len;
        const char first = text[0];
        if((first >= '0' && first <= '9') || first == '-' || first == '+' || first == '.') {
            const char * numBegin = (first == '+') ? begin + 1 : begin;
            std::int64_t i = 0;
            auto [iptr, iec] = std::from_chars(numBegin, end, i);
            if(iec == std::errc() && iptr == end) {
                out = i;
                return;
            }
            double d = 0;
            auto [dptr, dec] = std::from_chars(numBegin, end, d);
            if(dec == std::errc() && dptr == end) {
                out = d;
                return;
            }
        }
        out = toString(text);
    }

public:
    LoadError getError() const noexcept { return err_; }
    const std::string & message() const noexcept { return message_; }

    bool read(ryml::ConstNodeRef node, Value & out) {
        if(hasUnsupportedFeatures(node)) {
            return setError(LoadError::UNSUPPORTED_FEATURE, "anchors, aliases and tags are not supported");
        }
        if(node.is_map()) {
            Object fields;
            for(ryml::ConstNodeRef child : node.children()) {
                std::string key = toString(child.key());
                if(fields.contains(key)) {
                    return setError(LoadError::DUPLICATE_KEY, "duplicate key '" + key + "'");
                }
                Value v;
                if(!read(child, v)) return false;
                fields.insert_or_assign(std::move(key), std::move(v));
            }
            out = std::move(fields);
            return true;
        }
        if(node.is_seq()) {
            Array items;
            items.reserve(node.num_children());
            for(ryml::ConstNodeRef child : node.children()) {
                Value v;
                if(!read(child, v)) return false;
                items.push_back(std::move(v));
            }
            out = std::move(items);
            return true;
        }
        if(node.has_val()) {
            readScalar(node.val(), node.is_val_quoted(), out);
            return true;
        }
        out = nullptr;
        return true;
    }
};

} // namespace yaml_detail


// Parses a single YAML document.
inline LoadResult Load(std::string_view text) {
    const ryml::Callbacks callbacks = yaml_detail::throwing_callbacks();
    ryml::Tree tree(callbacks);
    try {
        ryml::EventHandlerTree handler(callbacks);
        ryml::Parser parser(&handler);
        ryml::parse_in_arena(&parser, c4::csubstr(text.data(), text.size()), &tree);
    } catch(const std::exception & e) {
        return LoadResult(LoadError::ILLFORMED_DOCUMENT, e.what());
    }

    const ryml::Tree & ctree = tree;
    ryml::ConstNodeRef root = ctree.rootref();
    if(root.is_stream()) {
        if(root.num_children() > 1) {
            return LoadResult(LoadError::UNSUPPORTED_FEATURE, "multi-document streams are not supported");
        }
        if(root.num_children() == 0) {
            return LoadResult(Value{});
        }
        root = root.first_child();
    }

    yaml_detail::ValueBuilder builder;
    Value out;
    if(!builder.read(root, out)) {
        return LoadResult(builder.getError(), builder.message());
    }
    return LoadResult(std::move(out));
}

} // namespace yaml

} // namespace ShapeFusion
