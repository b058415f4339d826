#pragma once

#include <cstddef>
#include <exception>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "errors.hpp"
#include "markers.hpp"
#include "nodes.hpp"
#include "path.hpp"
#include "result.hpp"
#include "value.hpp"

namespace ShapeFusion {

namespace evaluator_detail {

// Per-evaluation state: the location being evaluated and the errors
// collected so far. Evaluate* functions return false after recording at
// least one error.
class EvalContext {
    path::Path currentPath;
    std::vector<ValidationError> m_errors;

public:
    struct PathGuard {
        EvalContext & ctx;

        ~PathGuard() {
            ctx.currentPath.pop();
        }
    };

    PathGuard getArrayItemGuard(std::size_t index) {
        currentPath.push_index(index);
        return PathGuard{*this};
    }
    PathGuard getMapItemGuard(std::string_view key) {
        currentPath.push_field(key);
        return PathGuard{*this};
    }

    bool withError(ErrorKind kind, std::string message) {
        m_errors.push_back(ValidationError{kind, std::move(message), currentPath});
        return false;
    }

    // Errors of a nested Result (a leaf converter or an embedded schema),
    // relocated under the current path.
    bool withErrors(const std::vector<ValidationError> & errors) {
        for(const ValidationError & e : errors) {
            ValidationError relocated = e;
            relocated.path.prepend(currentPath);
            m_errors.push_back(std::move(relocated));
        }
        if(errors.empty()) {
            return withError(ErrorKind::CONVERSION, "error converting value");
        }
        return false;
    }

    const path::Path & path() const { return currentPath; }
    std::size_t errorCount() const { return m_errors.size(); }

    std::vector<ValidationError> takeErrors() && {
        return std::move(m_errors);
    }
};


inline bool Evaluate(const Node & node, const Value & in, Value & out, EvalContext & ctx);

inline bool EvaluateLeaf(const Converter & converter, const Value & in, Value & out, EvalContext & ctx) {
    Result r;
    try {
        r = converter(in);
    } catch(const std::exception &) {
        return ctx.withError(ErrorKind::CONVERSION, "error converting value");
    } catch(...) {
        return ctx.withError(ErrorKind::CONVERSION, "error converting value");
    }
    if(!r) {
        return ctx.withErrors(r.errors());
    }
    out = std::move(r).take();
    return true;
}

inline bool EvaluateNode(const nodes::LiteralNode & node, const Value & in, Value & out, EvalContext & ctx) {
    Value converted;
    if(!EvaluateLeaf(node.converter, in, converted, ctx)) {
        return false;
    }
    if(!(converted == node.expected)) {
        return ctx.withError(ErrorKind::LITERAL_MISMATCH,
                             "expected literal " + Repr(node.expected) + ", got " + Repr(converted));
    }
    out = std::move(converted);
    return true;
}

inline void CheckInclusiveGroups(const nodes::MappingNode & node, const Object & input, EvalContext & ctx) {
    std::vector<const std::string *> groups;
    for(const nodes::MappingField & f : node.fields) {
        if(f.marker.requiredness() != Requiredness::Inclusive) continue;
        bool known = false;
        for(const std::string * g : groups) {
            if(*g == f.marker.monitorGroup()) {
                known = true;
                break;
            }
        }
        if(!known) groups.push_back(&f.marker.monitorGroup());
    }

    for(const std::string * group : groups) {
        std::size_t present = 0;
        std::size_t members = 0;
        for(const nodes::MappingField & f : node.fields) {
            if(f.marker.requiredness() != Requiredness::Inclusive || f.marker.monitorGroup() != *group) continue;
            members ++;
            if(input.contains(f.marker.name())) present ++;
        }
        if(present == 0 || present == members) continue;
        for(const nodes::MappingField & f : node.fields) {
            if(f.marker.requiredness() != Requiredness::Inclusive || f.marker.monitorGroup() != *group) continue;
            if(input.contains(f.marker.name())) continue;
            EvalContext::PathGuard guard = ctx.getMapItemGuard(f.marker.name());
            ctx.withError(ErrorKind::INCLUSIVE_GROUP_INCOMPLETE,
                          "inclusive field is missing while other fields of its group are present");
        }
    }
}

inline bool EvaluateMapping(const nodes::MappingNode & node, const Value & in, Object & result, EvalContext & ctx) {
    if(!in.is_object()) {
        return ctx.withError(ErrorKind::NOT_A_MAPPING,
                             "expected a mapping, got " + std::string(kind_to_string(in.kind())));
    }
    const Object & input = in.as_object();
    std::vector<bool> consumed(input.size(), false);
    const std::size_t errorsBefore = ctx.errorCount();

    for(const nodes::MappingField & f : node.fields) {
        const std::size_t i = input.index_of(f.marker.name());
        if(i == Object::npos) {
            if(f.marker.requiredness() == Requiredness::Required) {
                EvalContext::PathGuard guard = ctx.getMapItemGuard(f.marker.name());
                ctx.withError(ErrorKind::REQUIRED_FIELD_MISSING, "required key not provided");
            }
            continue;
        }
        consumed[i] = true;

        EvalContext::PathGuard guard = ctx.getMapItemGuard(f.marker.name());
        Value converted;
        if(Evaluate(*f.node, input.at(i).value, converted, ctx)) {
            result.insert_or_assign(f.marker.targetKey(), std::move(converted));
        }
    }

    if(node.enforceInclusive) {
        CheckInclusiveGroups(node, input, ctx);
    }

    for(std::size_t i = 0; i < input.size(); i ++) {
        if(consumed[i]) continue;
        const Object::Entry & extra = input.at(i);
        switch(node.extras) {
        case ExtrasPolicy::Prevent: {
            EvalContext::PathGuard guard = ctx.getMapItemGuard(extra.key);
            ctx.withError(ErrorKind::UNKNOWN_FIELD, "extra keys not allowed");
            break;
        }
        case ExtrasPolicy::Allow: {
            if(result.contains(extra.key)) {
                EvalContext::PathGuard guard = ctx.getMapItemGuard(extra.key);
                ctx.withError(ErrorKind::DUPLICATE_TARGET_KEY,
                              "extra key '" + extra.key + "' collides with a converted field");
            } else {
                result.insert_or_assign(extra.key, extra.value);
            }
            break;
        }
        case ExtrasPolicy::Remove:
            break;
        }
    }

    return ctx.errorCount() == errorsBefore;
}

inline bool EvaluateNode(const nodes::MappingNode & node, const Value & in, Value & out, EvalContext & ctx) {
    Object result;
    if(!EvaluateMapping(node, in, result, ctx)) {
        return false;
    }
    out = std::move(result);
    return true;
}

inline bool EvaluateNode(const nodes::SequenceNode & node, const Value & in, Value & out, EvalContext & ctx) {
    if(!in.is_array()) {
        return ctx.withError(ErrorKind::NOT_A_SEQUENCE,
                             "expected a sequence, got " + std::string(kind_to_string(in.kind())));
    }
    const Array & input = in.as_array();
    Array result;
    result.reserve(input.size());
    bool ok = true;
    for(std::size_t i = 0; i < input.size(); i ++) {
        EvalContext::PathGuard guard = ctx.getArrayItemGuard(i);
        Value converted;
        if(Evaluate(*node.element, input[i], converted, ctx)) {
            result.push_back(std::move(converted));
        } else {
            ok = false;
        }
    }
    if(!ok) {
        return false;
    }
    out = std::move(result);
    return true;
}

inline bool EvaluateNode(const nodes::FixedSequenceNode & node, const Value & in, Value & out, EvalContext & ctx) {
    if(!in.is_array()) {
        return ctx.withError(ErrorKind::NOT_A_SEQUENCE,
                             "expected a sequence, got " + std::string(kind_to_string(in.kind())));
    }
    const Array & input = in.as_array();
    if(input.size() != node.elements.size()) {
        return ctx.withError(ErrorKind::SEQUENCE_LENGTH_MISMATCH,
                             "expected a sequence of " + std::to_string(node.elements.size())
                             + " elements, got " + std::to_string(input.size()));
    }
    Array result;
    result.reserve(input.size());
    bool ok = true;
    for(std::size_t i = 0; i < input.size(); i ++) {
        EvalContext::PathGuard guard = ctx.getArrayItemGuard(i);
        Value converted;
        if(Evaluate(*node.elements[i], input[i], converted, ctx)) {
            result.push_back(std::move(converted));
        } else {
            ok = false;
        }
    }
    if(!ok) {
        return false;
    }
    out = std::move(result);
    return true;
}

inline bool EvaluateNode(const nodes::EnumNode & node, const Value & in, Value & out, EvalContext & ctx) {
    for(const nodes::LiteralNode & alternative : node.alternatives) {
        EvalContext scratch;
        Value converted;
        if(EvaluateNode(alternative, in, converted, scratch)) {
            out = std::move(converted);
            return true;
        }
    }
    std::string choices;
    for(const nodes::LiteralNode & alternative : node.alternatives) {
        if(!choices.empty()) choices += ", ";
        choices += Repr(alternative.expected);
    }
    return ctx.withError(ErrorKind::ENUM_NO_MATCH,
                         Repr(in) + " does not match any of [" + choices + "]");
}

inline bool EvaluateNode(const nodes::ConstructNode & node, const Value & in, Value & out, EvalContext & ctx) {
    Object fields;
    if(!EvaluateMapping(node.fields, in, fields, ctx)) {
        return false;
    }
    Result built;
    try {
        built = node.build(std::move(fields));
    } catch(const std::exception & e) {
        return ctx.withError(ErrorKind::OBJECT_CONSTRUCTION,
                             "could not construct " + node.typeName + ": " + e.what());
    } catch(...) {
        return ctx.withError(ErrorKind::OBJECT_CONSTRUCTION, "could not construct " + node.typeName);
    }
    if(!built) {
        return ctx.withErrors(built.errors());
    }
    out = std::move(built).take();
    return true;
}

inline bool EvaluateNode(const nodes::OpaqueNode & node, const Value & in, Value & out, EvalContext & ctx) {
    if(in.kind() != node.accepts) {
        if(node.accepts == ValueKind::Object) {
            return ctx.withError(ErrorKind::NOT_A_MAPPING,
                                 "expected a mapping, got " + std::string(kind_to_string(in.kind())));
        }
        return ctx.withError(ErrorKind::NOT_A_SEQUENCE,
                             "expected a sequence, got " + std::string(kind_to_string(in.kind())));
    }
    out = in;
    return true;
}

inline bool EvaluateNode(const nodes::CallableNode & node, const Value & in, Value & out, EvalContext & ctx) {
    return EvaluateLeaf(node.converter, in, out, ctx);
}

inline bool Evaluate(const Node & node, const Value & in, Value & out, EvalContext & ctx) {
    return std::visit([&](const auto & n) {
        return EvaluateNode(n, in, out, ctx);
    }, node.kind);
}

} // namespace evaluator_detail


// Walks `input` against a compiled tree. Never mutates either.
inline Result Transcode(const Node & root, const Value & input) {
    evaluator_detail::EvalContext ctx;
    Value out;
    if(!evaluator_detail::Evaluate(root, input, out, ctx)) {
        return Result(std::move(ctx).takeErrors());
    }
    return Result(std::move(out));
}

} // namespace ShapeFusion
