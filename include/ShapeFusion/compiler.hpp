#pragma once

#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "converters.hpp"
#include "errors.hpp"
#include "nodes.hpp"
#include "options.hpp"
#include "raw_schema.hpp"
#include "value.hpp"

namespace ShapeFusion {

namespace compiler_detail {

// Converter that coerces to the kind of `v`, used for scalars written
// directly into a schema.
inline Converter converter_for_scalar(const Value & v) {
    switch(v.kind()) {
    case ValueKind::Bool: return Boolean();
    case ValueKind::Int: return Integer();
    case ValueKind::Float: return Float();
    case ValueKind::Complex: return ComplexNumber();
    case ValueKind::Decimal: return ParseDecimal();
    case ValueKind::String: return String();
    case ValueKind::Null:
    case ValueKind::Array:
    case ValueKind::Object:
    case ValueKind::Opaque:
        break;
    }
    throw SchemaDefinitionError("a " + std::string(kind_to_string(v.kind()))
                                + " value cannot be used as a schema: " + Repr(v));
}

inline CompileOptions apply_overrides(CompileOptions inherited, const Map & m) {
    if(m.extras) inherited.extras = *m.extras;
    if(m.enforceInclusive) inherited.enforce_inclusive_groups = *m.enforceInclusive;
    return inherited;
}

inline NodePtr compile(const RawSchema & raw, const CompileOptions & opts);

inline nodes::MappingNode compile_mapping(const Fields & fields, const CompileOptions & opts) {
    nodes::MappingNode mapping;
    mapping.extras = opts.extras;
    mapping.enforceInclusive = opts.enforce_inclusive_groups;
    mapping.fields.reserve(fields.size());

    for(const FieldEntry & entry : fields) {
        const Marker * marker = entry.key.marker();
        if(marker == nullptr) {
            throw SchemaDefinitionError("mapping key '" + *entry.key.plainKey()
                                        + "' must be a marker (Required, Optional or Inclusive)");
        }
        for(const nodes::MappingField & seen : mapping.fields) {
            if(seen.marker.name() == marker->name()) {
                throw SchemaDefinitionError("duplicate marker for key '" + marker->name() + "'");
            }
            if(seen.marker.targetKey() == marker->targetKey()) {
                throw SchemaDefinitionError("keys '" + seen.marker.name() + "' and '" + marker->name()
                                            + "' are both written to '" + marker->targetKey() + "'");
            }
        }
        mapping.fields.push_back(nodes::MappingField{*marker, compile(entry.schema, opts)});
    }
    return mapping;
}

inline std::vector<NodePtr> compile_positional(const std::vector<RawSchema> & elements, const CompileOptions & opts) {
    std::vector<NodePtr> out;
    out.reserve(elements.size());
    for(const RawSchema & e : elements) {
        out.push_back(compile(e, opts));
    }
    return out;
}

// Set and Enum members must be literals.
inline nodes::LiteralNode compile_literal(const RawSchema & raw) {
    const auto & kind = raw.node().kind;
    if(const Value * scalar = std::get_if<Value>(&kind)) {
        return nodes::LiteralNode{converter_for_scalar(*scalar), *scalar};
    }
    if(const Literal * lit = std::get_if<Literal>(&kind)) {
        if(!lit->converter) {
            throw SchemaDefinitionError("literal has an empty converter");
        }
        return nodes::LiteralNode{lit->converter, lit->expected};
    }
    throw SchemaDefinitionError("enum members must be literals");
}

inline nodes::EnumNode compile_enum(const std::vector<RawSchema> & members, bool dedupe) {
    nodes::EnumNode e;
    e.alternatives.reserve(members.size());
    for(const RawSchema & m : members) {
        nodes::LiteralNode lit = compile_literal(m);
        if(dedupe && std::holds_alternative<Value>(m.node().kind)) {
            bool seen = false;
            for(const nodes::LiteralNode & prev : e.alternatives) {
                if(prev.expected.kind() == lit.expected.kind() && prev.expected == lit.expected) {
                    seen = true;
                    break;
                }
            }
            if(seen) continue;
        }
        e.alternatives.push_back(std::move(lit));
    }
    return e;
}

inline NodePtr compile(const RawSchema & raw, const CompileOptions & opts) {
    return std::visit([&opts]<class K>(const K & k) -> NodePtr {
        if constexpr (std::is_same_v<K, Fields>) {
            return make_node(compile_mapping(k, opts));
        } else if constexpr (std::is_same_v<K, Tuple> || std::is_same_v<K, FixedList>) {
            return make_node(nodes::FixedSequenceNode{compile_positional(k.elements, opts)});
        } else if constexpr (std::is_same_v<K, Map>) {
            return make_node(compile_mapping(k.fields, apply_overrides(opts, k)));
        } else if constexpr (std::is_same_v<K, List>) {
            return make_node(nodes::SequenceNode{compile(k.element, opts)});
        } else if constexpr (std::is_same_v<K, Value>) {
            return make_node(compile_literal(RawSchema(k)));
        } else if constexpr (std::is_same_v<K, Literal>) {
            return make_node(compile_literal(RawSchema(k)));
        } else if constexpr (std::is_same_v<K, Set>) {
            return make_node(compile_enum(k.members, true));
        } else if constexpr (std::is_same_v<K, Enum>) {
            return make_node(compile_enum(k.members, false));
        } else if constexpr (std::is_same_v<K, raw_detail::RawConstruct>) {
            nodes::MappingNode mapping = compile_mapping(k.fields.fields, apply_overrides(opts, k.fields));
            std::vector<std::string> targetKeys;
            targetKeys.reserve(mapping.fields.size());
            for(const nodes::MappingField & f : mapping.fields) {
                targetKeys.push_back(f.marker.targetKey());
            }
            k.check(targetKeys);
            return make_node(nodes::ConstructNode{std::move(mapping), k.typeName, k.build});
        } else if constexpr (std::is_same_v<K, UnvalidatedMap>) {
            return make_node(nodes::OpaqueNode{ValueKind::Object});
        } else if constexpr (std::is_same_v<K, UnvalidatedList>) {
            return make_node(nodes::OpaqueNode{ValueKind::Array});
        } else if constexpr (std::is_same_v<K, Converter>) {
            if(!k) {
                throw SchemaDefinitionError("empty converter used as a schema");
            }
            return make_node(nodes::CallableNode{k});
        } else {
            static_assert(!sizeof(K), "unhandled raw schema kind");
        }
    }, raw.node().kind);
}

} // namespace compiler_detail


// Turns a raw schema into an immutable node tree. Throws
// SchemaDefinitionError when any part of the schema cannot be classified.
inline NodePtr Compile(const RawSchema & raw, const CompileOptions & opts = {}) {
    return compiler_detail::compile(raw, opts);
}

} // namespace ShapeFusion
