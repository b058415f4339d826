#pragma once

#include <functional>
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include "converters.hpp"
#include "markers.hpp"
#include "options.hpp"
#include "result.hpp"
#include "value.hpp"

namespace ShapeFusion {

// Compiled schema tree. Built once by the compiler, never mutated after.
// Every node owns its children.

struct Node;
using NodePtr = std::unique_ptr<const Node>;

namespace nodes {

struct LiteralNode {
    Converter converter;
    Value expected;
};

struct MappingField {
    Marker marker;
    NodePtr node;
};

struct MappingNode {
    std::vector<MappingField> fields;
    ExtrasPolicy extras = ExtrasPolicy::Prevent;
    bool enforceInclusive = false;
};

struct SequenceNode {
    NodePtr element;
};

struct FixedSequenceNode {
    std::vector<NodePtr> elements;
};

struct EnumNode {
    std::vector<LiteralNode> alternatives;
};

// Produces an Opaque holding the target type from a converted mapping.
struct ConstructNode {
    MappingNode fields;
    std::string typeName;
    std::function<Result(Object &&)> build;
};

// Checks only the container kind (Array or Object) and copies the input.
struct OpaqueNode {
    ValueKind accepts = ValueKind::Object;
};

struct CallableNode {
    Converter converter;
};

} // namespace nodes

struct Node {
    using Kind = std::variant<
        nodes::LiteralNode,
        nodes::MappingNode,
        nodes::SequenceNode,
        nodes::FixedSequenceNode,
        nodes::EnumNode,
        nodes::ConstructNode,
        nodes::OpaqueNode,
        nodes::CallableNode
    >;
    Kind kind;

    template<class T>
    const T * get_if() const {
        return std::get_if<T>(&kind);
    }
};

template<class T>
NodePtr make_node(T payload) {
    return std::make_unique<const Node>(Node{Node::Kind(std::in_place_type<T>, std::move(payload))});
}

} // namespace ShapeFusion
