#pragma once

#include <memory>
#include <utility>

#include "compiler.hpp"
#include "evaluator.hpp"
#include "nodes.hpp"
#include "options.hpp"
#include "raw_schema.hpp"
#include "result.hpp"
#include "value.hpp"

namespace ShapeFusion {

// A compiled, reusable transcoder. Compilation happens once in the
// constructor (throwing SchemaDefinitionError on a malformed schema); every
// call evaluates one input and returns a fresh Result.
//
// Copies share the same immutable tree, so a Schema can be embedded in
// another schema as a leaf, and evaluated from several threads at once.
class Schema {
    std::shared_ptr<const Node> m_root;

public:
    explicit Schema(const RawSchema & raw, const CompileOptions & opts = {})
        : m_root(Compile(raw, opts))
    {}

    Result Transcode(const Value & input) const {
        return ShapeFusion::Transcode(*m_root, input);
    }

    Result operator()(const Value & input) const {
        return Transcode(input);
    }

    const Node & root() const { return *m_root; }
};

} // namespace ShapeFusion
