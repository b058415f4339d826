#pragma once

#include <complex>
#include <concepts>
#include <functional>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "converters.hpp"
#include "markers.hpp"
#include "options.hpp"
#include "result.hpp"
#include "value.hpp"

namespace ShapeFusion {

// User-authored schema description. Cheap to copy (shared, immutable
// payload) and implicitly constructible from every supported shape, so
// schemas are written as nested brace literals:
//
//   RawSchema s = {
//       {Required("id"), Integer()},
//       {Optional("tags"), List(String())},
//       {Required("kind"), Set{"user", "admin"}},
//   };

class RawSchema;
struct FieldEntry;
struct Tuple;
struct Set;
struct Map;
struct List;
struct FixedList;
struct Literal;
struct Enum;
struct UnvalidatedMap;
struct UnvalidatedList;

template<class T>
class Construct;

namespace raw_detail {
struct RawNode;
struct RawConstruct;
}

using Fields = std::vector<FieldEntry>;

// Key of a mapping literal. Only markers are legal keys; a plain string is
// kept so that the compiler can reject it.
class FieldKey {
    std::variant<Marker, std::string> m_key;

public:
    FieldKey(Marker m) : m_key(std::move(m)) {}
    FieldKey(const char * plain) : m_key(std::string(plain)) {}
    FieldKey(std::string plain) : m_key(std::move(plain)) {}

    const Marker * marker() const { return std::get_if<Marker>(&m_key); }
    const std::string * plainKey() const { return std::get_if<std::string>(&m_key); }
};

class RawSchema {
public:
    // Native mapping literal
    RawSchema(std::initializer_list<FieldEntry> fields);
    RawSchema(Fields fields);

    // Native ordered-sequence literals (fixed-length, positional)
    RawSchema(Tuple t);
    RawSchema(std::vector<RawSchema> elements);

    // Native set literal
    RawSchema(Set s);

    // Explicit wrappers
    RawSchema(Map m);
    RawSchema(List l);
    RawSchema(FixedList f);
    RawSchema(Literal l);
    RawSchema(Enum e);
    RawSchema(UnvalidatedMap m);
    RawSchema(UnvalidatedList l);

    template<class T>
    RawSchema(const Construct<T> & c);

    explicit RawSchema(raw_detail::RawConstruct c);

    // Scalars used directly as schemas become literals
    RawSchema(Value v);
    RawSchema(const char * s) : RawSchema(Value(s)) {}
    RawSchema(std::string s) : RawSchema(Value(std::move(s))) {}
    RawSchema(Decimal d) : RawSchema(Value(std::move(d))) {}
    RawSchema(std::complex<double> c) : RawSchema(Value(c)) {}

    template<class T>
        requires std::is_arithmetic_v<T>
    RawSchema(T v) : RawSchema(Value(v)) {}

    // Leaf converters and any other callable
    RawSchema(Converter c);

    template<class F>
        requires (std::is_invocable_r_v<Result, const F &, const Value &>
                  && !std::same_as<std::remove_cvref_t<F>, Converter>
                  && !std::same_as<std::remove_cvref_t<F>, RawSchema>)
    RawSchema(F f) : RawSchema(Converter(std::move(f))) {}

    const raw_detail::RawNode & node() const { return *m_node; }

private:
    std::shared_ptr<const raw_detail::RawNode> m_node;
};

struct FieldEntry {
    FieldKey key;
    RawSchema schema;
};


// ============================================================================
// Wrappers
// ============================================================================

struct Tuple {
    std::vector<RawSchema> elements;

    Tuple(std::initializer_list<RawSchema> e) : elements(e) {}
};

struct Set {
    std::vector<RawSchema> members;

    Set(std::initializer_list<RawSchema> m) : members(m) {}
};

// Mapping with its own settings; unset settings are inherited from the
// enclosing schema.
struct Map {
    Fields fields;
    std::optional<ExtrasPolicy> extras;
    std::optional<bool> enforceInclusive;

    Map(std::initializer_list<FieldEntry> f) : fields(f) {}
    Map(Fields f, std::optional<ExtrasPolicy> policy = std::nullopt)
        : fields(std::move(f))
        , extras(policy)
    {}

    Map & inclusiveGroups(bool enforce) & {
        enforceInclusive = enforce;
        return *this;
    }
    Map && inclusiveGroups(bool enforce) && {
        enforceInclusive = enforce;
        return std::move(*this);
    }
};

// Homogeneous sequence: every element is checked against `element`.
struct List {
    RawSchema element;

    explicit List(RawSchema e) : element(std::move(e)) {}
};

// Fixed-length heterogeneous sequence.
struct FixedList {
    std::vector<RawSchema> elements;

    FixedList(std::initializer_list<RawSchema> e) : elements(e) {}
    explicit FixedList(std::vector<RawSchema> e) : elements(std::move(e)) {}
};

// Converts with `converter`, then requires equality with `expected`.
struct Literal {
    Converter converter;
    Value expected;

    Literal(Converter c, Value e)
        : converter(std::move(c))
        , expected(std::move(e))
    {}
};

// First matching literal wins.
struct Enum {
    std::vector<RawSchema> members;

    Enum(std::initializer_list<RawSchema> m) : members(m) {}
};

// Any mapping, passed through unchecked.
struct UnvalidatedMap {};

// Any sequence, passed through unchecked.
struct UnvalidatedList {};


namespace raw_detail {

// Type-erased Construct<T>
struct RawConstruct {
    Map fields;
    std::string typeName;
    // Throws SchemaDefinitionError when the target keys do not fit the type.
    std::function<void(const std::vector<std::string> & targetKeys)> check;
    std::function<Result(Object && fields)> build;
};

struct RawNode {
    using Kind = std::variant<
        Fields,
        Tuple,
        Set,
        Map,
        List,
        FixedList,
        Literal,
        Enum,
        UnvalidatedMap,
        UnvalidatedList,
        RawConstruct,
        Value,
        Converter
    >;
    Kind kind;
};

template<class T>
std::shared_ptr<const RawNode> make_node(T payload) {
    return std::make_shared<const RawNode>(RawNode{RawNode::Kind(std::in_place_type<T>, std::move(payload))});
}

} // namespace raw_detail


inline RawSchema::RawSchema(std::initializer_list<FieldEntry> fields)
    : m_node(raw_detail::make_node(Fields(fields))) {}
inline RawSchema::RawSchema(Fields fields)
    : m_node(raw_detail::make_node(std::move(fields))) {}
inline RawSchema::RawSchema(Tuple t)
    : m_node(raw_detail::make_node(std::move(t))) {}
inline RawSchema::RawSchema(std::vector<RawSchema> elements)
    : m_node(raw_detail::make_node(FixedList(std::move(elements)))) {}
inline RawSchema::RawSchema(Set s)
    : m_node(raw_detail::make_node(std::move(s))) {}
inline RawSchema::RawSchema(Map m)
    : m_node(raw_detail::make_node(std::move(m))) {}
inline RawSchema::RawSchema(List l)
    : m_node(raw_detail::make_node(std::move(l))) {}
inline RawSchema::RawSchema(FixedList f)
    : m_node(raw_detail::make_node(std::move(f))) {}
inline RawSchema::RawSchema(Literal l)
    : m_node(raw_detail::make_node(std::move(l))) {}
inline RawSchema::RawSchema(Enum e)
    : m_node(raw_detail::make_node(std::move(e))) {}
inline RawSchema::RawSchema(UnvalidatedMap m)
    : m_node(raw_detail::make_node(m)) {}
inline RawSchema::RawSchema(UnvalidatedList l)
    : m_node(raw_detail::make_node(l)) {}
inline RawSchema::RawSchema(raw_detail::RawConstruct c)
    : m_node(raw_detail::make_node(std::move(c))) {}
inline RawSchema::RawSchema(Value v)
    : m_node(raw_detail::make_node(std::move(v))) {}
inline RawSchema::RawSchema(Converter c)
    : m_node(raw_detail::make_node(std::move(c))) {}

} // namespace ShapeFusion
