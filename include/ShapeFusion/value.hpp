#pragma once

#include <any>
#include <charconv>
#include <cmath>
#include <complex>
#include <concepts>
#include <cstdint>
#include <initializer_list>
#include <limits>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeinfo>
#include <utility>
#include <variant>
#include <vector>

#include "decimal.hpp"
#include "options.hpp"

namespace ShapeFusion {

class Value;
using Array = std::vector<Value>;

namespace value_detail {
template<class T, class Variant>
struct is_alternative : std::false_type {};

template<class T, class... Ts>
struct is_alternative<T, std::variant<Ts...>> : std::bool_constant<(std::is_same_v<T, Ts> || ...)> {};
}

enum class ValueKind : std::uint8_t {
    Null,
    Bool,
    Int,
    Float,
    Complex,
    Decimal,
    String,
    Array,
    Object,
    Opaque
};

constexpr std::string_view kind_to_string(ValueKind k) {
    switch(k) {
    case ValueKind::Null: return "null"; break;
    case ValueKind::Bool: return "bool"; break;
    case ValueKind::Int: return "int"; break;
    case ValueKind::Float: return "float"; break;
    case ValueKind::Complex: return "complex"; break;
    case ValueKind::Decimal: return "decimal"; break;
    case ValueKind::String: return "string"; break;
    case ValueKind::Array: return "array"; break;
    case ValueKind::Object: return "object"; break;
    case ValueKind::Opaque: return "opaque"; break;
    }
    return "N/A";
}

// Insertion-ordered string-keyed mapping.
class Object {
public:
    struct Entry;
    using iterator = std::vector<Entry>::iterator;
    using const_iterator = std::vector<Entry>::const_iterator;
    static constexpr std::size_t npos = std::numeric_limits<std::size_t>::max();

    Object() = default;
    Object(std::initializer_list<Entry> entries);

    std::size_t size() const;
    bool empty() const;

    iterator begin();
    iterator end();
    const_iterator begin() const;
    const_iterator end() const;

    std::size_t index_of(std::string_view key) const;
    bool contains(std::string_view key) const { return index_of(key) != npos; }
    const Value * find(std::string_view key) const;
    Value * find(std::string_view key);

    const Entry & at(std::size_t index) const;

    // Returns true when the key was newly inserted.
    bool insert_or_assign(std::string key, Value value);
    bool erase(std::string_view key);

    Value & operator[](std::string_view key);

    friend bool operator==(const Object & a, const Object & b);

private:
    std::vector<Entry> m_entries;
};

// Type-erased user object: constructed targets and non-scalar leaf results.
class Opaque {
    std::any m_object;
    bool (*m_equals)(const std::any &, const std::any &) = nullptr;

public:
    Opaque() = default;

    template<class T>
    static Opaque make(T object) {
        static_assert(std::is_copy_constructible_v<T>,
                      "ShapeFusion: opaque values must be copy-constructible");
        Opaque o;
        o.m_object = std::move(object);
        if constexpr (std::equality_comparable<T>) {
            o.m_equals = [](const std::any & a, const std::any & b) {
                return *std::any_cast<T>(&a) == *std::any_cast<T>(&b);
            };
        }
        return o;
    }

    bool has_value() const { return m_object.has_value(); }
    const std::type_info & type() const { return m_object.type(); }

    template<class T>
    const T * get_if() const { return std::any_cast<T>(&m_object); }

    friend bool operator==(const Opaque & a, const Opaque & b) {
        if(!a.has_value() || !b.has_value()) return !a.has_value() && !b.has_value();
        if(a.type() != b.type() || a.m_equals == nullptr) return false;
        return a.m_equals(a.m_object, b.m_object);
    }
};

class Value {
public:
    using Storage = std::variant<
        std::monostate,
        bool,
        std::int64_t,
        double,
        std::complex<double>,
        Decimal,
        std::string,
        Array,
        Object,
        Opaque
    >;

    Value() = default;
    Value(std::nullptr_t) {}
    Value(bool b) : m_storage(b) {}

    template<class T>
        requires (std::integral<T> && !std::same_as<T, bool>)
    Value(T v) : m_storage(static_cast<std::int64_t>(v)) {}

    template<class T>
        requires std::floating_point<T>
    Value(T v) : m_storage(static_cast<double>(v)) {}

    Value(std::complex<double> c) : m_storage(c) {}
    Value(Decimal d) : m_storage(std::move(d)) {}
    Value(const char * s) : m_storage(std::string(s)) {}
    Value(std::string_view s) : m_storage(std::string(s)) {}
    Value(std::string s) : m_storage(std::move(s)) {}
    Value(Array a) : m_storage(std::move(a)) {}
    Value(Object o) : m_storage(std::move(o)) {}
    Value(Opaque o) : m_storage(std::move(o)) {}

    template<class T>
    static Value MakeOpaque(T object) {
        return Value(Opaque::make(std::move(object)));
    }

    ValueKind kind() const { return static_cast<ValueKind>(m_storage.index()); }

    bool is_null() const    { return kind() == ValueKind::Null; }
    bool is_bool() const    { return kind() == ValueKind::Bool; }
    bool is_int() const     { return kind() == ValueKind::Int; }
    bool is_float() const   { return kind() == ValueKind::Float; }
    bool is_number() const  { return is_int() || is_float(); }
    bool is_complex() const { return kind() == ValueKind::Complex; }
    bool is_decimal() const { return kind() == ValueKind::Decimal; }
    bool is_string() const  { return kind() == ValueKind::String; }
    bool is_array() const   { return kind() == ValueKind::Array; }
    bool is_object() const  { return kind() == ValueKind::Object; }
    bool is_opaque() const  { return kind() == ValueKind::Opaque; }
    bool is_scalar() const {
        return !is_null() && !is_array() && !is_object() && !is_opaque();
    }

    bool as_bool() const                        { return std::get<bool>(m_storage); }
    std::int64_t as_int() const                 { return std::get<std::int64_t>(m_storage); }
    double as_float() const                     { return std::get<double>(m_storage); }
    const std::complex<double> & as_complex() const { return std::get<std::complex<double>>(m_storage); }
    const Decimal & as_decimal() const          { return std::get<Decimal>(m_storage); }
    const std::string & as_string() const       { return std::get<std::string>(m_storage); }
    const Array & as_array() const              { return std::get<Array>(m_storage); }
    Array & as_array()                          { return std::get<Array>(m_storage); }
    const Object & as_object() const            { return std::get<Object>(m_storage); }
    Object & as_object()                        { return std::get<Object>(m_storage); }
    const Opaque & as_opaque() const            { return std::get<Opaque>(m_storage); }

    // Any storage alternative, or a type held inside an Opaque value.
    template<class T>
    const T * get_if() const {
        if constexpr (value_detail::is_alternative<T, Storage>::value) {
            return std::get_if<T>(&m_storage);
        } else {
            if(const Opaque * o = std::get_if<Opaque>(&m_storage)) {
                return o->get_if<T>();
            }
            return nullptr;
        }
    }

    template<class T>
    const T & as() const {
        const T * p = get_if<T>();
        if(p == nullptr) {
            throw std::bad_variant_access();
        }
        return *p;
    }

    const Storage & storage() const { return m_storage; }

    friend bool operator==(const Value & a, const Value & b) {
        // ints and floats compare numerically
        if(a.is_int() && b.is_float()) return static_cast<double>(a.as_int()) == b.as_float();
        if(a.is_float() && b.is_int()) return a.as_float() == static_cast<double>(b.as_int());
        return a.m_storage == b.m_storage;
    }

private:
    Storage m_storage;
};

struct Object::Entry {
    std::string key;
    Value value;
};

inline std::size_t Object::size() const { return m_entries.size(); }
inline bool Object::empty() const { return m_entries.empty(); }
inline Object::iterator Object::begin() { return m_entries.begin(); }
inline Object::iterator Object::end() { return m_entries.end(); }
inline Object::const_iterator Object::begin() const { return m_entries.begin(); }
inline Object::const_iterator Object::end() const { return m_entries.end(); }
inline const Object::Entry & Object::at(std::size_t index) const { return m_entries[index]; }

inline Object::Object(std::initializer_list<Entry> entries) {
    for(const Entry & e : entries) {
        insert_or_assign(e.key, e.value);
    }
}

inline std::size_t Object::index_of(std::string_view key) const {
    for(std::size_t i = 0; i < m_entries.size(); i ++) {
        if(m_entries[i].key == key) return i;
    }
    return npos;
}

inline const Value * Object::find(std::string_view key) const {
    std::size_t i = index_of(key);
    return i == npos ? nullptr : &m_entries[i].value;
}

inline Value * Object::find(std::string_view key) {
    std::size_t i = index_of(key);
    return i == npos ? nullptr : &m_entries[i].value;
}

inline bool Object::insert_or_assign(std::string key, Value value) {
    std::size_t i = index_of(key);
    if(i != npos) {
        m_entries[i].value = std::move(value);
        return false;
    }
    m_entries.push_back(Entry{std::move(key), std::move(value)});
    return true;
}

inline bool Object::erase(std::string_view key) {
    std::size_t i = index_of(key);
    if(i == npos) return false;
    m_entries.erase(m_entries.begin() + static_cast<std::ptrdiff_t>(i));
    return true;
}

inline Value & Object::operator[](std::string_view key) {
    std::size_t i = index_of(key);
    if(i == npos) {
        m_entries.push_back(Entry{std::string(key), Value{}});
        return m_entries.back().value;
    }
    return m_entries[i].value;
}

// Key order does not matter for equality.
inline bool operator==(const Object & a, const Object & b) {
    if(a.size() != b.size()) return false;
    for(const Object::Entry & e : a) {
        const Value * other = b.find(e.key);
        if(other == nullptr || !(*other == e.value)) return false;
    }
    return true;
}


namespace value_detail {

inline void append_quoted(std::string & out, std::string_view s) {
    out.push_back('\'');
    for(char c : s) {
        switch(c) {
        case '\'': out += "\\'"; break;
        case '\\': out += "\\\\"; break;
        case '\n': out += "\\n"; break;
        case '\t': out += "\\t"; break;
        default: out.push_back(c);
        }
    }
    out.push_back('\'');
}

inline std::string format_double(double d) {
    if(std::isnan(d)) return "nan";
    if(std::isinf(d)) return d < 0 ? "-inf" : "inf";
    char buf[64];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), d);
    std::string s(buf, ec == std::errc() ? ptr : buf);
    if(s.find_first_of(".eE") == std::string::npos) s += ".0";
    return s;
}

inline void append_repr(std::string & out, const Value & v) {
    switch(v.kind()) {
    case ValueKind::Null: out += "null"; break;
    case ValueKind::Bool: out += v.as_bool() ? "true" : "false"; break;
    case ValueKind::Int: out += std::to_string(v.as_int()); break;
    case ValueKind::Float: out += format_double(v.as_float()); break;
    case ValueKind::Complex:
        out += "(" + format_double(v.as_complex().real());
        if(!std::signbit(v.as_complex().imag())) out += "+";
        out += format_double(v.as_complex().imag()) + "j)";
        break;
    case ValueKind::Decimal: out += "Decimal('" + v.as_decimal().toString() + "')"; break;
    case ValueKind::String: append_quoted(out, v.as_string()); break;
    case ValueKind::Array: {
        out.push_back('[');
        bool first = true;
        for(const Value & item : v.as_array()) {
            if(!first) out += ", ";
            first = false;
            append_repr(out, item);
        }
        out.push_back(']');
        break;
    }
    case ValueKind::Object: {
        out.push_back('{');
        bool first = true;
        for(const Object::Entry & e : v.as_object()) {
            if(!first) out += ", ";
            first = false;
            append_quoted(out, e.key);
            out += ": ";
            append_repr(out, e.value);
        }
        out.push_back('}');
        break;
    }
    case ValueKind::Opaque:
        out += "<";
        out += v.as_opaque().has_value() ? v.as_opaque().type().name() : "empty";
        out += ">";
        break;
    }
}

} // namespace value_detail

// Short human-readable rendering used in error messages.
inline std::string Repr(const Value & v, std::size_t limit = options::ValuePreviewLimit) {
    std::string out;
    value_detail::append_repr(out, v);
    if(out.size() > limit) {
        // never cut inside a UTF-8 sequence
        std::size_t cut = limit;
        while(cut > 0 && (static_cast<unsigned char>(out[cut]) & 0xC0) == 0x80) cut --;
        out.resize(cut);
        out += "...";
    }
    return out;
}

} // namespace ShapeFusion
