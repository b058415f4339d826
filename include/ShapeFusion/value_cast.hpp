#pragma once

#include <complex>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "decimal.hpp"
#include "value.hpp"

namespace ShapeFusion {

namespace value_cast_detail {

template<class T, template<class...> class Template>
struct is_specialization_of : std::false_type {};

template<template<class...> class Template, class... Args>
struct is_specialization_of<Template<Args...>, Template> : std::true_type {};

template<class T, template<class...> class Template>
constexpr bool is_specialization_of_v =
    is_specialization_of<std::remove_cvref_t<T>, Template>::value;

template<class T>
struct is_string_map : std::false_type {};

template<class E, class Cmp, class Alloc>
struct is_string_map<std::map<std::string, E, Cmp, Alloc>> : std::true_type {};

inline bool mismatch(std::string & error, std::string_view expected, const Value & v) {
    error = "expected " + std::string(expected) + ", got " + std::string(kind_to_string(v.kind()));
    return false;
}

} // namespace value_cast_detail


// Assigns a converted value to a typed destination. On failure `dst` is left
// in an unspecified state and `error` describes the mismatch.
template<class T>
bool AssignFromValue(T & dst, const Value & v, std::string & error) {
    using namespace value_cast_detail;

    if constexpr (std::is_same_v<T, Value>) {
        dst = v;
        return true;
    } else if constexpr (std::is_same_v<T, bool>) {
        if(!v.is_bool()) return mismatch(error, "bool", v);
        dst = v.as_bool();
        return true;
    } else if constexpr (std::is_integral_v<T>) {
        if(!v.is_int()) return mismatch(error, "int", v);
        if(!std::in_range<T>(v.as_int())) {
            error = "integer " + std::to_string(v.as_int()) + " out of range for the field";
            return false;
        }
        dst = static_cast<T>(v.as_int());
        return true;
    } else if constexpr (std::is_floating_point_v<T>) {
        if(v.is_float()) {
            dst = static_cast<T>(v.as_float());
        } else if(v.is_int()) {
            dst = static_cast<T>(v.as_int());
        } else {
            return mismatch(error, "float", v);
        }
        return true;
    } else if constexpr (std::is_same_v<T, std::string>) {
        if(!v.is_string()) return mismatch(error, "string", v);
        dst = v.as_string();
        return true;
    } else if constexpr (std::is_same_v<T, Decimal>) {
        if(v.is_decimal()) {
            dst = v.as_decimal();
        } else if(v.is_int()) {
            dst = Decimal(v.as_int());
        } else {
            return mismatch(error, "decimal", v);
        }
        return true;
    } else if constexpr (std::is_same_v<T, std::complex<double>>) {
        if(v.is_complex()) {
            dst = v.as_complex();
        } else if(v.is_float()) {
            dst = std::complex<double>(v.as_float(), 0.0);
        } else if(v.is_int()) {
            dst = std::complex<double>(static_cast<double>(v.as_int()), 0.0);
        } else {
            return mismatch(error, "complex", v);
        }
        return true;
    } else if constexpr (std::is_same_v<T, Object>) {
        if(!v.is_object()) return mismatch(error, "object", v);
        dst = v.as_object();
        return true;
    } else if constexpr (is_specialization_of_v<T, std::optional>) {
        if(v.is_null()) {
            dst.reset();
            return true;
        }
        typename T::value_type inner{};
        if(!AssignFromValue(inner, v, error)) return false;
        dst = std::move(inner);
        return true;
    } else if constexpr (is_specialization_of_v<T, std::vector>) {
        if(!v.is_array()) return mismatch(error, "array", v);
        T out;
        out.reserve(v.as_array().size());
        for(std::size_t i = 0; i < v.as_array().size(); i ++) {
            typename T::value_type item{};
            if(!AssignFromValue(item, v.as_array()[i], error)) {
                error = "[" + std::to_string(i) + "]: " + error;
                return false;
            }
            out.push_back(std::move(item));
        }
        dst = std::move(out);
        return true;
    } else if constexpr (is_string_map<T>::value) {
        if(!v.is_object()) return mismatch(error, "object", v);
        T out;
        for(const Object::Entry & e : v.as_object()) {
            typename T::mapped_type item{};
            if(!AssignFromValue(item, e.value, error)) {
                error = "['" + e.key + "']: " + error;
                return false;
            }
            out.insert_or_assign(e.key, std::move(item));
        }
        dst = std::move(out);
        return true;
    } else {
        // Constructed objects and other leaf results travel as Opaque.
        const T * held = v.get_if<T>();
        if(held == nullptr) {
            return mismatch(error, "an opaque value of the field's type", v);
        }
        dst = *held;
        return true;
    }
}

} // namespace ShapeFusion
