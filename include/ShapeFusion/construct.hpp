#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeinfo>
#include <utility>
#include <vector>

#include <pfr/core.hpp>
#include <pfr/core_name.hpp>
#include <pfr/tuple_size.hpp>

#include "errors.hpp"
#include "raw_schema.hpp"
#include "result.hpp"
#include "value.hpp"
#include "value_cast.hpp"

namespace ShapeFusion {

namespace introspection {

namespace detail {

template<class T>
struct IntrospectionImpl {
    using StructT = std::remove_cv_t<T>;

    static constexpr std::size_t structureElementsCount = pfr::tuple_size_v<StructT>;

    template<std::size_t Index>
    static constexpr std::string_view structureElementNameByIndex = pfr::get_name<Index, StructT>();
};

} // namespace detail

template<class StructT>
static constexpr std::size_t structureElementsCount = detail::IntrospectionImpl<StructT>::structureElementsCount;

template<std::size_t Index, class StructT>
static constexpr std::string_view structureElementNameByIndex =
    detail::IntrospectionImpl<StructT>::template structureElementNameByIndex<Index>;

template<class StructT>
bool hasField(std::string_view name) {
    return [&]<std::size_t... I>(std::index_sequence<I...>) {
        return ((structureElementNameByIndex<I, StructT> == name) || ...);
    }(std::make_index_sequence<structureElementsCount<StructT>>{});
}

// Copies every field of `fields` whose key names a member of `obj`.
template<class StructT>
bool populateFields(StructT & obj, const Object & fields, std::string & error) {
    auto populateOne = [&]<std::size_t I>(std::integral_constant<std::size_t, I>) {
        constexpr std::string_view name = structureElementNameByIndex<I, StructT>;
        const Value * v = fields.find(name);
        if(v == nullptr) {
            return true;
        }
        if(!AssignFromValue(pfr::get<I>(obj), *v, error)) {
            error = "field '" + std::string(name) + "': " + error;
            return false;
        }
        return true;
    };
    return [&]<std::size_t... I>(std::index_sequence<I...>) {
        return (populateOne(std::integral_constant<std::size_t, I>{}) && ...);
    }(std::make_index_sequence<structureElementsCount<StructT>>{});
}

} // namespace introspection


// Builds a T from a converted mapping. Three ways to fill the instance:
//  - aggregate population: each target key is assigned to the member of the
//    same name;
//  - a member function `void T::init(const Object &)`;
//  - any callable `void(T &, const Object &)`.
template<class T>
class Construct {
    static_assert(std::is_default_constructible_v<T>,
                  "ShapeFusion: Construct<T> requires a default-constructible T");
    static_assert(std::is_copy_constructible_v<T>,
                  "ShapeFusion: Construct<T> requires a copy-constructible T");

public:
    using Method = void (T::*)(const Object &);
    using Initializer = std::function<void(T &, const Object &)>;

    explicit Construct(Map fields)
        requires std::is_aggregate_v<T>
        : m_fields(std::move(fields))
    {}

    Construct(Map fields, Method method)
        : m_fields(std::move(fields))
        , m_mode(Mode::Method)
        , m_method(method)
    {}

    Construct(Map fields, Initializer init)
        : m_fields(std::move(fields))
        , m_mode(Mode::Callable)
        , m_init(std::move(init))
    {}

    raw_detail::RawConstruct erase() const {
        raw_detail::RawConstruct out{m_fields, typeid(T).name(), {}, {}};
        const Mode mode = m_mode;
        const Method method = m_method;
        const Initializer init = m_init;
        const std::string typeName = out.typeName;

        out.check = [mode, method, init, typeName](const std::vector<std::string> & targetKeys) {
            switch(mode) {
            case Mode::Aggregate:
                if constexpr (std::is_aggregate_v<T>) {
                    for(const std::string & key : targetKeys) {
                        if(!introspection::hasField<T>(key)) {
                            throw SchemaDefinitionError("'" + key + "' is not a field of " + typeName);
                        }
                    }
                }
                break;
            case Mode::Method:
                if(method == nullptr) {
                    throw SchemaDefinitionError("null initializer method for " + typeName);
                }
                break;
            case Mode::Callable:
                if(!init) {
                    throw SchemaDefinitionError("empty initializer for " + typeName);
                }
                break;
            }
        };

        out.build = [mode, method, init](Object && fields) -> Result {
            T obj{};
            switch(mode) {
            case Mode::Aggregate:
                if constexpr (std::is_aggregate_v<T>) {
                    std::string error;
                    if(!introspection::populateFields(obj, fields, error)) {
                        return Fail(ErrorKind::OBJECT_CONSTRUCTION, std::move(error));
                    }
                }
                break;
            case Mode::Method:
                (obj.*method)(fields);
                break;
            case Mode::Callable:
                init(obj, fields);
                break;
            }
            return Ok(Value::MakeOpaque(std::move(obj)));
        };
        return out;
    }

private:
    enum class Mode { Aggregate, Method, Callable };

    Map m_fields;
    Mode m_mode = Mode::Aggregate;
    Method m_method = nullptr;
    Initializer m_init;
};

template<class T>
RawSchema::RawSchema(const Construct<T> & c)
    : RawSchema(c.erase())
{}

} // namespace ShapeFusion
