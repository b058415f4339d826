#pragma once

#include <cstddef>
#include <limits>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace ShapeFusion {
namespace path {

struct PathElement {
    static constexpr std::size_t NotAnIndex = std::numeric_limits<std::size_t>::max();

    std::size_t array_index = NotAnIndex;   // sequences
    std::string field_name;                 // mappings

    PathElement() = default;

    // For `{index}`
    PathElement(std::size_t index)
        : array_index(index)
    {}

    // For `{key}`
    PathElement(std::string_view key)
        : field_name(key)
    {}
    PathElement(const char * key)
        : field_name(key)
    {}

    bool is_index() const { return array_index != NotAnIndex; }

    friend bool operator==(const PathElement & a, const PathElement & b) {
        return a.array_index == b.array_index && a.field_name == b.field_name;
    }
};

// Location of a value inside the evaluated input, outermost element first.
class Path {
    std::vector<PathElement> storage;

public:
    using const_iterator = std::vector<PathElement>::const_iterator;

    Path() = default;

    template <class ... PathElems>
        requires (sizeof...(PathElems) > 0)
    explicit Path(PathElems ... args) {
        auto toPathElement = []<class ArgT>(ArgT arg) {
            if constexpr (std::is_convertible_v<ArgT, std::string_view>) {
                return PathElement{std::string_view(arg)};
            } else if constexpr (std::is_integral_v<ArgT>){
                return PathElement{static_cast<std::size_t>(arg)};
            } else {
                static_assert(!sizeof(arg), "Use integer or str-compatible segments in Path construction");
            }
        };
        storage.reserve(sizeof...(args));
        (storage.push_back(toPathElement(args)), ...);
    }

    void push_field(std::string_view key) { storage.emplace_back(key); }
    void push_index(std::size_t index) { storage.emplace_back(index); }
    void pop() { storage.pop_back(); }

    // Prepends `prefix` (used when a nested result is absorbed under the current location).
    void prepend(const Path & prefix) {
        storage.insert(storage.begin(), prefix.storage.begin(), prefix.storage.end());
    }

    std::size_t size() const { return storage.size(); }
    bool empty() const { return storage.empty(); }
    const PathElement & operator[](std::size_t i) const { return storage[i]; }
    const_iterator begin() const { return storage.begin(); }
    const_iterator end() const { return storage.end(); }

    friend bool operator==(const Path & a, const Path & b) {
        return a.storage == b.storage;
    }
};

} // namespace path
} // namespace ShapeFusion
