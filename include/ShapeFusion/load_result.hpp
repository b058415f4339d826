#pragma once

#include <string>
#include <string_view>
#include <utility>

#include "value.hpp"

namespace ShapeFusion {

enum class LoadError {
    NO_ERROR,
    ILLFORMED_DOCUMENT,
    UNSUPPORTED_FEATURE,
    DUPLICATE_KEY,
    NUMERIC_VALUE_IS_OUT_OF_STORAGE_TYPE_RANGE
};

constexpr std::string_view error_to_string(LoadError e) {
    switch(e) {
    case LoadError::NO_ERROR: return "NO_ERROR"; break;
    case LoadError::ILLFORMED_DOCUMENT: return "ILLFORMED_DOCUMENT"; break;
    case LoadError::UNSUPPORTED_FEATURE: return "UNSUPPORTED_FEATURE"; break;
    case LoadError::DUPLICATE_KEY: return "DUPLICATE_KEY"; break;
    case LoadError::NUMERIC_VALUE_IS_OUT_OF_STORAGE_TYPE_RANGE: return "NUMERIC_VALUE_IS_OUT_OF_STORAGE_TYPE_RANGE"; break;
    }
    return "N/A";
}

// Outcome of turning a text document into a Value.
class LoadResult {
    Value m_value;
    LoadError m_error = LoadError::NO_ERROR;
    std::string m_message;

public:
    LoadResult(Value value) : m_value(std::move(value)) {}
    LoadResult(LoadError error, std::string message)
        : m_error(error)
        , m_message(std::move(message))
    {}

    operator bool() const {
        return m_error == LoadError::NO_ERROR;
    }

    LoadError error() const { return m_error; }
    const std::string & message() const { return m_message; }

    const Value & value() const & { return m_value; }
    Value take() && { return std::move(m_value); }
};

} // namespace ShapeFusion
