#pragma once

#include <cassert>
#include <string>
#include <utility>
#include <vector>

#include "errors.hpp"
#include "path.hpp"
#include "value.hpp"

namespace ShapeFusion {

// Outcome of a transcoding: the converted value, or a non-empty ordered list
// of errors. Leaf converters return the same type.
class Result {
    Value m_value;
    std::vector<ValidationError> m_errors;

public:
    Result() = default;
    Result(Value value) : m_value(std::move(value)) {}
    Result(std::vector<ValidationError> errors) : m_errors(std::move(errors)) {}

    operator bool() const {
        return m_errors.empty();
    }

    const Value & value() const & {
        return m_value;
    }
    Value take() && {
        return std::move(m_value);
    }

    const std::vector<ValidationError> & errors() const {
        return m_errors;
    }

    // Kind and location of the first error; only meaningful on failure.
    ErrorKind error() const {
        assert(!m_errors.empty());
        return m_errors.front().kind;
    }
    const path::Path & errorPath() const {
        assert(!m_errors.empty());
        return m_errors.front().path;
    }
};

inline Result Ok(Value value) {
    return Result(std::move(value));
}

inline Result Fail(ErrorKind kind, std::string message) {
    std::vector<ValidationError> errors;
    errors.push_back(ValidationError{kind, std::move(message), {}});
    return Result(std::move(errors));
}

inline Result Fail(std::string message) {
    return Fail(ErrorKind::CONVERSION, std::move(message));
}

} // namespace ShapeFusion
