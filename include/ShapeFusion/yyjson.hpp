#pragma once
#include <yyjson.h>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <memory>
#include <new>
#include <string>
#include <string_view>

#include "load_result.hpp"
#include "value.hpp"

namespace ShapeFusion {

namespace json {

namespace yyjson_detail {

struct DocDeleter {
    void operator()(yyjson_doc * doc) const noexcept { yyjson_doc_free(doc); }
};
struct MutDocDeleter {
    void operator()(yyjson_mut_doc * doc) const noexcept { yyjson_mut_doc_free(doc); }
};

class ValueBuilder {
    LoadError err_ = LoadError::NO_ERROR;
    std::string message_;

    bool setError(LoadError e, std::string message) {
        err_ = e;
        message_ = std::move(message);
        return false;
    }

public:
    LoadError getError() const noexcept { return err_; }
    const std::string & message() const noexcept { return message_; }

    bool read(yyjson_val * node, Value & out) {
        switch(yyjson_get_type(node)) {
        case YYJSON_TYPE_NULL:
            out = nullptr;
            return true;
        case YYJSON_TYPE_BOOL:
            out = yyjson_get_bool(node);
            return true;
        case YYJSON_TYPE_NUM:
            return readNumber(node, out);
        case YYJSON_TYPE_STR:
            out = std::string(yyjson_get_str(node), yyjson_get_len(node));
            return true;
        case YYJSON_TYPE_ARR:
            return readArray(node, out);
        case YYJSON_TYPE_OBJ:
            return readObject(node, out);
        default:
            return setError(LoadError::ILLFORMED_DOCUMENT, "unexpected JSON value type");
        }
    }

private:
    bool readNumber(yyjson_val * node, Value & out) {
        if(yyjson_is_sint(node)) {
            out = static_cast<std::int64_t>(yyjson_get_sint(node));
        } else if(yyjson_is_uint(node)) {
            std::uint64_t v = yyjson_get_uint(node);
            if(v > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                return setError(LoadError::NUMERIC_VALUE_IS_OUT_OF_STORAGE_TYPE_RANGE,
                                "integer " + std::to_string(v) + " does not fit a signed 64-bit value");
            }
            out = static_cast<std::int64_t>(v);
        } else {
            out = yyjson_get_real(node);
        }
        return true;
    }

    bool readArray(yyjson_val * node, Value & out) {
        Array items;
        items.reserve(yyjson_arr_size(node));
        yyjson_arr_iter it;
        yyjson_arr_iter_init(node, &it);
        while(yyjson_val * item = yyjson_arr_iter_next(&it)) {
            Value v;
            if(!read(item, v)) return false;
            items.push_back(std::move(v));
        }
        out = std::move(items);
        return true;
    }

    bool readObject(yyjson_val * node, Value & out) {
        Object fields;
        yyjson_obj_iter it;
        yyjson_obj_iter_init(node, &it);
        while(yyjson_val * key = yyjson_obj_iter_next(&it)) {
            std::string k(yyjson_get_str(key), yyjson_get_len(key));
            if(fields.contains(k)) {
                return setError(LoadError::DUPLICATE_KEY, "duplicate key '" + k + "'");
            }
            Value v;
            if(!read(yyjson_obj_iter_get_val(key), v)) return false;
            fields.insert_or_assign(std::move(k), std::move(v));
        }
        out = std::move(fields);
        return true;
    }
};

class ValueWriter {
    yyjson_mut_doc * doc_;

public:
    explicit ValueWriter(yyjson_mut_doc * doc) : doc_(doc) {}

    yyjson_mut_val * write(const Value & v) {
        switch(v.kind()) {
        case ValueKind::Null:
            return yyjson_mut_null(doc_);
        case ValueKind::Bool:
            return yyjson_mut_bool(doc_, v.as_bool());
        case ValueKind::Int:
            return yyjson_mut_sint(doc_, v.as_int());
        case ValueKind::Float:
            return yyjson_mut_real(doc_, v.as_float());
        case ValueKind::Decimal: {
            std::string text = v.as_decimal().toString();
            return yyjson_mut_rawncpy(doc_, text.data(), text.size());
        }
        case ValueKind::Complex: {
            std::string text = Repr(v, std::numeric_limits<std::size_t>::max());
            return yyjson_mut_strncpy(doc_, text.data(), text.size());
        }
        case ValueKind::String:
            return yyjson_mut_strncpy(doc_, v.as_string().data(), v.as_string().size());
        case ValueKind::Array: {
            yyjson_mut_val * arr = yyjson_mut_arr(doc_);
            for(const Value & item : v.as_array()) {
                yyjson_mut_arr_add_val(arr, write(item));
            }
            return arr;
        }
        case ValueKind::Object: {
            yyjson_mut_val * obj = yyjson_mut_obj(doc_);
            for(const Object::Entry & e : v.as_object()) {
                yyjson_mut_val * key = yyjson_mut_strncpy(doc_, e.key.data(), e.key.size());
                yyjson_mut_obj_add(obj, key, write(e.value));
            }
            return obj;
        }
        case ValueKind::Opaque:
            break;
        }
        return yyjson_mut_null(doc_);
    }
};

} // namespace yyjson_detail


// Parses a JSON document. Object keys keep document order.
inline LoadResult Load(std::string_view text) {
    yyjson_read_err err;
    std::unique_ptr<yyjson_doc, yyjson_detail::DocDeleter> doc(
        yyjson_read_opts(const_cast<char *>(text.data()), text.size(), YYJSON_READ_NOFLAG, nullptr, &err));
    if(!doc) {
        return LoadResult(LoadError::ILLFORMED_DOCUMENT,
                          std::string(err.msg) + " at offset " + std::to_string(err.pos));
    }
    yyjson_detail::ValueBuilder builder;
    Value out;
    if(!builder.read(yyjson_doc_get_root(doc.get()), out)) {
        return LoadResult(builder.getError(), builder.message());
    }
    return LoadResult(std::move(out));
}

// Serializes a Value as compact JSON. Decimals are written as numbers,
// complex numbers as strings, opaque values as null.
inline std::string Dump(const Value & v) {
    std::unique_ptr<yyjson_mut_doc, yyjson_detail::MutDocDeleter> doc(yyjson_mut_doc_new(nullptr));
    if(!doc) {
        throw std::bad_alloc();
    }
    yyjson_detail::ValueWriter writer(doc.get());
    yyjson_mut_doc_set_root(doc.get(), writer.write(v));

    std::size_t len = 0;
    char * json = yyjson_mut_write(doc.get(), YYJSON_WRITE_ALLOW_INF_AND_NAN, &len);
    if(json == nullptr) {
        throw std::bad_alloc();
    }
    std::string out(json, len);
    std::free(json);
    return out;
}

} // namespace json

} // namespace ShapeFusion
