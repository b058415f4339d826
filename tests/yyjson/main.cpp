#include "../test_helpers.hpp"

#include <ShapeFusion/yyjson.hpp>

using namespace ShapeFusion;
using namespace TestHelpers;

int main() {
    std::cout << "=== yyjson Loader Tests ===\n\n";

    // Test 1: Value kinds
    {
        std::cout << "Test 1: Load scalars and containers... ";
        LoadResult r = json::Load(R"({"s": "x", "i": -3, "f": 2.5, "b": true, "n": null, "a": [1, "two"]})");
        assert(r);
        const Object & o = r.value().as_object();
        assert(o.find("s")->is_string());
        assert(o.find("i")->is_int() && o.find("i")->as_int() == -3);
        assert(o.find("f")->is_float() && o.find("f")->as_float() == 2.5);
        assert(o.find("b")->is_bool() && o.find("b")->as_bool());
        assert(o.find("n")->is_null());
        assert((*o.find("a") == Value(Array{1, "two"})));
        std::cout << "PASSED\n";
    }

    // Test 2: Object keys keep document order
    {
        std::cout << "Test 2: Key order... ";
        LoadResult r = json::Load(R"({"z": 1, "a": 2, "m": 3})");
        assert(r);
        const Object & o = r.value().as_object();
        assert(o.at(0).key == "z");
        assert(o.at(1).key == "a");
        assert(o.at(2).key == "m");
        std::cout << "PASSED\n";
    }

    // Test 3: Rejected documents
    {
        std::cout << "Test 3: Malformed and ambiguous input... ";
        LoadResult broken = json::Load(R"({"a": )");
        assert(!broken);
        assert(broken.error() == LoadError::ILLFORMED_DOCUMENT);
        assert(!broken.message().empty());

        LoadResult dup = json::Load(R"({"a": 1, "a": 2})");
        assert(!dup);
        assert(dup.error() == LoadError::DUPLICATE_KEY);

        LoadResult huge = json::Load("18446744073709551615");
        assert(!huge);
        assert(huge.error() == LoadError::NUMERIC_VALUE_IS_OUT_OF_STORAGE_TYPE_RANGE);
        std::cout << "PASSED\n";
    }

    // Test 4: Serialization
    {
        std::cout << "Test 4: Dump... ";
        const Value v = Object{
            {"id", 7},
            {"price", *Decimal::FromString("19.90")},
            {"tags", Array{"a", nullptr, false}},
        };
        assert(json::Dump(v) == R"({"id":7,"price":19.90,"tags":["a",null,false]})");
        std::cout << "PASSED\n";
    }

    // Test 5: Load, transcode, dump
    {
        std::cout << "Test 5: Transcoding a JSON document... ";
        const Schema schema(RawSchema{
            {Required("userId", "user_id"), Integer()},
            {Required("amount"), ParseDecimal()},
            {Optional("notify"), Boolean()},
        });
        LoadResult doc = json::Load(R"({"userId": "42", "amount": "10.50", "notify": "yes"})");
        assert(doc);
        Result r = schema(doc.value());
        assert(r);
        assert(json::Dump(r.value()) == R"({"user_id":42,"amount":10.50,"notify":true})");

        LoadResult bad = json::Load(R"({"userId": "x", "amount": 1.5})");
        assert(bad);
        Result failed = schema(bad.value());
        assert(!failed);
        assert(failed.errors().size() == 2);
        assert(HasError(failed, ErrorKind::CONVERSION, path::Path("userId")));
        assert(HasError(failed, ErrorKind::TYPE_MISMATCH, path::Path("amount")));
        std::cout << "PASSED\n";
    }

    std::cout << "\nAll yyjson loader tests passed.\n";
    return 0;
}
