#include "../test_helpers.hpp"

using namespace ShapeFusion;
using namespace TestHelpers;

int main() {
    std::cout << "=== Mapping Tests ===\n\n";

    // Test 1: Required and optional fields
    {
        std::cout << "Test 1: Required and optional fields... ";
        const Schema schema(RawSchema{
            {Required("name"), String()},
            {Optional("age"), Integer()},
        });
        assert(TranscodesTo(schema,
                            Object{{"name", "Ann"}, {"age", "42"}},
                            Object{{"name", "Ann"}, {"age", 42}}));
        assert(TranscodesTo(schema, Object{{"name", "Ann"}}, Object{{"name", "Ann"}}));
        std::cout << "PASSED\n";
    }

    // Test 2: Renaming writes under the target key
    {
        std::cout << "Test 2: Renaming... ";
        const Schema schema(RawSchema{
            {Required("someString1", "some_string_1"), String()},
        });
        Result r = schema(Object{{"someString1", "s1"}});
        assert(r);
        assert(r.value() == Value(Object{{"some_string_1", "s1"}}));
        assert(!r.value().as_object().contains("someString1"));
        std::cout << "PASSED\n";
    }

    // Test 3: Every missing required field is reported
    {
        std::cout << "Test 3: Missing required fields are all reported... ";
        const Schema schema(RawSchema{
            {Required("a"), Integer()},
            {Required("b"), Integer()},
            {Optional("c"), Integer()},
            {Required("d"), Integer()},
        });
        Result r = schema(Object{});
        assert(!r);
        assert(r.errors().size() == 3);
        assert(CountErrors(r, ErrorKind::REQUIRED_FIELD_MISSING) == 3);
        assert(r.errors()[0].path == path::Path("a"));
        assert(r.errors()[1].path == path::Path("b"));
        assert(r.errors()[2].path == path::Path("d"));
        std::cout << "PASSED\n";
    }

    // Test 4: Extra keys are rejected by default
    {
        std::cout << "Test 4: Extras policy Prevent... ";
        const Schema schema(RawSchema{
            {Required("a"), Integer()},
        });
        assert(FailsAt(schema, Object{{"a", 1}, {"x", 5}}, ErrorKind::UNKNOWN_FIELD, path::Path("x")));
        std::cout << "PASSED\n";
    }

    // Test 5: Allow keeps extras verbatim
    {
        std::cout << "Test 5: Extras policy Allow... ";
        const Schema schema(RawSchema{
            {Required("a"), Integer()},
        }, CompileOptions{ExtrasPolicy::Allow});
        assert(TranscodesTo(schema,
                            Object{{"a", "1"}, {"x", 5}},
                            Object{{"a", 1}, {"x", 5}}));
        std::cout << "PASSED\n";
    }

    // Test 6: Remove drops extras
    {
        std::cout << "Test 6: Extras policy Remove... ";
        const Schema schema(RawSchema{
            {Required("a"), Integer()},
        }, CompileOptions{ExtrasPolicy::Remove});
        assert(TranscodesTo(schema, Object{{"a", 1}, {"x", 5}}, Object{{"a", 1}}));
        std::cout << "PASSED\n";
    }

    // Test 7: Error order is markers first, then extras
    {
        std::cout << "Test 7: Error order... ";
        const Schema schema(RawSchema{
            {Required("a"), Integer()},
            {Required("b"), Integer()},
        });
        Result r = schema(Object{{"z", 1}, {"b", "x"}});
        assert(!r);
        assert(r.errors().size() == 3);
        assert(r.errors()[0].kind == ErrorKind::REQUIRED_FIELD_MISSING);
        assert(r.errors()[0].path == path::Path("a"));
        assert(r.errors()[1].kind == ErrorKind::CONVERSION);
        assert(r.errors()[1].path == path::Path("b"));
        assert(r.errors()[2].kind == ErrorKind::UNKNOWN_FIELD);
        assert(r.errors()[2].path == path::Path("z"));
        std::cout << "PASSED\n";
    }

    // Test 8: Non-mapping input fails with a single error
    {
        std::cout << "Test 8: Non-mapping input... ";
        const Schema schema(RawSchema{
            {Required("a"), Integer()},
        });
        Result r = schema(Array{1, 2});
        assert(!r);
        assert(r.errors().size() == 1);
        assert(r.error() == ErrorKind::NOT_A_MAPPING);
        assert(r.errorPath().empty());
        assert(FailsWith(schema, "text", ErrorKind::NOT_A_MAPPING));
        std::cout << "PASSED\n";
    }

    // Test 9: The caller's input is left untouched
    {
        std::cout << "Test 9: Input is not mutated... ";
        const Schema schema(RawSchema{
            {Required("a", "renamed"), Integer()},
        }, CompileOptions{ExtrasPolicy::Remove});
        const Value input = Object{{"a", "7"}, {"extra", true}};
        const Value copy = input;
        Result r = schema(input);
        assert(r);
        assert(input == copy);
        assert(input.as_object().size() == 2);
        std::cout << "PASSED\n";
    }

    // Test 10: Nested mappings prefix child errors with the parent key
    {
        std::cout << "Test 10: Nested mapping paths... ";
        const Schema schema(RawSchema{
            {Required("outer"), {
                {Required("inner"), Integer()},
            }},
        });
        assert(TranscodesTo(schema,
                            Object{{"outer", Object{{"inner", "3"}}}},
                            Object{{"outer", Object{{"inner", 3}}}}));
        assert(FailsAt(schema,
                       Object{{"outer", Object{{"inner", "bad"}}}},
                       ErrorKind::CONVERSION, path::Path("outer", "inner")));
        std::cout << "PASSED\n";
    }

    // Test 11: An extra key colliding with a target key under Allow
    {
        std::cout << "Test 11: Extra key collides with a renamed field... ";
        const Schema schema(RawSchema{
            {Required("a", "b"), Integer()},
        }, CompileOptions{ExtrasPolicy::Allow});
        assert(FailsAt(schema, Object{{"a", 1}, {"b", 2}}, ErrorKind::DUPLICATE_TARGET_KEY, path::Path("b")));
        std::cout << "PASSED\n";
    }

    // Test 12: Inclusive groups are not enforced unless asked for
    {
        std::cout << "Test 12: Inclusive groups... ";
        const RawSchema raw = {
            {Inclusive("lat").monitor("geo"), Float()},
            {Inclusive("lon").monitor("geo"), Float()},
            {Optional("name"), String()},
        };

        const Schema lenient(raw);
        assert(Succeeds(lenient, Object{{"lat", 1.5}}));

        const Schema strict(raw, CompileOptions{ExtrasPolicy::Prevent, true});
        assert(Succeeds(strict, Object{{"name", "nowhere"}}));
        assert(Succeeds(strict, Object{{"lat", 1.5}, {"lon", 2.5}}));
        assert(FailsAt(strict, Object{{"lat", 1.5}}, ErrorKind::INCLUSIVE_GROUP_INCOMPLETE, path::Path("lon")));
        std::cout << "PASSED\n";
    }

    // Test 13: Inclusive enforcement on a single mapping
    {
        std::cout << "Test 13: Inclusive enforcement per mapping... ";
        const Schema schema(RawSchema{
            {Required("point"), Map{
                {Inclusive("x"), Integer()},
                {Inclusive("y"), Integer()},
                {Inclusive("z"), Integer()},
            }.inclusiveGroups(true)},
        });
        Result r = schema(Object{{"point", Object{{"y", 1}}}});
        assert(!r);
        assert(r.errors().size() == 2);
        assert(HasError(r, ErrorKind::INCLUSIVE_GROUP_INCOMPLETE, path::Path("point", "x")));
        assert(HasError(r, ErrorKind::INCLUSIVE_GROUP_INCOMPLETE, path::Path("point", "z")));
        std::cout << "PASSED\n";
    }

    // Test 14: A compiled schema embedded as a leaf
    {
        std::cout << "Test 14: Embedded schema... ";
        const Schema point(RawSchema{
            {Required("x"), Integer()},
            {Required("y"), Integer()},
        });
        const Schema shape(RawSchema{
            {Required("origin"), point},
            {Required("label"), String()},
        });
        assert(TranscodesTo(shape,
                            Object{{"origin", Object{{"x", "1"}, {"y", 2}}}, {"label", "p"}},
                            Object{{"origin", Object{{"x", 1}, {"y", 2}}}, {"label", "p"}}));
        Result r = shape(Object{{"origin", Object{{"x", "?"}}}, {"label", "p"}});
        assert(!r);
        assert(HasError(r, ErrorKind::CONVERSION, path::Path("origin", "x")));
        assert(HasError(r, ErrorKind::REQUIRED_FIELD_MISSING, path::Path("origin", "y")));
        std::cout << "PASSED\n";
    }

    // Test 15: Converted output maps to itself
    {
        std::cout << "Test 15: Idempotent round trip... ";
        const Schema schema(RawSchema{
            {Required("id"), Integer()},
            {Optional("tags"), List(String())},
            {Required("ratio"), Float()},
        });
        Result first = schema(Object{{"id", "12"}, {"tags", Array{"a", 3}}, {"ratio", "0.5"}});
        assert(first);
        Result second = schema(first.value());
        assert(second);
        assert(second.value() == first.value());
        std::cout << "PASSED\n";
    }

    // Test 16: Under Allow only keys that were actually written can collide
    {
        std::cout << "Test 16: Extra key matching an unwritten target... ";
        const Schema schema(RawSchema{
            {Optional("a", "b"), Integer()},
        }, CompileOptions{ExtrasPolicy::Allow});
        assert(TranscodesTo(schema, Object{{"b", 5}}, Object{{"b", 5}}));
        assert(FailsAt(schema, Object{{"a", 1}, {"b", 5}}, ErrorKind::DUPLICATE_TARGET_KEY, path::Path("b")));

        Result failed = schema(Object{{"a", "bad"}, {"b", 5}});
        assert(!failed);
        assert(failed.errors().size() == 1);
        assert(failed.error() == ErrorKind::CONVERSION);
        assert(failed.errorPath() == path::Path("a"));
        std::cout << "PASSED\n";
    }

    std::cout << "\nAll mapping tests passed.\n";
    return 0;
}
