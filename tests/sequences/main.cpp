#include "../test_helpers.hpp"

using namespace ShapeFusion;
using namespace TestHelpers;

int main() {
    std::cout << "=== Sequence, Enum and Literal Tests ===\n\n";

    // Test 1: Homogeneous list
    {
        std::cout << "Test 1: List converts every element... ";
        const Schema schema{List(Integer())};
        assert(TranscodesTo(schema, Array{1, "2", 3.0}, Array{1, 2, 3}));
        assert(TranscodesTo(schema, Array{}, Array{}));
        std::cout << "PASSED\n";
    }

    // Test 2: List errors carry the element index and do not stop the walk
    {
        std::cout << "Test 2: List error aggregation... ";
        const Schema schema{List(Integer())};
        Result r = schema(Array{"x", 2, "y"});
        assert(!r);
        assert(r.errors().size() == 2);
        assert(r.errors()[0].path == path::Path(0));
        assert(r.errors()[1].path == path::Path(2));
        assert(FailsWith(schema, Object{{"a", 1}}, ErrorKind::NOT_A_SEQUENCE));
        std::cout << "PASSED\n";
    }

    // Test 3: Fixed sequences are positional
    {
        std::cout << "Test 3: Fixed sequence... ";
        const Schema tuple(Tuple{Integer(), String(), Boolean()});
        assert(TranscodesTo(tuple, Array{"1", 2, "yes"}, Array{1, "2", true}));

        const Schema fixed(FixedList{Float(), Float()});
        assert(TranscodesTo(fixed, Array{1, "2.5"}, Array{1.0, 2.5}));

        const Schema vec(RawSchema(std::vector<RawSchema>{Integer(), Integer()}));
        assert(TranscodesTo(vec, Array{"4", 5}, Array{4, 5}));
        std::cout << "PASSED\n";
    }

    // Test 4: Length check replaces element checks
    {
        std::cout << "Test 4: Length mismatch comes first... ";
        const Schema schema(Tuple{Integer(), Integer()});
        Result r = schema(Array{"bad"});
        assert(!r);
        assert(r.errors().size() == 1);
        assert(r.error() == ErrorKind::SEQUENCE_LENGTH_MISMATCH);
        assert(FailsWith(schema, Array{1, 2, 3}, ErrorKind::SEQUENCE_LENGTH_MISMATCH));
        assert(FailsAt(schema, Array{1, "z"}, ErrorKind::CONVERSION, path::Path(1)));
        std::cout << "PASSED\n";
    }

    // Test 5: Path composition through mappings and sequences
    {
        std::cout << "Test 5: Path composition... ";
        const Schema schema(RawSchema{
            {Required("items"), List({
                {Required("sku"), String()},
                {Required("qty"), Integer()},
            })},
        });
        const Value order = Object{{"items", Array{
            Object{{"sku", "a"}, {"qty", 1}},
            Object{{"sku", "b"}, {"qty", "2"}},
            Object{{"sku", "c"}, {"qty", "many"}},
        }}};
        assert(FailsAt(schema, order, ErrorKind::CONVERSION, path::Path("items", 2, "qty")));
        std::cout << "PASSED\n";
    }

    // Test 6: Enum picks the first matching literal
    {
        std::cout << "Test 6: Enum... ";
        const Schema schema(Enum{Literal(Integer(), 6), Literal(String(), "VI")});
        assert(TranscodesTo(schema, "6", 6));
        assert(TranscodesTo(schema, "VI", "VI"));
        Result r = schema("V");
        assert(!r);
        assert(r.errors().size() == 1);
        assert(r.error() == ErrorKind::ENUM_NO_MATCH);
        std::cout << "PASSED\n";
    }

    // Test 7: Alternatives are tried in declaration order
    {
        std::cout << "Test 7: Enum declaration order... ";
        const Schema textFirst(Enum{Literal(String(), "1"), Literal(Integer(), 1)});
        assert(TranscodesTo(textFirst, 1, "1"));
        const Schema numberFirst(Enum{Literal(Integer(), 1), Literal(String(), "1")});
        assert(TranscodesTo(numberFirst, 1, 1));
        std::cout << "PASSED\n";
    }

    // Test 8: Set literals
    {
        std::cout << "Test 8: Set literal... ";
        const Schema schema(Set{"user", "admin", "user"});
        const auto * e = schema.root().get_if<nodes::EnumNode>();
        assert(e != nullptr);
        assert(e->alternatives.size() == 2);
        assert(TranscodesTo(schema, "admin", "admin"));
        assert(FailsWith(schema, "root", ErrorKind::ENUM_NO_MATCH));

        const Schema numbers(Set{1, 2, 3});
        assert(TranscodesTo(numbers, "2", 2));
        assert(FailsWith(numbers, 4, ErrorKind::ENUM_NO_MATCH));
        std::cout << "PASSED\n";
    }

    // Test 9: Scalars used directly are literals of their own kind
    {
        std::cout << "Test 9: Scalar literals... ";
        const Schema schema(RawSchema{
            {Required("version"), 5},
            {Required("kind"), "point"},
            {Optional("flag"), true},
        });
        assert(TranscodesTo(schema,
                            Object{{"version", "5"}, {"kind", "point"}, {"flag", "yes"}},
                            Object{{"version", 5}, {"kind", "point"}, {"flag", true}}));
        assert(FailsAt(schema, Object{{"version", 6}, {"kind", "point"}},
                       ErrorKind::LITERAL_MISMATCH, path::Path("version")));
        assert(FailsAt(schema, Object{{"version", "five"}, {"kind", "point"}},
                       ErrorKind::CONVERSION, path::Path("version")));
        std::cout << "PASSED\n";
    }

    // Test 10: Explicit literal with its own converter
    {
        std::cout << "Test 10: Explicit literal... ";
        const Schema schema(Literal(Float(), 2.5));
        assert(TranscodesTo(schema, "2.5", 2.5));
        Result r = schema("3");
        assert(!r);
        assert(r.error() == ErrorKind::LITERAL_MISMATCH);
        assert(r.errors()[0].message.find("2.5") != std::string::npos);
        std::cout << "PASSED\n";
    }

    // Test 11: Unvalidated containers
    {
        std::cout << "Test 11: Unvalidated map and list... ";
        const Schema schema(RawSchema{
            {Required("meta"), UnvalidatedMap{}},
            {Optional("raw"), UnvalidatedList{}},
        });
        const Value input = Object{
            {"meta", Object{{"anything", Array{1, "two"}}}},
            {"raw", Array{Object{}, nullptr}},
        };
        assert(TranscodesTo(schema, input, input));
        assert(FailsAt(schema, Object{{"meta", Array{}}}, ErrorKind::NOT_A_MAPPING, path::Path("meta")));
        assert(FailsAt(schema, Object{{"meta", Object{}}, {"raw", "x"}}, ErrorKind::NOT_A_SEQUENCE, path::Path("raw")));
        std::cout << "PASSED\n";
    }

    std::cout << "\nAll sequence, enum and literal tests passed.\n";
    return 0;
}
