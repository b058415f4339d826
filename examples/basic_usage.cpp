// Basic ShapeFusion usage example
// Demonstrates:
//  - Declaring a schema with required, optional and renamed keys
//  - Transcoding a JSON document loaded with yyjson
//  - Printing collected errors
// Compile: g++ -std=c++23 -I../include basic_usage.cpp -lyyjson -o basic_usage

#include <ShapeFusion/shapefusion.hpp>
#include <ShapeFusion/yyjson.hpp>
#include <iostream>
#include <string_view>

using namespace ShapeFusion;

int main() {
    const Schema request(RawSchema{
        {Required("userId", "user_id"), Integer()},
        {Required("items"), List({
            {Required("sku"), String()},
            {Required("qty"), Integer()},
            {Optional("price"), ParseDecimal()},
        })},
        {Optional("express"), Boolean()},
    });

    const char* good = R"({
        "userId": "17",
        "items": [
            {"sku": "A-1", "qty": "2", "price": "9.90"},
            {"sku": "B-7", "qty": 1}
        ],
        "express": "yes"
    })";

    LoadResult doc = json::Load(std::string_view(good));
    if (!doc) {
        std::cout << "Load error: " << error_to_string(doc.error()) << ": " << doc.message() << std::endl;
        return 1;
    }

    Result result = request(doc.value());
    if (!result) {
        std::cout << ResultToString(result) << std::endl;
        return 1;
    }
    std::cout << "Transcoded: " << json::Dump(result.value()) << std::endl;

    const char* bad = R"({
        "items": [{"sku": "A-1", "qty": "two"}],
        "coupon": "FREE"
    })";

    Result rejected = request(json::Load(std::string_view(bad)).value());
    std::cout << "Rejected with " << rejected.errors().size() << " errors:" << std::endl;
    for (const ValidationError& e : rejected.errors()) {
        std::cout << "  " << ErrorToString(e) << std::endl;
    }

    return 0;
}
