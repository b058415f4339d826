// ShapeFusion YAML configuration example
// Demonstrates:
//  - Loading a YAML document with rapidyaml
//  - Enum and set literals
//  - Dropping unknown keys in one mapping while the rest stays strict
// Compile: g++ -std=c++23 -I../include yaml_config.cpp -o yaml_config

#define RYML_SINGLE_HDR_DEFINE_NOW
#include <ShapeFusion/yaml.hpp>
#include <ShapeFusion/shapefusion.hpp>
#include <iostream>

using namespace ShapeFusion;

int main() {
    const Schema config(RawSchema{
        {Required("service"), String()},
        {Required("level"), Set{"debug", "info", "warn", "error"}},
        {Required("timeout"), Enum{Literal(Integer(), 0), Literal(String(), "never")}},
        {Optional("labels"), Map(Fields{
            {Required("team"), String()},
        }, ExtrasPolicy::Remove)},
        {Optional("started"), ParseDateTime()},
    });

    const char* text = R"(
service: billing
level: info
timeout: "0"
labels:
  team: payments
  owner: someone
started: "2015-12-13 15:36.21"
)";

    LoadResult doc = yaml::Load(text);
    if (!doc) {
        std::cout << "Load error: " << error_to_string(doc.error()) << ": " << doc.message() << std::endl;
        return 1;
    }

    Result result = config(doc.value());
    if (!result) {
        std::cout << ResultToString(result) << std::endl;
        return 1;
    }

    const Object& cfg = result.value().as_object();
    std::cout << "Service: " << cfg.find("service")->as_string() << std::endl;
    std::cout << "Labels: " << Repr(*cfg.find("labels")) << std::endl;
    std::cout << "Started: " << cfg.find("started")->as<DateTime>().toString() << std::endl;

    return 0;
}
