// ShapeFusion object construction example
// Demonstrates:
//  - Building plain structs straight from a transcoded mapping
//  - Nesting constructed objects
//  - Initializing a type through a member function
// Compile: g++ -std=c++23 -I../include construct_objects.cpp -o construct_objects

#include <ShapeFusion/shapefusion.hpp>
#include <iostream>
#include <string>
#include <vector>

using namespace ShapeFusion;

struct Motor {
    int id = 0;
    std::string name;
    std::vector<double> position;
};

struct Rig {
    std::string label;
    std::vector<Motor> motors;
};

class Window {
public:
    void init(const Object& fields) {
        width = fields.find("w")->as_int();
        height = fields.find("h")->as_int();
        area = width * height;
    }

    std::int64_t width = 0;
    std::int64_t height = 0;
    std::int64_t area = 0;
};

int main() {
    const Construct<Motor> motor(Map{
        {Required("motor_id", "id"), Integer()},
        {Required("name"), String()},
        {Optional("pos", "position"), List(Float())},
    });

    const Schema rig(Construct<Rig>(Map{
        {Required("label"), String()},
        {Required("motors"), List(motor)},
    }));

    const Value input = Object{
        {"label", "bench"},
        {"motors", Array{
            Object{{"motor_id", 1}, {"name", "left"}, {"pos", Array{1, "2.5", 3}}},
            Object{{"motor_id", "2"}, {"name", "right"}},
        }},
    };

    Result result = rig(input);
    if (!result) {
        std::cout << ResultToString(result) << std::endl;
        return 1;
    }
    const Rig& r = result.value().as<Rig>();
    std::cout << "Rig '" << r.label << "' with " << r.motors.size() << " motors" << std::endl;
    for (const Motor& m : r.motors) {
        std::cout << "  #" << m.id << " " << m.name << " (" << m.position.size() << " coords)" << std::endl;
    }

    const Schema window(Construct<Window>(Map{
        {Required("w"), Integer()},
        {Required("h"), Integer()},
    }, &Window::init));

    Result w = window(Object{{"w", "640"}, {"h", 480}});
    if (w) {
        std::cout << "Window area: " << w.value().as<Window>().area << std::endl;
    }

    return 0;
}
