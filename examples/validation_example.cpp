// ModelFusion validation example with JSON input
// Demonstrates:
//  - Field constraints (range, length, choices, list size)
//  - Full and partial validation
//  - Using key to decouple C++ names from document field names
//  - Role-filtered JSON output
// Compile: g++ -std=c++23 -I../include validation_example.cpp -o validation_example -lyyjson -lspdlog -lfmt

#include <ModelFusion/modelfusion.hpp>
#include <ModelFusion/json.hpp>
#include <iostream>
#include <string>

using namespace ModelFusion;

struct MotorFields {
    // C++ name is "motor_id", but the document field is "id"
    Field motor_id   = IntType({.required = true, .key = "id", .min_value = 1, .max_value = 8});
    Field motor_name = StringType({.key = "name", .min_length = 1, .max_length = 32});
    Field mode       = StringType({.default_value = "idle", .choices = {"idle", "run", "brake"}});
    Field position   = ListType(FloatType(), {.min_size = 3, .max_size = 3});
    Field serial     = StringType();

    static ModelOptions::Entries options() {
        return {{"roles", Roles{{"public", blacklist("serial")}}}};
    }
};

static void printErrors(const Model& m) {
    std::cout << ErrorMapToString(m.errors()) << std::endl;
}

int main() {
    auto Motor = declare<MotorFields>("Motor");
    if (!Motor) {
        std::cout << ErrorToString(Motor.error()) << std::endl;
        return 1;
    }

    const char* valid_json = R"({
        "id": 1,
        "name": "Motor1",
        "position": [1.0, 2.0, 3.0],
        "serial": "SN-0001"
    })";

    auto input = json::parseObject(valid_json);
    if (!input) {
        std::cout << ErrorToString(input.error()) << std::endl;
        return 1;
    }

    Model motor(*Motor);
    if (motor.validate(*input)) {
        std::cout << "✓ Valid JSON validated successfully!" << std::endl;
        if (auto out = json::serialize(motor, "public")) {
            std::cout << "Public view: " << *out << std::endl;
        }
    }

    // Invalid JSON - ID out of range, too few coordinates, unknown mode
    const char* invalid_json = R"({
        "id": 99,
        "name": "MotorX",
        "mode": "spin",
        "position": [1.0, 2.0]
    })";

    auto bad = json::parseObject(invalid_json);
    if (bad && !motor.validate(*bad)) {
        std::cout << "✗ Invalid JSON caught:" << std::endl;
        printErrors(motor);
        std::cout << "  (existing values were kept: id=" << motor["id"].asInt() << ")" << std::endl;
    }

    // Partial update: only the supplied fields are checked
    std::cout << "\n--- Partial Validation ---" << std::endl;
    Model draft(*Motor);
    if (draft.validate({{"name", "Draft"}}, true)) {
        std::cout << "✓ Partial update accepted without the required id" << std::endl;
    }
    if (!draft.validate({{"name", "Draft"}})) {
        std::cout << "✗ Full validation still requires:" << std::endl;
        printErrors(draft);
    }

    return 0;
}
