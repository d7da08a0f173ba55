// Basic ModelFusion usage example
// Compile: g++ -std=c++23 -I../include basic_usage.cpp -o basic_usage -lspdlog -lfmt

#include <ModelFusion/modelfusion.hpp>
#include <iostream>
#include <string>

using namespace ModelFusion;

struct ServerFields {
    Field host = StringType({.required = true});
    Field port = IntType({.default_value = 8080, .min_value = 1, .max_value = 65535});
};

struct ConfigFields {
    Field app_name   = StringType({.required = true});
    Field version    = IntType();
    Field debug_mode = BooleanType({.default_value = false});
};

int main() {
    auto Server = declare<ServerFields>("Server");
    if (!Server) {
        std::cout << ErrorToString(Server.error()) << std::endl;
        return 1;
    }

    auto ConfigBase = declare<ConfigFields>("ConfigBase");
    if (!ConfigBase) {
        std::cout << ErrorToString(ConfigBase.error()) << std::endl;
        return 1;
    }

    // Inherit the config fields and add a nested server
    auto Config = ModelDefinition::Builder("Config")
        .extends(*ConfigBase)
        .field("server", ModelType(*Server))
        .build();
    if (!Config) {
        std::cout << ErrorToString(Config.error()) << std::endl;
        return 1;
    }

    auto config = Model::create(*Config, {
        {"app_name", "MyApp"},
        {"version", "1"},
        {"debug_mode", "true"},
        {"server", Value::Object{{"host", "localhost"}}},
    });
    if (!config) {
        std::cout << ErrorToString(config.error()) << std::endl;
        return 1;
    }

    const Model& server = (*config)["server"].asModel();
    std::cout << "App: " << (*config)["app_name"].asString() << std::endl;
    std::cout << "Version: " << (*config)["version"].asInt() << std::endl;
    std::cout << "Debug: " << ((*config)["debug_mode"].asBool() ? "yes" : "no") << std::endl;
    std::cout << "Server: " << server["host"].asString() << ":" << server["port"].asInt() << std::endl;

    // Assignment goes through the same conversion
    if (!config->set("version", "two")) {
        std::cout << "Rejected: " << config->errors().at("version").front() << std::endl;
    }

    return 0;
}
