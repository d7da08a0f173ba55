// Loading a model and its options from YAML
// Compile: g++ -std=c++23 -I../include -I<rapidyaml single header dir> yaml_config.cpp -o yaml_config -lspdlog -lfmt

#define RYML_SINGLE_HDR_DEFINE_NOW
#include <ModelFusion/modelfusion.hpp>
#include <ModelFusion/yaml.hpp>
#include <iostream>

using namespace ModelFusion;

int main() {
    logging::setLevel(spdlog::level::debug);

    const char* options_yaml = R"(
namespace: services
roles:
  public:
    whitelist: [name, endpoints]
)";

    const char* service_yaml = R"(
name: billing
replicas: "3"
token: s3cr3t
endpoints:
  - /invoices
  - /payments
)";

    auto options = yaml::parse(options_yaml);
    if (!options) {
        std::cout << ErrorToString(options.error()) << std::endl;
        return 1;
    }

    auto Service = ModelDefinition::Builder("Service")
        .field("name", StringType({.required = true}))
        .field("replicas", IntType({.default_value = 1, .min_value = 1}))
        .field("token", StringType())
        .field("endpoints", ListType(StringType(), {.min_size = 1}))
        .options(*options)
        .build();
    if (!Service) {
        std::cout << ErrorToString(Service.error()) << std::endl;
        return 1;
    }

    auto input = yaml::parseObject(service_yaml);
    if (!input) {
        std::cout << ErrorToString(input.error()) << std::endl;
        return 1;
    }

    auto service = Model::create(*Service, *input);
    if (!service) {
        std::cout << ErrorToString(service.error()) << std::endl;
        return 1;
    }

    std::cout << "Replicas: " << service->at("replicas").asInt() << std::endl;

    auto pub = service->serialize("public");
    if (pub) {
        for (const auto& [name, value] : *pub) {
            std::cout << name << " (" << value.typeName() << ")" << std::endl;
        }
    }
    return 0;
}
