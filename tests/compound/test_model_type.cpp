#include "../test_helpers.hpp"

using namespace ModelFusion;
using namespace TestHelpers;

struct LocationFields {
    Field country_code = StringType({.required = true});
    Field city         = StringType({.default_value = "Unknown"});
};

struct PlayerFields {
    Field id = IntType();
};

// ============================================================================
// Test: ModelType - Mappings
// ============================================================================

// Test: a mapping becomes a validated nested instance
bool test_model_type_from_mapping() {
    auto Location = Declare<LocationFields>("Location");
    auto r = Field(ModelType(Location))->convertAndValidate(Value::Object{{"country_code", "US"}});
    if (!r || !r->isModel()) return false;
    const Model& nested = r->asModel();
    return &nested.definition() == Location.get()
        && nested["country_code"] == Value("US")
        && nested["city"] == Value("Unknown")
        && !nested.hasErrors();
}

// Test: nested failures are flattened under the inner field name
bool test_model_type_nested_errors() {
    auto Location = Declare<LocationFields>("Location");
    Field f = ModelType(Location);
    auto r = f->convertAndValidate(Value::Object{{"city", 5}, {"country_code", nullptr}});
    return !r && r.error().code == ErrorCode::structure_mismatch
        && r.error().messages == ErrorMessages{"country_code: This field is required."};
}

// Test: undeclared keys in the mapping are ignored
bool test_model_type_ignores_unknown_keys() {
    auto Location = Declare<LocationFields>("Location");
    auto r = Field(ModelType(Location))->convert(Value::Object{{"country_code", "US"}, {"planet", "Earth"}});
    return r && !r->asModel().contains("planet");
}

// ============================================================================
// Test: ModelType - Other Shapes
// ============================================================================

// Test: non-mapping input is a structural failure naming the model
bool test_model_type_rejects_list() {
    auto Location = Declare<LocationFields>("Location");
    Field f = ModelType(Location);
    return ConvertFailsWithMessage(f, Value::Array{}, ErrorCode::structure_mismatch,
                                   "Please use a mapping for this field or Location instance instead of list.")
        && ConvertFailsWithMessage(f, "US", ErrorCode::structure_mismatch,
                                   "Please use a mapping for this field or Location instance instead of str.");
}

// Test: an instance of the wrapped definition is accepted as-is
bool test_model_type_accepts_instance() {
    auto Location = Declare<LocationFields>("Location");
    auto loc = Model::create(Location, {{"country_code", "US"}});
    if (!loc) return false;
    Value v(*loc);
    auto r = Field(ModelType(Location))->convert(v);
    return r && r->modelPtr() == v.modelPtr();
}

// Test: an instance of another definition is rejected
bool test_model_type_rejects_foreign_instance() {
    auto Location = Declare<LocationFields>("Location");
    auto Player   = Declare<PlayerFields>("Player");
    Value v = Model(Player);
    return ConvertFailsWithMessage(ModelType(Location), v, ErrorCode::structure_mismatch,
                                   "Please use a mapping for this field or Location instance instead of model.");
}

// Test: nested instances compare by their data
bool test_model_type_equality() {
    auto Location = Declare<LocationFields>("Location");
    Field f = ModelType(Location);
    auto a = f->convert(Value::Object{{"country_code", "US"}});
    auto b = f->convert(Value::Object{{"country_code", "US"}, {"city", "Unknown"}});
    auto c = f->convert(Value::Object{{"country_code", "FI"}});
    return a && b && c && *a == *b && !(*a == *c);
}

int main() {
    Runner r("compound/model");
    r.check(test_model_type_from_mapping(), "a mapping becomes a validated nested instance");
    r.check(test_model_type_nested_errors(), "nested failures are flattened under the inner field name");
    r.check(test_model_type_ignores_unknown_keys(), "undeclared keys in the mapping are ignored");
    r.check(test_model_type_rejects_list(), "non-mapping input is a structural failure naming the model");
    r.check(test_model_type_accepts_instance(), "an instance of the wrapped definition is accepted as-is");
    r.check(test_model_type_rejects_foreign_instance(), "an instance of another definition is rejected");
    r.check(test_model_type_equality(), "nested instances compare by their data");
    return r.finish();
}
