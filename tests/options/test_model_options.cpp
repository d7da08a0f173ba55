#include "../test_helpers.hpp"

using namespace ModelFusion;
using namespace TestHelpers;

struct FooFields {
    Field name = StringType();

    static ModelOptions::Entries options() {
        return {{"namespace", "foo"}, {"roles", Roles{}}};
    }
};

struct DocumentOptionsFields {
    Field name     = StringType();
    Field password = StringType();

    static Value options() {
        return Value::Object{
            {"namespace", "accounts"},
            {"roles", Value::Object{
                {"public", Value::Object{{"whitelist", Value::Array{"name"}}}},
                {"owner", "wholelist"},
            }},
        };
    }
};

struct BadOptionsFields {
    Field name = StringType();

    static ModelOptions::Entries options() {
        return {{"badkw", nullptr}};
    }
};

// ============================================================================
// Test: ModelOptions::make
// ============================================================================

// Test: klass and roles set to none are accepted
bool test_good_options_args() {
    auto mo = ModelOptions::make(nullptr, {{"klass", nullptr}, {"roles", nullptr}});
    return mo && mo->klass() == nullptr && !mo->roles() && !mo->namespaceName();
}

// Test: unknown option key is an invalid configuration
bool test_bad_options_args() {
    auto mo = ModelOptions::make(nullptr, {{"klass", nullptr}, {"roles", nullptr}, {"badkw", nullptr}});
    return !mo && mo.error().code == ErrorCode::invalid_configuration
        && mo.error().message == "Unknown model option 'badkw'";
}

// Test: no entries gives the defaults
bool test_no_options_args() {
    auto mo = ModelOptions::make(nullptr, {});
    return mo && !mo->roles() && !mo->namespaceName() && mo->klass() == nullptr;
}

// Test: a value of the wrong kind for a known key is rejected
bool test_wrong_kind_options() {
    auto a = ModelOptions::make(nullptr, {{"namespace", Roles{}}});
    auto b = ModelOptions::make(nullptr, {{"roles", "public"}});
    return !a && a.error().code == ErrorCode::invalid_configuration
        && !b && b.error().code == ErrorCode::invalid_configuration;
}

// Test: empty role mapping is distinct from no roles
bool test_empty_roles_distinct_from_none() {
    auto empty = ModelOptions::make(nullptr, {{"roles", Roles{}}});
    auto none  = ModelOptions::make(nullptr, {{"roles", nullptr}});
    return empty && empty->roles() && empty->roles()->empty()
        && none && !none->roles();
}

// ============================================================================
// Test: Options Declared on a Model
// ============================================================================

// Test: options block is parsed from the declaration and klass points at the definition
bool test_options_parsing_from_model() {
    auto Foo = Declare<FooFields>("Foo");
    Model f(Foo);
    const ModelOptions& fo = f.options();
    return fo.namespaceName() == "foo"
        && fo.roles() && fo.roles()->empty()
        && fo.klass() == Foo.get();
}

// Test: definitions without an options block default roles and namespace to none
bool test_options_default_on_model() {
    auto def = Build(ModelDefinition::Builder("Plain").field("name", StringType()));
    return !def->options().roles() && !def->options().namespaceName()
        && def->options().klass() == def.get();
}

// Test: invalid options make the declaration fail
bool test_bad_options_on_model() {
    auto def = declare<BadOptionsFields>("Bad");
    return !def && def.error().code == ErrorCode::invalid_configuration;
}

// ============================================================================
// Test: ModelOptions::fromValue
// ============================================================================

// Test: options load from a data document
bool test_options_from_document() {
    auto def = Declare<DocumentOptionsFields>("Account");
    const auto& opts = def->options();
    const RoleFilter* pub   = opts.findRole("public");
    const RoleFilter* owner = opts.findRole("owner");
    return opts.namespaceName() == "accounts"
        && pub && pub->kind == RoleFilter::Kind::whitelist && pub->names == std::vector<std::string>{"name"}
        && owner && owner->kind == RoleFilter::Kind::wholelist
        && !opts.findRole("admin");
}

// Test: malformed documents are rejected
bool test_options_document_errors() {
    auto notMapping = ModelOptions::fromValue(nullptr, Value::Array{});
    auto unknown    = ModelOptions::fromValue(nullptr, Value::Object{{"ordering", "name"}});
    auto badRole    = ModelOptions::fromValue(nullptr, Value::Object{
        {"roles", Value::Object{{"public", Value::Object{{"greylist", Value::Array{}}}}}}});
    auto badNames   = ModelOptions::fromValue(nullptr, Value::Object{
        {"roles", Value::Object{{"public", Value::Object{{"whitelist", Value::Array{1}}}}}}});
    auto badNs      = ModelOptions::fromValue(nullptr, Value::Object{{"namespace", 5}});
    return !notMapping && notMapping.error().code == ErrorCode::invalid_configuration
        && !unknown && unknown.error().code == ErrorCode::invalid_configuration
        && !badRole && badRole.error().code == ErrorCode::invalid_configuration
        && !badNames && badNames.error().code == ErrorCode::invalid_configuration
        && !badNs && badNs.error().code == ErrorCode::invalid_configuration;
}

// Test: null document gives the defaults
bool test_options_null_document() {
    auto mo = ModelOptions::fromValue(nullptr, Value());
    return mo && !mo->roles() && !mo->namespaceName();
}

int main() {
    Runner r("options/model_options");
    r.check(test_good_options_args(), "klass and roles set to none are accepted");
    r.check(test_bad_options_args(), "unknown option key is an invalid configuration");
    r.check(test_no_options_args(), "no entries gives the defaults");
    r.check(test_wrong_kind_options(), "a value of the wrong kind for a known key is rejected");
    r.check(test_empty_roles_distinct_from_none(), "empty role mapping is distinct from no roles");
    r.check(test_options_parsing_from_model(), "options block is parsed from the declaration");
    r.check(test_options_default_on_model(), "definitions without options default roles and namespace to none");
    r.check(test_bad_options_on_model(), "invalid options make the declaration fail");
    r.check(test_options_from_document(), "options load from a data document");
    r.check(test_options_document_errors(), "malformed documents are rejected");
    r.check(test_options_null_document(), "null document gives the defaults");
    return r.finish();
}
