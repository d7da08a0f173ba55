#pragma once

// Core engine. The JSON and YAML bridges are separate headers
// (json.hpp, yaml.hpp) so that their backends stay optional.

#include "errors.hpp"
#include "result.hpp"
#include "error_formatting.hpp"
#include "datetime.hpp"
#include "value.hpp"
#include "field_types.hpp"
#include "roles.hpp"
#include "model_options.hpp"
#include "introspection.hpp"
#include "model_definition.hpp"
#include "model.hpp"
#include "compound.hpp"
#include "serializer.hpp"
#include "logging.hpp"
