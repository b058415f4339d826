#pragma once

// Core library. The document loaders (yyjson.hpp, yaml.hpp) are included
// separately since each pulls in its own parser.

#include "value.hpp"
#include "converters.hpp"
#include "markers.hpp"
#include "raw_schema.hpp"
#include "construct.hpp"
#include "schema.hpp"
#include "error_formatting.hpp"
