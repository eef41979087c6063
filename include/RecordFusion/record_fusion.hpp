#pragma once

#include "schema.hpp"
#include "compiler.hpp"
#include "parser.hpp"
#include "interpreter.hpp"
#include "error_formatting.hpp"
#include "layout_description.hpp"
