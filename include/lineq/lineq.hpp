#pragma once

/// Convenience umbrella header for the lineq library.

#include <lineq/core/error.hpp>
#include <lineq/core/json.hpp>
#include <lineq/core/value.hpp>
#include <lineq/parser/lexer.hpp>
#include <lineq/parser/parser.hpp>
#include <lineq/runtime/builtins.hpp>
#include <lineq/runtime/evaluator.hpp>
#include <lineq/runtime/map_stage.hpp>
#include <lineq/runtime/ops.hpp>
#include <lineq/runtime/output.hpp>
#include <lineq/runtime/pipeline.hpp>
#include <lineq/runtime/reader.hpp>
