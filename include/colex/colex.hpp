#pragma once

/// Convenience umbrella header for the colex library.

#include <colex/core/column.hpp>
#include <colex/core/error.hpp>
#include <colex/core/time.hpp>
#include <colex/core/typed_column.hpp>
#include <colex/ir/node.hpp>
#include <colex/parser/parser.hpp>
#include <colex/runtime/function_registry.hpp>
#include <colex/runtime/interpreter.hpp>
#include <colex/runtime/loop.hpp>
#include <colex/runtime/pipeline.hpp>
#include <colex/runtime/plot.hpp>
