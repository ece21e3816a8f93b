#pragma once

#include <parity/codec/annotated_csv.hpp>
#include <parity/codec/codec.hpp>
#include <parity/codec/json.hpp>
#include <parity/compare/comparator.hpp>
#include <parity/compiler/compiler.hpp>
#include <parity/compiler/mapping.hpp>
#include <parity/core/error.hpp>
#include <parity/core/time.hpp>
#include <parity/core/value.hpp>
#include <parity/harness/case.hpp>
#include <parity/harness/driver.hpp>
#include <parity/harness/skip_registry.hpp>
#include <parity/runtime/executor.hpp>
#include <parity/table/result_stream.hpp>
#include <parity/table/table.hpp>
