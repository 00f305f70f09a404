/**
 * @file tickflow.hpp
 * @brief TickFlow - cyclic dataflow execution for real-time robot pipelines
 * 
 * Single include for module authors and applications.
 */

#pragma once

#include <tickflow/result.hpp>
#include <tickflow/platform/timestamp.hpp>
#include <tickflow/platform/threading.hpp>

#include <tickflow/channel/channel.hpp>
#include <tickflow/history/historic_buffer.hpp>
#include <tickflow/history/snapshot_history.hpp>
#include <tickflow/parameters/parameter_store.hpp>
#include <tickflow/database/database.hpp>

#include <tickflow/module/handles.hpp>
#include <tickflow/module/module_declaration.hpp>
#include <tickflow/module/cycle_context.hpp>
#include <tickflow/module/module.hpp>

#include <tickflow/pipeline/diagnostics.hpp>
#include <tickflow/pipeline/pipeline_declaration.hpp>
#include <tickflow/pipeline/pipeline_compiler.hpp>

#include <tickflow/runtime/fault_handler.hpp>
#include <tickflow/runtime/tick_source.hpp>
#include <tickflow/runtime/cycler.hpp>
#include <tickflow/runtime/pipeline_runtime.hpp>
#include <tickflow/runtime/runtime_config.hpp>

#include <tickflow/telemetry/telemetry_publisher.hpp>
