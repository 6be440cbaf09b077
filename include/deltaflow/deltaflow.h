#pragma once

/**
 * @file deltaflow.h
 * @brief Everything needed to build and drive a dataflow graph.
 */

#include <deltaflow/deltaflow_forward_declarations.h>

#include <deltaflow/types/delta.h>
#include <deltaflow/types/display_node.h>
#include <deltaflow/types/input.h>
#include <deltaflow/types/record.h>
#include <deltaflow/types/subscription.h>

#include <deltaflow/nodes/operators.h>

#include <deltaflow/runtime/context.h>
#include <deltaflow/runtime/context_registry.h>
#include <deltaflow/runtime/engine_config.h>
#include <deltaflow/runtime/transaction.h>
#include <deltaflow/runtime/observers/dataflow_observer.h>
#include <deltaflow/runtime/observers/delta_statistics.h>
#include <deltaflow/runtime/observers/delta_trace.h>
