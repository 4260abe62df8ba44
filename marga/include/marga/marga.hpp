#pragma once
// Marga: graph-aware retrieval query planner
//
// Turns a query (vector + text) into an ExecutionPlan:
// - Weights: edge-type priorities, nudged by outcomes
// - Categories: hierarchy depth and neighbourhoods
// - Importance: which entities deserve budget first
// - Expansion: related topics and categories
// - Rewriting: intent templates ("what is X", "compare X and Y")
// - Traversal: per-level node budgets and edge activation depths
// - Budget: advisory ceilings and early stopping
// - Orchestrator: the staged plan() pipeline

#include "version.hpp"
#include "types.hpp"
#include "error.hpp"
#include "tracer.hpp"
#include "relationship_weights.hpp"
#include "category_graph.hpp"
#include "entity_importance.hpp"
#include "query_expansion.hpp"
#include "traversal_planner.hpp"
#include "hints.hpp"
#include "budget.hpp"
#include "plan.hpp"
#include "query_rewriter.hpp"
#include "learning.hpp"
#include "graph_access.hpp"
#include "config.hpp"
#include "orchestrator.hpp"
