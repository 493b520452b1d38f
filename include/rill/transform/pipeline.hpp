/* this project is part of the Rill project; licensed under the MIT license. see LICENSE for more info */

#pragma once

#include <vector>
#include <rill/foundation/diagnostics.hpp>
#include <rill/foundation/pass-config.hpp>
#include <rill/foundation/pass.hpp>
#include <rill/foundation/taskgraph.hpp>

namespace rill
{
	/**
	 * @brief Groups of the default pipeline: normalization, hygiene, simplification
	 */
	[[nodiscard]] std::vector<PassGroup> default_pass_groups();

	/**
	 * @brief Register every default group on a task graph
	 * @return `graph` for chaining
	 */
	TaskGraph &add_default_passes(TaskGraph &graph);

	/**
	 * @brief Schedule and run the default pipeline once
	 * @param root Tree to rewrite
	 * @param sink Receives scheduling diagnostics
	 * @param context Build context for contextual passes
	 * @param config Enable/disable overrides
	 * @return The rewritten tree
	 */
	NodePtr run_default_pipeline(NodePtr root, DiagnosticSink &sink, const PassContext &context = {},
	                             PassConfig config = {});
}
