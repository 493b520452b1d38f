/* this project is part of the Rill project; licensed under the MIT license. see LICENSE for more info */

#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include <rill/foundation/diagnostics.hpp>
#include <rill/foundation/pass-config.hpp>
#include <rill/foundation/pass.hpp>

namespace rill
{
	class PassManager;

	struct TaskNode
	{
		PassDescriptor pass;
		std::size_t index = 0;                 /* declaration position after dedup */
		std::vector<std::size_t> depends_on;   /* incoming edges */
		std::vector<std::size_t> dependents;   /* outgoing edges */
		std::size_t in_degree = 0;             /* for topological sort */
	};

	/**
	 * @brief Dependency graph over pass descriptors
	 *
	 * Passes are deduplicated by name (first declaration wins) as they are
	 * added. Ordering is a stable topological sort of the `run_after` graph,
	 * ties broken by declaration order. Every finding is reported to the
	 * diagnostics sink and given a fallback; none of them is fatal.
	 */
	class TaskGraph
	{
	public:
		/**
		 * @param sink Diagnostics channel; must outlive the graph and any PassManager built from it
		 */
		explicit TaskGraph(DiagnosticSink &sink);

		/**
		 * @brief Add a pass to the task graph
		 * @param pass Descriptor to add; dropped with a diagnostic when its name is taken
		 * @return Reference to this TaskGraph for chaining
		 */
		TaskGraph &add(PassDescriptor pass);

		/**
		 * @brief Add every pass of a group in declaration order
		 */
		TaskGraph &add(PassGroup group);

		/**
		 * @brief Build a PassManager executing the computed order
		 * @param config Enable/disable overrides
		 */
		PassManager build(PassConfig config = {});

		/**
		 * @brief Get the number of registered (deduplicated) passes
		 */
		[[nodiscard]] std::size_t pass_count() const;

		[[nodiscard]] bool contains(const std::string &name) const;

		/**
		 * @brief Compute the execution order
		 *
		 * Resolves `run_after` edges, drops dangling and cyclic ones, then sorts.
		 * The result only depends on the declared names and edges.
		 *
		 * @return Pass names in execution order, disabled ones included
		 */
		std::vector<std::string> execution_order();

		/**
		 * @brief Numbered listing (`1. name`) of the enabled passes in execution order
		 * @param config Enable/disable overrides applied to the listing
		 */
		[[nodiscard]] std::string order_report(const PassConfig &config = {});

		[[nodiscard]] DiagnosticSink &diagnostics() const;

	private:
		DiagnosticSink *sink;
		std::vector<TaskNode> nodes;
		std::unordered_map<std::string, std::size_t> name_to_node;
		std::vector<std::size_t> order;
		bool resolved = false;

		/**
		 * @brief Build dependency edges from `run_after`, reporting dangling names
		 */
		void build_dependencies();

		/**
		 * @brief Drop the back edges of a declaration-order DFS, reporting each cycle
		 */
		void break_cycles();

		/**
		 * @brief DFS helper for cycle detection
		 * @param node Current node
		 * @param state 0 unvisited, 1 on the stack, 2 finished
		 * @param stack Current DFS path
		 * @param back_edges Collected (from, to) back edges
		 */
		void dfs_cycle_check(std::size_t node,
		                     std::vector<std::uint8_t> &state,
		                     std::vector<std::size_t> &stack,
		                     std::vector<std::pair<std::size_t, std::size_t>> &back_edges);

		/**
		 * @brief Kahn's algorithm with a min-heap on declaration index
		 */
		void topological_sort();

		void resolve();

		friend class PassManager;
	};
}
