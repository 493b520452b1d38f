/* this project is part of the Rill project; licensed under the MIT license. see LICENSE for more info */

#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <vector>
#include <rill/foundation/diagnostics.hpp>
#include <rill/foundation/pass-config.hpp>
#include <rill/foundation/pass.hpp>

namespace rill
{
	class TaskGraph;

	/**
	 * @brief Runs a validated pass list over a target tree
	 *
	 * Passes run strictly one after another, each receiving the tree left by
	 * the previous one. Disabled passes are never invoked.
	 */
	class PassManager
	{
	public:
		/**
		 * @brief Called after every executed pass with the pass and the tree it produced
		 */
		using Observer = std::function<void(const PassDescriptor &, const Node &)>;

		/**
		 * @brief Construct from a TaskGraph with dependency-aware ordering
		 * @param task_graph TaskGraph to build the execution plan from
		 * @param config Enable/disable overrides; names matching no pass are diagnosed
		 */
		explicit PassManager(TaskGraph &&task_graph, PassConfig config = {});

		~PassManager() = default;

		PassManager(const PassManager &) = delete;
		PassManager &operator=(const PassManager &) = delete;
		PassManager(PassManager &&) = delete;
		PassManager &operator=(PassManager &&) = delete;

		/**
		 * @brief Run all enabled passes on the given tree
		 * @param root Tree to rewrite; ownership moves through each pass
		 * @param context Build context for contextual passes
		 * @return The rewritten tree
		 * @throws std::runtime_error if a pass returns a null tree
		 */
		NodePtr run(NodePtr root, const PassContext &context = {}) const;

		/**
		 * @brief Install a per-pass tracing hook
		 */
		void set_observer(Observer fn);

		/**
		 * @brief Get the number of enabled passes
		 */
		[[nodiscard]] std::size_t pass_count() const;

		/**
		 * @return Names of the enabled passes in execution order
		 */
		[[nodiscard]] std::vector<std::string> execution_order() const;

		/**
		 * @param name Pass name
		 * @return true if `name` is scheduled and enabled
		 */
		[[nodiscard]] bool is_enabled(std::string_view name) const;

		[[nodiscard]] const PassConfig &config() const;

	private:
		std::vector<PassDescriptor> passes;
		std::vector<bool> enabled;
		PassConfig pass_config;
		DiagnosticSink *sink;
		Observer observer;

		/**
		 * @brief Execute a single pass and validate its result
		 */
		NodePtr execute_single_pass(const PassDescriptor &pass, NodePtr root, const PassContext &context) const;
	};
}
