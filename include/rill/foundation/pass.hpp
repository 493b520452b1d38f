/* this project is part of the Rill project; licensed under the MIT license. see LICENSE for more info */

#pragma once

#include <concepts>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>
#include <rill/foundation/ast.hpp>

namespace rill
{
	/**
	 * @brief Read-only build context handed to contextual passes
	 *
	 * Carries metadata about the module/function currently being compiled,
	 * e.g. the module name or whether the module is a web component.
	 */
	struct PassContext
	{
		std::string module_name;
		std::string function_name;
		/* ordered so that iteration is deterministic */
		std::map<std::string, std::string, std::less<>> attributes;

		/**
		 * @param key Attribute name
		 * @return true when `key` is present with a value other than "false"
		 */
		[[nodiscard]] bool flag(std::string_view key) const;

		/**
		 * @param key Attribute name
		 * @return Attribute value or empty when absent
		 */
		[[nodiscard]] std::string_view attribute(std::string_view key) const;
	};

	/**
	 * @brief Pure rewrite of a target tree; ownership of the tree moves through the pass
	 */
	using RewriteFn = std::function<NodePtr(NodePtr)>;

	/**
	 * @brief Rewrite that additionally reads the surrounding build context
	 */
	using ContextualRewriteFn = std::function<NodePtr(NodePtr, const PassContext &)>;

	/**
	 * @brief A single named rewrite stage as consumed by the scheduler
	 */
	struct PassDescriptor
	{
		/** @brief Unique key used for deduplication and `run_after` edges */
		std::string name;
		std::string description;
		/** @brief Default enablement; a PassConfig override wins over it */
		bool enabled = true;
		RewriteFn run;
		/** @brief Names of passes that must execute before this one */
		std::vector<std::string> run_after;
		/** @brief Preferred over `run` when set */
		ContextualRewriteFn run_with_context;

		[[nodiscard]] bool is_contextual() const
		{
			return static_cast<bool>(run_with_context);
		}

		[[nodiscard]] bool has_rewrite() const
		{
			return static_cast<bool>(run) || static_cast<bool>(run_with_context);
		}
	};

	/**
	 * @brief Named sub-list of passes, concatenated by the task graph in declaration order
	 */
	struct PassGroup
	{
		std::string name;
		std::vector<PassDescriptor> passes;
	};

	template<typename F>
	concept RewriteCallable = std::is_invocable_r_v<NodePtr, F, NodePtr>;

	template<typename F>
	concept ContextualRewriteCallable = std::is_invocable_r_v<NodePtr, F, NodePtr, const PassContext &>;

	/**
	 * @brief Make a descriptor for a plain rewrite
	 * @param name Unique pass name
	 * @param description Human readable description
	 * @param fn Rewrite callable
	 * @param run_after Passes that must run first
	 */
	template<RewriteCallable F>
	PassDescriptor make_pass(std::string name, std::string description, F &&fn,
	                         std::vector<std::string> run_after = {})
	{
		PassDescriptor pass;
		pass.name = std::move(name);
		pass.description = std::move(description);
		pass.run = std::forward<F>(fn);
		pass.run_after = std::move(run_after);
		return pass;
	}

	/**
	 * @brief Make a descriptor for a contextual rewrite
	 */
	template<ContextualRewriteCallable F>
	PassDescriptor make_contextual_pass(std::string name, std::string description, F &&fn,
	                                    std::vector<std::string> run_after = {})
	{
		PassDescriptor pass;
		pass.name = std::move(name);
		pass.description = std::move(description);
		pass.run_with_context = std::forward<F>(fn);
		pass.run_after = std::move(run_after);
		return pass;
	}
}
