/* this project is part of the Rill project; licensed under the MIT license. see LICENSE for more info */

#pragma once

#include <functional>
#include <string>
#include <rill/foundation/ast.hpp>

namespace rill
{
	using NodeRewrite = std::function<NodePtr(NodePtr)>;

	/**
	 * @brief Replace every direct expression child of `node` with `fn(child)`
	 *
	 * Null children are left alone. Patterns are not visited.
	 */
	void map_children(Node &node, const NodeRewrite &fn);

	/**
	 * @brief Call `fn` on every pattern owned directly by `node`
	 *
	 * Covers match patterns, clause patterns, generator patterns and
	 * function/def parameters.
	 */
	void for_each_pattern(Node &node, const std::function<void(Pattern &)> &fn);

	/**
	 * @brief Post-order rewrite: children first, then `fn` on the node itself
	 * @param node Tree to rewrite; may be null
	 * @param fn Rewrite; must not return null for a non-null argument
	 */
	NodePtr rewrite_bottom_up(NodePtr node, const NodeRewrite &fn);

	/**
	 * @brief Unwrap a block holding exactly one statement
	 * @return The statement, or `node` unchanged
	 */
	NodePtr collapse_block(NodePtr node);

	/**
	 * @brief Apply `fn` to every name carried by a pattern (binds, pins, aliases)
	 */
	void rename_pattern(Pattern &pattern, const std::function<void(std::string &)> &fn);

	/**
	 * @brief Apply `fn` to the name of every non-wildcard bind/alias in a pattern
	 *
	 * Pinned names are left alone since they are uses.
	 */
	void rename_binders(Pattern &pattern, const std::function<void(std::string &)> &fn);
}
