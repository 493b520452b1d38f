/* this project is part of the Rill project; licensed under the MIT license. see LICENSE for more info */

#pragma once

#include <cstdint>
#include <functional>
#include <set>
#include <string>
#include <string_view>
#include <rill/foundation/ast.hpp>

namespace rill
{
	/* ordered so that every iteration over a name set is deterministic */
	using NameSet = std::set<std::string, std::less<>>;

	/**
	 * @brief How a queried name is compared against a use site
	 */
	enum class NameMatch : std::uint8_t
	{
		/** @brief Verbatim; `x` and `_x` are different names */
		EXACT,
		/** @brief Ignores snake/camel case and a leading hygiene underscore */
		FUZZY
	};

	/**
	 * @brief Traversal options for `scan_uses`
	 */
	struct ScanOptions
	{
		/** @brief A match inside a block binds its names for the statements after it */
		bool sequential_blocks = false;
	};

	/**
	 * @brief Callback for every reference; return true to stop the scan
	 */
	using UseVisitor = std::function<bool(std::string_view)>;

	/**
	 * @brief Walk every variable reference in a tree, respecting scoping
	 *
	 * A reference to a name bound by an enclosing clause pattern, generator,
	 * function parameter or rescue/catch pattern inside `node` resolves to
	 * that inner binding and is not reported. Match patterns bind; only
	 * their right-hand side and pinned names are uses. String literals
	 * report the references of their `#{...}` spans and raw code reports
	 * every identifier token.
	 *
	 * @param node Tree to scan; may be null
	 * @param on_use Called with each reference in traversal order
	 * @param options Traversal options
	 * @return true if `on_use` stopped the scan
	 */
	bool scan_uses(const Node *node, const UseVisitor &on_use, ScanOptions options = {});

	/**
	 * @brief Exact usage query
	 * @return true if `name` is referenced in `node`; false for a null node or empty name
	 */
	[[nodiscard]] bool is_used(const Node *node, std::string_view name);

	/**
	 * @brief Fuzzy usage query; also matches case-style and underscore variants
	 */
	[[nodiscard]] bool is_used_fuzzy(const Node *node, std::string_view name);

	[[nodiscard]] bool is_used(const Node *node, std::string_view name, NameMatch mode);

	/**
	 * @brief Every name referenced in `node`, verbatim
	 */
	[[nodiscard]] NameSet used_names(const Node *node);

	/**
	 * @brief Names a pattern binds; pinned names and the wildcard are excluded
	 */
	[[nodiscard]] NameSet binders(const Pattern *pattern);

	void collect_binders(const Pattern *pattern, NameSet &out);

	/**
	 * @brief Names a pattern uses through `^name`
	 */
	void collect_pins(const Pattern *pattern, NameSet &out);

	/**
	 * @brief Every name bound anywhere in a tree, including nested scopes
	 */
	[[nodiscard]] NameSet bound_names(const Node *node);
}
