/* this project is part of the Rill project; licensed under the MIT license. see LICENSE for more info */

#pragma once

#include <string_view>
#include <rill/analysis/usage.hpp>
#include <rill/foundation/ast.hpp>

namespace rill
{
	/**
	 * @brief Free-variable collection over function and closure bodies
	 *
	 * Stricter than the plain usage queries: a match inside a block binds its
	 * names for the statements that follow, and every nested binder (clause
	 * and with patterns, generators, function parameters, rescue/catch
	 * patterns) shadows its own scope only. A nested closure's parameter
	 * therefore never counts as a use of an outer name, while a genuine
	 * free reference from inside any nesting level always does.
	 */
	class ClosureCollector
	{
	public:
		/**
		 * @param body Function or closure body
		 * @return Names referenced in `body` that resolve to the enclosing scope
		 */
		[[nodiscard]] static NameSet collect(const Node *body);

		/**
		 * @brief Free names of one function clause; its parameters bind over guard and body
		 */
		[[nodiscard]] static NameSet collect(const ast::FnClause &clause);

		[[nodiscard]] static NameSet collect(const ast::Def &def);

		/**
		 * @return true if `name` is a free reference of `body`
		 */
		[[nodiscard]] static bool references(const Node *body, std::string_view name);

		/**
		 * @brief Parameter binders of a clause head that the clause never references
		 */
		[[nodiscard]] static NameSet unused_params(const std::vector<PatternPtr> &params,
		                                           const Node *guard, const Node *body);
	};
}
