/* this project is part of the Rill project; licensed under the MIT license. see LICENSE for more info */

#pragma once

#include <string_view>
#include <vector>
#include <rill/analysis/usage.hpp>
#include <rill/foundation/ast.hpp>
#include <rill/support/string-table.hpp>

namespace rill
{
	/**
	 * @brief Point-in-time answer to "is this name used at or after statement i"
	 *
	 * Built in one backward pass over a statement list. For every name the
	 * index keeps the last statement referencing it, so `suffix(i)` is the set
	 * of names whose last use is at or after `i`; `suffix(size())` is empty and
	 * `suffix(i)` includes `suffix(i + 1)`. Queries are O(1).
	 *
	 * The index does not follow mutations of the statement list; rebuild it
	 * after rewriting the list.
	 */
	class UsageIndex
	{
	public:
		/**
		 * @brief Build a fuzzy index; names are compared by canonical form
		 */
		static UsageIndex build(const std::vector<NodePtr> &stmts);

		/**
		 * @brief Build an exact index; `x` and `_x` are distinct
		 */
		static UsageIndex build_exact(const std::vector<NodePtr> &stmts);

		/**
		 * @param start First statement to consider
		 * @param name Variable name
		 * @return true if `name` is referenced by a statement at index >= `start`
		 */
		[[nodiscard]] bool used_later(std::size_t start, std::string_view name) const;

		/**
		 * @brief Materialise `suffix(i)`; in canonical form for a fuzzy index
		 */
		[[nodiscard]] NameSet suffix(std::size_t i) const;

		/**
		 * @brief Number of statements the index was built over
		 */
		[[nodiscard]] std::size_t size() const;

		[[nodiscard]] NameMatch mode() const;

	private:
		UsageIndex(std::size_t count, NameMatch mode);

		static UsageIndex build(const std::vector<NodePtr> &stmts, NameMatch mode);

		StringTable names;
		/* last statement referencing each interned name, plus one */
		std::vector<std::size_t> last_use;
		std::size_t count;
		NameMatch match;
	};

	/**
	 * @brief Naive reference definition of `UsageIndex::used_later`
	 *
	 * Rescans every statement from `start`; quadratic when called per statement.
	 */
	[[nodiscard]] bool brute_force_used_later(const std::vector<NodePtr> &stmts, std::size_t start,
	                                          std::string_view name, NameMatch mode = NameMatch::FUZZY);
}
