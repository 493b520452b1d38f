/* this project is part of the Rill project; licensed under the MIT license. see LICENSE for more info */

#pragma once

#include <functional>
#include <string>
#include <vector>
#include <rill/analysis/loop-analyzer.hpp>
#include <rill/analysis/loop-intent.hpp>
#include <rill/foundation/ast.hpp>
#include <rill/source/expr.hpp>

namespace rill
{
	/**
	 * @brief Translates one input expression into a target expression
	 *
	 * Supplied by the surrounding lowering layer; must not return null.
	 */
	using ExprBuilder = std::function<NodePtr(const source::Expr &)>;

	/**
	 * @brief Builds the replacement subtree for a recognised loop
	 *
	 * | intent        | result                                                  |
	 * |---------------|---------------------------------------------------------|
	 * | each / range  | `Enum.each(src, fn v -> body end)`                      |
	 * | map           | `acc = Enum.map(src, fn v -> t end)`                    |
	 * | filter        | `acc = Enum.filter(src, fn v -> p end)`                 |
	 * | comprehension | `acc = for v <- src, p..., do: t`                       |
	 * | reduce        | `acc = Enum.reduce(src, acc, fn v, acc -> ... end)`     |
	 * | while         | self-recursive closure, condition checked first         |
	 * | do-while      | self-recursive closure, body runs before the check      |
	 *
	 * Accumulators not known to start empty get the new elements appended
	 * (`acc = acc ++ ...`). Several accumulators are threaded as a tuple.
	 * Top-level `if (c) break;` / `if (c) continue;` turn the fold into
	 * `Enum.reduce_while` with `{:halt, acc}` / `{:cont, acc}` signals.
	 * The while and do-while closures are not zero-argument: they take
	 * themselves and the threaded state, `loop_fn.(loop_fn, state)`.
	 */
	class LoopLowering
	{
	public:
		explicit LoopLowering(ExprBuilder builder);

		/**
		 * @brief Consume an intent and build its replacement
		 * @throws std::runtime_error if the expression builder returns null
		 */
		[[nodiscard]] NodePtr lower(const LoopIntent &intent) const;

		/**
		 * @brief Analyze a loop and lower it when a pattern is found
		 * @return Replacement or null when the loop must stay as it is
		 */
		[[nodiscard]] NodePtr lower_loop(const source::Expr &loop, const LoopContext &context,
		                                 const LoopPatternAnalyzer &analyzer) const;

	private:
		ExprBuilder builder;
		/* nesting level of lower(); the builder may re-enter for inner loops */
		mutable std::size_t depth = 0;

		NodePtr build(const source::Expr *expr) const;

		NodePtr source_of(const Iteration &iter) const;

		NodePtr lower_each(const EachIntent &intent) const;

		NodePtr lower_map(const MapIntent &intent) const;

		NodePtr lower_filter(const FilterIntent &intent) const;

		NodePtr lower_comprehension(const ComprehensionIntent &intent) const;

		NodePtr lower_reduce(const ReduceIntent &intent) const;

		NodePtr lower_while(const std::vector<const source::Expr *> &body, const source::Expr *cond,
		                    const std::vector<std::string> &state, bool check_first) const;

		/**
		 * @brief Lower `stmts` from `from` on into a reduce_while step body
		 */
		NodePtr lower_signals(const std::vector<const source::Expr *> &stmts, std::size_t from,
		                      const std::vector<std::string> &state) const;

		void lower_stmt(const source::Expr *stmt, std::vector<NodePtr> &out) const;

		std::vector<NodePtr> lower_stmts(const std::vector<const source::Expr *> &stmts) const;

		NodePtr compound(const source::Expr &target, const std::string &op, const source::Expr *value) const;

		friend struct LoweringDepth;
	};
}
