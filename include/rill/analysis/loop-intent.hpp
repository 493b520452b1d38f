/* this project is part of the Rill project; licensed under the MIT license. see LICENSE for more info */

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include <rill/analysis/usage.hpp>
#include <rill/source/expr.hpp>

namespace rill
{
	/**
	 * @brief Bounds of a counted iteration
	 *
	 * Expressions point into the input tree, which must outlive the intent.
	 */
	struct RangeSpec
	{
		/** @brief Null means the default start of 0; a computed start is the counter local itself */
		const source::Expr *start = nullptr;
		const source::Expr *end = nullptr;
		std::int64_t step = 1;
		bool inclusive = false;
	};

	/**
	 * @brief What a loop iterates over, named by the user-visible variable
	 */
	struct Iteration
	{
		/** @brief Index or element variable as the user wrote it */
		std::string var;
		/** @brief Set for counted loops */
		std::optional<RangeSpec> range;
		/** @brief Set for collection loops */
		const source::Expr *collection = nullptr;

		[[nodiscard]] bool is_range() const
		{
			return range.has_value();
		}
	};

	/**
	 * @brief Side-effecting iteration over a range or collection; no result
	 */
	struct EachIntent
	{
		Iteration iter;
		std::vector<const source::Expr *> body;
	};

	/**
	 * @brief `acc.push(transform(v))` for every element
	 */
	struct MapIntent
	{
		Iteration iter;
		std::string accumulator;
		const source::Expr *transform = nullptr;
		/** @brief The accumulator is known to hold an empty array before the loop */
		bool starts_empty = false;
	};

	/**
	 * @brief `if (pred(v)) acc.push(v)` for every element
	 */
	struct FilterIntent
	{
		Iteration iter;
		std::string accumulator;
		const source::Expr *predicate = nullptr;
		bool starts_empty = false;
	};

	/**
	 * @brief Guarded, transformed appends; lowered to a generator with filters
	 */
	struct ComprehensionIntent
	{
		Iteration iter;
		std::string accumulator;
		/** @brief Conjunction, outermost guard first */
		std::vector<const source::Expr *> filters;
		const source::Expr *transform = nullptr;
		bool starts_empty = false;
	};

	/**
	 * @brief Fold over outer variables updated by the body
	 */
	struct ReduceIntent
	{
		Iteration iter;
		/** @brief Outer variables the body updates, in order of first update */
		std::vector<std::string> accumulators;
		std::vector<const source::Expr *> body;
		/** @brief The body has top-level `if (c) break;` / `if (c) continue;` exits */
		bool has_signals = false;
	};

	/**
	 * @brief Condition-driven loop threading the outer variables it updates
	 */
	struct WhileIntent
	{
		const source::Expr *cond = nullptr;
		std::vector<const source::Expr *> body;
		std::vector<std::string> state;
	};

	/**
	 * @brief As WhileIntent, but the body runs once before the first check
	 */
	struct DoWhileIntent
	{
		const source::Expr *cond = nullptr;
		std::vector<const source::Expr *> body;
		std::vector<std::string> state;
	};

	/**
	 * @brief Semantic loop shape, independent of the desugared syntax it came from
	 *
	 * Created by a loop analyzer, consumed once by LoopLowering and then
	 * discarded.
	 */
	using LoopIntent = std::variant<
		EachIntent,
		MapIntent,
		FilterIntent,
		ComprehensionIntent,
		ReduceIntent,
		WhileIntent,
		DoWhileIntent>;

	/**
	 * @brief Short tag of an intent e.g. "map"; used in tracing and tests
	 */
	[[nodiscard]] std::string_view intent_name(const LoopIntent &intent);

	/**
	 * @brief Facts about the code around a loop
	 */
	struct LoopContext
	{
		/** @brief Initialiser of locals declared before the loop */
		std::map<std::string, const source::Expr *, std::less<>> initial_values;
		/** @brief Locals read after the loop */
		NameSet live_after;

		[[nodiscard]] const source::Expr *initial(std::string_view name) const;

		[[nodiscard]] bool is_live_after(std::string_view name) const;

		/**
		 * @return true if `name` was initialised with an empty array literal
		 */
		[[nodiscard]] bool starts_empty(std::string_view name) const;
	};
}
