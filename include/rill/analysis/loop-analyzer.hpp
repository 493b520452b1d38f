/* this project is part of the Rill project; licensed under the MIT license. see LICENSE for more info */

#pragma once

#include <concepts>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <rill/analysis/loop-intent.hpp>
#include <rill/source/expr.hpp>

namespace rill
{
	/**
	 * @brief An intent together with the score of the analyzer that found it
	 *
	 * The confidence is a coarse heuristic used to pick between analyzers
	 * firing on the same loop; it is not a probability.
	 */
	struct LoopFinding
	{
		LoopIntent intent;
		double confidence = 0.0;
		std::string analyzer;
	};

	/**
	 * @brief Iteration recognised from any loop syntax, with the loop
	 * bookkeeping (synthetic counter increment, element fetch) stripped
	 */
	struct LoopShape
	{
		Iteration iter;
		std::vector<const source::Expr *> body;
	};

	/**
	 * @brief Recognise what a loop iterates over
	 *
	 * Handles counted range-for, collection-for, and while loops driven by a
	 * counter. A `while (g < coll.length) { v = coll[g]; ...; g++; }` shape is
	 * a collection iteration named by `v`. A while counter needs both a `<` or
	 * `<=` bound test and an increment (`++`, `+= k`, `i = i + k`) at the top
	 * level of the body; a counter that is still live after the loop, assigned
	 * anywhere else or skipped over by `continue` disqualifies the loop.
	 *
	 * @return Shape or nullopt when the loop is not a plain iteration
	 */
	[[nodiscard]] std::optional<LoopShape> recognise_iteration(const source::Expr &loop, const LoopContext &context);

	/**
	 * @brief Outer variables a loop body updates, in order of first update
	 *
	 * Locals declared inside the body and names in `exclude` are skipped.
	 * Receivers of `push` count as updated.
	 */
	[[nodiscard]] std::vector<std::string> updated_outer_variables(const std::vector<const source::Expr *> &body,
	                                                               const NameSet &exclude = {});

	/**
	 * @brief Base class for loop-pattern analyzers
	 *
	 * Analyzers only read the input tree and describe what they found; they
	 * never build target nodes.
	 */
	class LoopAnalyzer
	{
	public:
		virtual ~LoopAnalyzer() = default;

		[[nodiscard]] virtual std::string name() const = 0;

		/**
		 * @param loop Loop node
		 * @param context Facts about the surrounding code
		 * @return Finding or nullopt when the analyzer does not apply
		 */
		[[nodiscard]] virtual std::optional<LoopFinding> analyze(const source::Expr &loop,
		                                                         const LoopContext &context) const = 0;
	};

	/**
	 * @brief Range and collection iteration without results (`each`); confidence 0.9
	 */
	class IterationAnalyzer final : public LoopAnalyzer
	{
	public:
		[[nodiscard]] std::string name() const override;

		[[nodiscard]] std::optional<LoopFinding> analyze(const source::Expr &loop,
		                                                 const LoopContext &context) const override;
	};

	/**
	 * @brief Map, filter and filter+map appends into a result array; confidence 0.95
	 */
	class AccumulationAnalyzer final : public LoopAnalyzer
	{
	public:
		[[nodiscard]] std::string name() const override;

		[[nodiscard]] std::optional<LoopFinding> analyze(const source::Expr &loop,
		                                                 const LoopContext &context) const override;
	};

	/**
	 * @brief Folds over updated outer variables, incl. top-level break/continue; confidence 0.85
	 */
	class ReductionAnalyzer final : public LoopAnalyzer
	{
	public:
		[[nodiscard]] std::string name() const override;

		[[nodiscard]] std::optional<LoopFinding> analyze(const source::Expr &loop,
		                                                 const LoopContext &context) const override;
	};

	/**
	 * @brief Fallback for while/do-while loops without exits; confidence 0.5
	 */
	class ConditionLoopAnalyzer final : public LoopAnalyzer
	{
	public:
		[[nodiscard]] std::string name() const override;

		[[nodiscard]] std::optional<LoopFinding> analyze(const source::Expr &loop,
		                                                 const LoopContext &context) const override;
	};

	template<typename T>
	concept LoopAnalyzerType = std::derived_from<T, LoopAnalyzer>;

	/**
	 * @brief Runs every registered analyzer and keeps the most confident finding
	 *
	 * Equal confidences resolve to the analyzer registered first.
	 */
	class LoopPatternAnalyzer
	{
	public:
		LoopPatternAnalyzer() = default;

		/**
		 * @brief Analyzer set with the accumulation, iteration, reduction and
		 * condition-loop analyzers registered in that order
		 */
		static LoopPatternAnalyzer with_defaults();

		template<LoopAnalyzerType T, typename... Args>
		LoopPatternAnalyzer &add(Args&&... args)
		{
			analyzers.push_back(std::make_unique<T>(std::forward<Args>(args)...));
			return *this;
		}

		/**
		 * @return Best finding or nullopt when no analyzer recognises the loop
		 */
		[[nodiscard]] std::optional<LoopFinding> analyze(const source::Expr &loop, const LoopContext &context) const;

		/**
		 * @return Every finding, in registration order
		 */
		[[nodiscard]] std::vector<LoopFinding> findings(const source::Expr &loop, const LoopContext &context) const;

		[[nodiscard]] std::size_t analyzer_count() const;

	private:
		std::vector<std::unique_ptr<LoopAnalyzer>> analyzers;
	};
}
