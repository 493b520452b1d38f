/* this project is part of the Rill project; licensed under the MIT license. see LICENSE for more info */

#include <algorithm>
#include <array>
#include <rill/analysis/loop-analyzer.hpp>

namespace rill
{
	using source::Expr;
	using source::ExprKind;

	namespace
	{
		constexpr std::array<std::string_view, 8> mutating_methods = {
			"pop", "shift", "unshift", "insert", "remove", "splice", "clear", "set"
		};

		/**
		 * @brief Step of a counter update `v++`, `++v`, `v += k` or `v = v + k`
		 */
		std::optional<std::int64_t> increment_of(const Expr *stmt, std::string_view var)
		{
			if (!stmt)
				return std::nullopt;

			if (stmt->is(ExprKind::UNOP) && stmt->op == "++" && source::is_local(stmt->child(0), var))
				return 1;

			if (stmt->is(ExprKind::ASSIGN_OP) && stmt->op == "+" && source::is_local(stmt->child(0), var))
			{
				if (const Expr *k = stmt->child(1); k && k->is(ExprKind::INT) && k->int_value > 0)
					return k->int_value;
				return std::nullopt;
			}

			if (stmt->is(ExprKind::ASSIGN) && source::is_local(stmt->child(0), var))
			{
				const Expr *value = stmt->child(1);
				if (!value || !value->is(ExprKind::BINOP) || value->op != "+")
					return std::nullopt;

				const Expr *lhs = value->child(0);
				const Expr *rhs = value->child(1);
				if (source::is_local(rhs, var))
					std::swap(lhs, rhs);
				if (source::is_local(lhs, var) && rhs && rhs->is(ExprKind::INT) && rhs->int_value > 0)
					return rhs->int_value;
			}
			return std::nullopt;
		}

		/**
		 * @brief Check whether `expr` writes local `name`
		 */
		bool assigns(const Expr *expr, std::string_view name)
		{
			if (!expr)
				return false;

			switch (expr->kind)
			{
				case ExprKind::ASSIGN:
				case ExprKind::ASSIGN_OP:
					if (source::is_local(expr->child(0), name))
						return true;
					break;
				case ExprKind::UNOP:
					if ((expr->op == "++" || expr->op == "--") && source::is_local(expr->child(0), name))
						return true;
					break;
				case ExprKind::VAR_DECL:
					if (expr->name == name)
						return true;
					break;
				default:
					break;
			}
			return std::ranges::any_of(expr->children, [name](const source::ExprPtr &c)
			{
				return assigns(c.get(), name);
			});
		}

		bool assigns_any(const std::vector<const Expr *> &stmts, std::string_view name)
		{
			return std::ranges::any_of(stmts, [name](const Expr *s) { return assigns(s, name); });
		}

		bool reads_any(const std::vector<const Expr *> &stmts, std::string_view name)
		{
			return std::ranges::any_of(stmts, [name](const Expr *s) { return source::reads(s, name); });
		}

		bool contains_kind(const Expr *expr, const ExprKind kind, const bool in_nested_loop = false)
		{
			if (!expr)
				return false;
			if (expr->is(kind) && !in_nested_loop)
				return true;

			const bool nested = in_nested_loop ||
			                    expr->is(ExprKind::WHILE) || expr->is(ExprKind::DO_WHILE) ||
			                    expr->is(ExprKind::FOR_RANGE) || expr->is(ExprKind::FOR_IN);
			return std::ranges::any_of(expr->children, [kind, nested](const source::ExprPtr &c)
			{
				return contains_kind(c.get(), kind, nested);
			});
		}

		bool any_exit(const std::vector<const Expr *> &stmts)
		{
			return std::ranges::any_of(stmts, [](const Expr *s) { return source::contains_exit(s); });
		}

		/**
		 * @brief `coll.length` or `coll.length()` on a local
		 * @return Collection local or null
		 */
		const Expr *length_of(const Expr *expr)
		{
			if (!expr || expr->name != "length")
				return nullptr;
			if (expr->is(ExprKind::FIELD) || (expr->is(ExprKind::METHOD_CALL) && expr->children.size() == 1))
			{
				const Expr *target = expr->child(0);
				return target && target->is(ExprKind::LOCAL) ? target : nullptr;
			}
			return nullptr;
		}

		/**
		 * @brief `v = coll[g]` either as a declaration or an assignment
		 * @return Name of `v` or empty
		 */
		std::string element_fetch(const Expr *stmt, std::string_view coll, std::string_view counter)
		{
			const Expr *value = nullptr;
			std::string var;
			if (stmt->is(ExprKind::VAR_DECL))
			{
				value = stmt->child(0);
				var = stmt->name;
			}
			else if (stmt->is(ExprKind::ASSIGN) && stmt->child(0) && stmt->child(0)->is(ExprKind::LOCAL))
			{
				value = stmt->child(1);
				var = stmt->child(0)->name;
			}

			if (!value || !value->is(ExprKind::INDEX))
				return {};
			if (!source::is_local(value->child(0), coll) || !source::is_local(value->child(1), counter))
				return {};
			return var;
		}

		bool counter_starts_at_zero(const LoopContext &context, std::string_view counter)
		{
			const Expr *init = context.initial(counter);
			return !init || (init->is(ExprKind::INT) && init->int_value == 0);
		}

		/**
		 * @brief Method call on local `name` that changes it in place, `push` included
		 */
		bool mutates_local(const Expr *expr, std::string_view name)
		{
			if (!expr)
				return false;
			if (expr->is(ExprKind::METHOD_CALL) && source::is_local(expr->child(0), name) &&
			    (expr->name == "push" || std::ranges::find(mutating_methods, expr->name) != mutating_methods.end()))
			{
				return true;
			}
			return std::ranges::any_of(expr->children, [name](const source::ExprPtr &c)
			{
				return mutates_local(c.get(), name);
			});
		}

		/**
		 * @brief Check whether `expr` calls anything other than a `length` read
		 */
		bool calls_out(const Expr *expr)
		{
			if (!expr)
				return false;
			if (expr->is(ExprKind::CALL) || (expr->is(ExprKind::METHOD_CALL) && !length_of(expr)))
				return true;
			return std::ranges::any_of(expr->children, [](const source::ExprPtr &c)
			{
				return calls_out(c.get());
			});
		}

		void locals_in(const Expr *expr, std::vector<std::string_view> &out)
		{
			if (!expr)
				return;
			if (expr->is(ExprKind::LOCAL))
				out.push_back(expr->name);
			for (const source::ExprPtr &c: expr->children)
				locals_in(c.get(), out);
		}

		/**
		 * @brief Check that nothing in the loop can change `bound`, calls included
		 */
		bool invariant_in(const Expr *bound, const std::vector<const Expr *> &stmts)
		{
			if (calls_out(bound))
				return false;

			std::vector<std::string_view> names;
			locals_in(bound, names);
			return std::ranges::none_of(names, [&stmts](std::string_view name)
			{
				return assigns_any(stmts, name) ||
				       std::ranges::any_of(stmts, [name](const Expr *s) { return mutates_local(s, name); });
			});
		}

		std::optional<LoopShape> desugared_collection(const Expr &cond, const std::vector<const Expr *> &stmts,
		                                              const LoopContext &context)
		{
			if (!cond.is(ExprKind::BINOP) || cond.op != "<")
				return std::nullopt;

			const Expr *counter = cond.child(0);
			const Expr *coll = length_of(cond.child(1));
			if (!counter || !counter->is(ExprKind::LOCAL) || !coll || stmts.size() < 2)
				return std::nullopt;

			const std::string &g = counter->name;
			if (context.is_live_after(g) || !counter_starts_at_zero(context, g))
				return std::nullopt;
			if (increment_of(stmts.back(), g) != 1)
				return std::nullopt;

			std::string var = element_fetch(stmts.front(), coll->name, g);
			if (var.empty() || var == g)
				return std::nullopt;

			std::vector<const Expr *> body(stmts.begin() + 1, stmts.end() - 1);
			if (reads_any(body, g) || assigns_any(body, g) || assigns_any(body, var) || !invariant_in(cond.child(1), stmts))
				return std::nullopt;

			LoopShape shape;
			shape.iter.var = std::move(var);
			shape.iter.collection = coll;
			shape.body = std::move(body);
			return shape;
		}

		std::optional<LoopShape> counted_while(const Expr &cond, const std::vector<const Expr *> &stmts,
		                                       const LoopContext &context)
		{
			if (!cond.is(ExprKind::BINOP) || (cond.op != "<" && cond.op != "<="))
				return std::nullopt;

			const Expr *counter = cond.child(0);
			const Expr *end = cond.child(1);
			if (!counter || !counter->is(ExprKind::LOCAL) || !end)
				return std::nullopt;

			const std::string &i = counter->name;
			if (context.is_live_after(i) || source::reads(end, i))
				return std::nullopt;

			/* exactly one top-level increment; nothing after it may read the counter */
			std::optional<std::size_t> at;
			std::int64_t step = 0;
			for (std::size_t k = 0; k < stmts.size(); ++k)
			{
				if (const auto inc = increment_of(stmts[k], i))
				{
					if (at)
						return std::nullopt;
					at = k;
					step = *inc;
				}
			}
			if (!at)
				return std::nullopt;

			std::vector<const Expr *> body;
			for (std::size_t k = 0; k < stmts.size(); ++k)
			{
				if (k == *at)
					continue;
				if (k > *at && source::reads(stmts[k], i))
					return std::nullopt;
				body.push_back(stmts[k]);
			}
			if (assigns_any(body, i) || !invariant_in(end, stmts))
				return std::nullopt;

			/* a computed start is read from the counter */
			const Expr *start = context.initial(i);
			if (start && !start->is(ExprKind::INT))
				start = counter;

			LoopShape shape;
			shape.iter.var = i;
			shape.iter.range = RangeSpec{ start, end, step, cond.op == "<=" };
			shape.body = std::move(body);
			return shape;
		}

		/**
		 * @brief `if (c) break;` or `if (c) continue;` with no else branch
		 */
		bool is_signal(const Expr *stmt)
		{
			if (!stmt || !stmt->is(ExprKind::IF) || stmt->children.size() != 2)
				return false;
			const auto then = source::statements(stmt->child(1));
			return then.size() == 1 && (then[0]->is(ExprKind::BREAK) || then[0]->is(ExprKind::CONTINUE)) &&
			       !source::contains_exit(stmt->child(0));
		}

		bool is_push(const Expr *stmt, std::string &acc, const Expr *&value)
		{
			if (!stmt || !stmt->is(ExprKind::METHOD_CALL) || stmt->name != "push" || stmt->children.size() != 2)
				return false;
			const Expr *receiver = stmt->child(0);
			if (!receiver || !receiver->is(ExprKind::LOCAL))
				return false;
			acc = receiver->name;
			value = stmt->child(1);
			return true;
		}

		/**
		 * @brief Mutating method other than `push` called on an outer local
		 */
		bool mutates_in_place(const Expr *expr)
		{
			if (!expr)
				return false;
			if (expr->is(ExprKind::METHOD_CALL) && expr->child(0) && expr->child(0)->is(ExprKind::LOCAL) &&
			    std::ranges::find(mutating_methods, expr->name) != mutating_methods.end())
			{
				return true;
			}
			return std::ranges::any_of(expr->children, [](const source::ExprPtr &c)
			{
				return mutates_in_place(c.get());
			});
		}

		void collect_updates(const Expr *expr, std::vector<std::string> &out, NameSet &declared)
		{
			if (!expr)
				return;

			const auto note = [&out](const std::string &name)
			{
				if (std::ranges::find(out, name) == out.end())
					out.push_back(name);
			};

			switch (expr->kind)
			{
				case ExprKind::VAR_DECL:
					declared.insert(expr->name);
					break;
				case ExprKind::ASSIGN:
				case ExprKind::ASSIGN_OP:
					if (const Expr *target = expr->child(0); target && target->is(ExprKind::LOCAL))
						note(target->name);
					break;
				case ExprKind::UNOP:
					if (expr->op == "++" || expr->op == "--")
					{
						if (const Expr *target = expr->child(0); target && target->is(ExprKind::LOCAL))
							note(target->name);
					}
					break;
				case ExprKind::METHOD_CALL:
					if (expr->name == "push" && expr->child(0) && expr->child(0)->is(ExprKind::LOCAL))
						note(expr->child(0)->name);
					break;
				default:
					break;
			}

			for (const source::ExprPtr &c: expr->children)
				collect_updates(c.get(), out, declared);
		}

		LoopFinding finding(LoopIntent intent, const double confidence, std::string analyzer)
		{
			return LoopFinding{ std::move(intent), confidence, std::move(analyzer) };
		}
	}

	std::string_view intent_name(const LoopIntent &intent)
	{
		struct Namer
		{
			std::string_view operator()(const EachIntent &i) const
			{
				return i.iter.is_range() ? "range" : "each";
			}

			std::string_view operator()(const MapIntent &) const { return "map"; }
			std::string_view operator()(const FilterIntent &) const { return "filter"; }
			std::string_view operator()(const ComprehensionIntent &) const { return "comprehension"; }
			std::string_view operator()(const ReduceIntent &) const { return "reduce"; }
			std::string_view operator()(const WhileIntent &) const { return "while"; }
			std::string_view operator()(const DoWhileIntent &) const { return "do-while"; }
		};
		return std::visit(Namer{}, intent);
	}

	const Expr *LoopContext::initial(std::string_view name) const
	{
		if (const auto it = initial_values.find(name);
			it != initial_values.end())
		{
			return it->second;
		}
		return nullptr;
	}

	bool LoopContext::is_live_after(std::string_view name) const
	{
		return live_after.contains(name);
	}

	bool LoopContext::starts_empty(std::string_view name) const
	{
		const Expr *init = initial(name);
		return init && init->is(ExprKind::ARRAY) && init->children.empty();
	}

	std::optional<LoopShape> recognise_iteration(const Expr &loop, const LoopContext &context)
	{
		switch (loop.kind)
		{
			case ExprKind::FOR_RANGE:
			{
				const Expr *start = loop.child(0);
				const Expr *end = loop.child(1);
				if (!start || !end)
					return std::nullopt;

				LoopShape shape;
				shape.iter.var = loop.name;
				shape.iter.range = RangeSpec{ start, end, 1, false };
				shape.body = source::statements(loop.child(2));
				if (assigns_any(shape.body, loop.name))
					return std::nullopt;
				return shape;
			}
			case ExprKind::FOR_IN:
			{
				const Expr *collection = loop.child(0);
				if (!collection)
					return std::nullopt;

				LoopShape shape;
				shape.iter.var = loop.name;
				shape.iter.collection = collection;
				shape.body = source::statements(loop.child(1));
				if (assigns_any(shape.body, loop.name))
					return std::nullopt;
				return shape;
			}
			case ExprKind::WHILE:
			{
				const Expr *cond = loop.child(0);
				const auto stmts = source::statements(loop.child(1));
				if (!cond || std::ranges::any_of(stmts, [](const Expr *s) { return contains_kind(s, ExprKind::CONTINUE); }))
					return std::nullopt;

				if (auto shape = desugared_collection(*cond, stmts, context))
					return shape;
				return counted_while(*cond, stmts, context);
			}
			default:
				return std::nullopt;
		}
	}

	std::vector<std::string> updated_outer_variables(const std::vector<const Expr *> &body, const NameSet &exclude)
	{
		std::vector<std::string> updates;
		NameSet declared;
		for (const Expr *stmt: body)
			collect_updates(stmt, updates, declared);

		std::erase_if(updates, [&](const std::string &name)
		{
			return declared.contains(name) || exclude.contains(name);
		});
		return updates;
	}

	std::string IterationAnalyzer::name() const
	{
		return "iteration";
	}

	std::optional<LoopFinding> IterationAnalyzer::analyze(const Expr &loop, const LoopContext &context) const
	{
		auto shape = recognise_iteration(loop, context);
		if (!shape || any_exit(shape->body))
			return std::nullopt;
		if (!updated_outer_variables(shape->body, { shape->iter.var }).empty())
			return std::nullopt;
		if (std::ranges::any_of(shape->body, mutates_in_place))
			return std::nullopt;

		return finding(EachIntent{ std::move(shape->iter), std::move(shape->body) }, 0.9, name());
	}

	std::string AccumulationAnalyzer::name() const
	{
		return "accumulation";
	}

	std::optional<LoopFinding> AccumulationAnalyzer::analyze(const Expr &loop, const LoopContext &context) const
	{
		auto shape = recognise_iteration(loop, context);
		if (!shape || shape->body.size() != 1)
			return std::nullopt;

		/* peel `if (c) ...` guards without else down to the append */
		std::vector<const Expr *> filters;
		const Expr *stmt = shape->body.front();
		while (stmt && stmt->is(ExprKind::IF) && stmt->children.size() == 2)
		{
			const auto then = source::statements(stmt->child(1));
			if (then.size() != 1)
				return std::nullopt;
			filters.push_back(stmt->child(0));
			stmt = then.front();
		}

		std::string acc;
		const Expr *value = nullptr;
		if (!is_push(stmt, acc, value) || !value || acc == shape->iter.var)
			return std::nullopt;
		if (source::reads(value, acc) || source::contains_exit(value))
			return std::nullopt;
		if (std::ranges::any_of(filters, [&acc](const Expr *f) { return source::reads(f, acc) || source::contains_exit(f); }))
			return std::nullopt;

		const bool starts_empty = context.starts_empty(acc);
		if (filters.empty())
			return finding(MapIntent{ std::move(shape->iter), acc, value, starts_empty }, 0.95, name());

		if (filters.size() == 1 && source::is_local(value, shape->iter.var))
			return finding(FilterIntent{ std::move(shape->iter), acc, filters.front(), starts_empty }, 0.95, name());

		return finding(ComprehensionIntent{ std::move(shape->iter), acc, std::move(filters), value, starts_empty },
		               0.95, name());
	}

	std::string ReductionAnalyzer::name() const
	{
		return "reduction";
	}

	std::optional<LoopFinding> ReductionAnalyzer::analyze(const Expr &loop, const LoopContext &context) const
	{
		auto shape = recognise_iteration(loop, context);
		if (!shape)
			return std::nullopt;

		bool has_signals = false;
		for (const Expr *stmt: shape->body)
		{
			if (is_signal(stmt))
			{
				has_signals = true;
				continue;
			}
			/* exits below the top level stay unlowered */
			if (source::contains_exit(stmt) || mutates_in_place(stmt))
				return std::nullopt;
		}

		auto accumulators = updated_outer_variables(shape->body, { shape->iter.var });
		if (accumulators.empty() && !has_signals)
			return std::nullopt;

		return finding(ReduceIntent{ std::move(shape->iter), std::move(accumulators), std::move(shape->body), has_signals },
		               0.85, name());
	}

	std::string ConditionLoopAnalyzer::name() const
	{
		return "condition-loop";
	}

	std::optional<LoopFinding> ConditionLoopAnalyzer::analyze(const Expr &loop, const LoopContext &) const
	{
		if (!loop.is(ExprKind::WHILE) && !loop.is(ExprKind::DO_WHILE))
			return std::nullopt;

		const Expr *cond = loop.child(0);
		auto body = source::statements(loop.child(1));
		if (!cond || source::contains_exit(cond) || any_exit(body))
			return std::nullopt;
		if (std::ranges::any_of(body, mutates_in_place))
			return std::nullopt;

		auto state = updated_outer_variables(body);
		if (loop.is(ExprKind::WHILE))
			return finding(WhileIntent{ cond, std::move(body), std::move(state) }, 0.5, name());
		return finding(DoWhileIntent{ cond, std::move(body), std::move(state) }, 0.5, name());
	}

	LoopPatternAnalyzer LoopPatternAnalyzer::with_defaults()
	{
		LoopPatternAnalyzer analyzer;
		analyzer.add<AccumulationAnalyzer>()
		        .add<IterationAnalyzer>()
		        .add<ReductionAnalyzer>()
		        .add<ConditionLoopAnalyzer>();
		return analyzer;
	}

	std::optional<LoopFinding> LoopPatternAnalyzer::analyze(const Expr &loop, const LoopContext &context) const
	{
		std::optional<LoopFinding> best;
		for (const auto &analyzer: analyzers)
		{
			auto found = analyzer->analyze(loop, context);
			if (!found || found->confidence <= 0.0)
				continue;
			/* strictly greater keeps the earlier analyzer on a tie */
			if (!best || found->confidence > best->confidence)
				best = std::move(found);
		}
		return best;
	}

	std::vector<LoopFinding> LoopPatternAnalyzer::findings(const Expr &loop, const LoopContext &context) const
	{
		std::vector<LoopFinding> out;
		for (const auto &analyzer: analyzers)
		{
			if (auto found = analyzer->analyze(loop, context))
				out.push_back(std::move(*found));
		}
		return out;
	}

	std::size_t LoopPatternAnalyzer::analyzer_count() const
	{
		return analyzers.size();
	}
}
