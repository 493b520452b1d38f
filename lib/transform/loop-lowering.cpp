/* this project is part of the Rill project; licensed under the MIT license. see LICENSE for more info */

#include <format>
#include <stdexcept>
#include <type_traits>
#include <rill/foundation/builder.hpp>
#include <rill/transform/loop-lowering.hpp>

namespace rill
{
	using source::Expr;
	using source::ExprKind;

	struct LoweringDepth
	{
		explicit LoweringDepth(const LoopLowering &lowering) : lowering(lowering)
		{
			++lowering.depth;
		}

		~LoweringDepth()
		{
			--lowering.depth;
		}

		LoweringDepth(const LoweringDepth &) = delete;
		LoweringDepth &operator=(const LoweringDepth &) = delete;

		const LoopLowering &lowering;
	};

	namespace
	{
		NodePtr sequence(std::vector<NodePtr> stmts)
		{
			if (stmts.empty())
				return make::nil();
			if (stmts.size() == 1)
				return std::move(stmts.front());
			return make::block(std::move(stmts));
		}

		PatternPtr state_pattern(const std::vector<std::string> &names)
		{
			if (names.empty())
				return make::bind("_acc");
			if (names.size() == 1)
				return make::bind(names.front());

			std::vector<PatternPtr> elems;
			for (const std::string &name: names)
				elems.push_back(make::bind(name));
			return make::ptuple(std::move(elems));
		}

		NodePtr state_value(const std::vector<std::string> &names)
		{
			if (names.empty())
				return make::nil();
			if (names.size() == 1)
				return make::var(names.front());

			std::vector<NodePtr> elems;
			for (const std::string &name: names)
				elems.push_back(make::var(name));
			return make::tuple(std::move(elems));
		}

		NodePtr signal(std::string_view tag, const std::vector<std::string> &state)
		{
			return make::tuple(make::nodes(make::atom(tag), state_value(state)));
		}

		/**
		 * @brief `acc = value` when the accumulator starts empty, `acc = acc ++ value` otherwise
		 */
		NodePtr bind_result(const std::string &acc, NodePtr value, const bool starts_empty)
		{
			if (starts_empty)
				return make::assign(acc, std::move(value));
			return make::assign(acc, make::binary("++", make::var(acc), std::move(value)));
		}

		std::optional<std::int64_t> constant(const Expr *expr)
		{
			if (expr && expr->is(ExprKind::INT))
				return expr->int_value;
			return std::nullopt;
		}

		bool is_signal_stmt(const Expr *stmt, bool &halts)
		{
			if (!stmt || !stmt->is(ExprKind::IF) || stmt->children.size() != 2)
				return false;
			const auto then = source::statements(stmt->child(1));
			if (then.size() != 1)
				return false;
			if (then[0]->is(ExprKind::BREAK))
			{
				halts = true;
				return true;
			}
			if (then[0]->is(ExprKind::CONTINUE))
			{
				halts = false;
				return true;
			}
			return false;
		}
	}

	LoopLowering::LoopLowering(ExprBuilder builder) : builder(std::move(builder)) {}

	NodePtr LoopLowering::lower(const LoopIntent &intent) const
	{
		LoweringDepth guard(*this);
		return std::visit([this]<typename T>(const T &i) -> NodePtr
		{
			if constexpr (std::is_same_v<T, EachIntent>)
				return lower_each(i);
			else if constexpr (std::is_same_v<T, MapIntent>)
				return lower_map(i);
			else if constexpr (std::is_same_v<T, FilterIntent>)
				return lower_filter(i);
			else if constexpr (std::is_same_v<T, ComprehensionIntent>)
				return lower_comprehension(i);
			else if constexpr (std::is_same_v<T, ReduceIntent>)
				return lower_reduce(i);
			else if constexpr (std::is_same_v<T, WhileIntent>)
				return lower_while(i.body, i.cond, i.state, true);
			else
				return lower_while(i.body, i.cond, i.state, false);
		}, intent);
	}

	NodePtr LoopLowering::lower_loop(const Expr &loop, const LoopContext &context,
	                                 const LoopPatternAnalyzer &analyzer) const
	{
		const auto found = analyzer.analyze(loop, context);
		if (!found)
			return nullptr;
		return lower(found->intent);
	}

	NodePtr LoopLowering::build(const Expr *expr) const
	{
		if (!expr)
			return make::nil();

		NodePtr node = builder(*expr);
		if (!node)
			throw std::runtime_error("LoopLowering: expression builder returned null");
		return node;
	}

	NodePtr LoopLowering::source_of(const Iteration &iter) const
	{
		if (!iter.is_range())
			return build(iter.collection);

		const RangeSpec &spec = *iter.range;
		const auto first = spec.start ? constant(spec.start) : std::optional<std::int64_t>(0);
		const auto bound = constant(spec.end);

		NodePtr start = spec.start ? build(spec.start) : make::integer(0);
		NodePtr last;
		std::optional<std::int64_t> last_value;
		if (spec.inclusive)
		{
			last = build(spec.end);
			last_value = bound;
		}
		else if (bound)
		{
			last_value = *bound - 1;
			last = make::integer(*last_value);
		}
		else
		{
			last = make::binary("-", build(spec.end), make::integer(1));
		}

		NodePtr range = make::binary("..", std::move(start), std::move(last));

		/* an explicit step keeps a possibly empty range from counting down */
		const bool ascending = first && last_value && *last_value >= *first;
		if (spec.step != 1 || !ascending)
			range = make::binary("//", std::move(range), make::integer(spec.step));
		return range;
	}

	NodePtr LoopLowering::lower_each(const EachIntent &intent) const
	{
		NodePtr body = sequence(lower_stmts(intent.body));
		return make::remote("Enum", "each", make::nodes(
			source_of(intent.iter),
			make::fn(make::patterns(make::bind(intent.iter.var)), std::move(body))
		));
	}

	NodePtr LoopLowering::lower_map(const MapIntent &intent) const
	{
		NodePtr call = make::remote("Enum", "map", make::nodes(
			source_of(intent.iter),
			make::fn(make::patterns(make::bind(intent.iter.var)), build(intent.transform))
		));
		return bind_result(intent.accumulator, std::move(call), intent.starts_empty);
	}

	NodePtr LoopLowering::lower_filter(const FilterIntent &intent) const
	{
		NodePtr call = make::remote("Enum", "filter", make::nodes(
			source_of(intent.iter),
			make::fn(make::patterns(make::bind(intent.iter.var)), build(intent.predicate))
		));
		return bind_result(intent.accumulator, std::move(call), intent.starts_empty);
	}

	NodePtr LoopLowering::lower_comprehension(const ComprehensionIntent &intent) const
	{
		std::vector<ast::Generator> generators;
		generators.push_back(make::generator(make::bind(intent.iter.var), source_of(intent.iter)));

		std::vector<NodePtr> filters;
		for (const Expr *filter: intent.filters)
			filters.push_back(build(filter));

		NodePtr comprehension = make::comprehension(std::move(generators), std::move(filters), build(intent.transform));
		return bind_result(intent.accumulator, std::move(comprehension), intent.starts_empty);
	}

	NodePtr LoopLowering::lower_reduce(const ReduceIntent &intent) const
	{
		const auto &state = intent.accumulators;

		NodePtr step;
		if (intent.has_signals)
		{
			step = lower_signals(intent.body, 0, state);
		}
		else
		{
			std::vector<NodePtr> stmts = lower_stmts(intent.body);
			stmts.push_back(state_value(state));
			step = sequence(std::move(stmts));
		}

		NodePtr call = make::remote("Enum", intent.has_signals ? "reduce_while" : "reduce", make::nodes(
			source_of(intent.iter),
			state_value(state),
			make::fn(make::patterns(make::bind(intent.iter.var), state_pattern(state)), std::move(step))
		));

		if (state.empty())
			return call;
		return make::match(state_pattern(state), std::move(call));
	}

	NodePtr LoopLowering::lower_signals(const std::vector<const Expr *> &stmts, const std::size_t from,
	                                    const std::vector<std::string> &state) const
	{
		std::vector<NodePtr> out;
		for (std::size_t i = from; i < stmts.size(); ++i)
		{
			bool halts = false;
			if (!is_signal_stmt(stmts[i], halts))
			{
				lower_stmt(stmts[i], out);
				continue;
			}

			out.push_back(make::if_else(
				build(stmts[i]->child(0)),
				signal(halts ? "halt" : "cont", state),
				lower_signals(stmts, i + 1, state)
			));
			return sequence(std::move(out));
		}

		/* falling off the end continues the fold */
		out.push_back(signal("cont", state));
		return sequence(std::move(out));
	}

	NodePtr LoopLowering::lower_while(const std::vector<const Expr *> &body, const Expr *cond,
	                                  const std::vector<std::string> &state, const bool check_first) const
	{
		const std::string name = depth <= 1 ? std::string("loop_fn") : std::format("loop_fn_{}", depth - 1);

		const auto recurse = [&]
		{
			std::vector<NodePtr> args = make::nodes(make::var(name));
			if (!state.empty())
				args.push_back(state_value(state));
			return make::apply(make::var(name), std::move(args));
		};
		const auto finish = [&]
		{
			return state.empty() ? make::nil() : state_value(state);
		};

		NodePtr fn_body;
		if (check_first)
		{
			std::vector<NodePtr> then = lower_stmts(body);
			then.push_back(recurse());
			fn_body = make::if_else(build(cond), sequence(std::move(then)), finish());
		}
		else
		{
			std::vector<NodePtr> stmts = lower_stmts(body);
			stmts.push_back(make::if_else(build(cond), recurse(), finish()));
			fn_body = sequence(std::move(stmts));
		}

		std::vector<PatternPtr> params = make::patterns(make::bind(name));
		if (!state.empty())
			params.push_back(state_pattern(state));

		std::vector<NodePtr> out;
		out.push_back(make::assign(name, make::fn(std::move(params), std::move(fn_body))));
		if (state.empty())
			out.push_back(recurse());
		else
			out.push_back(make::match(state_pattern(state), recurse()));
		return make::block(std::move(out));
	}

	std::vector<NodePtr> LoopLowering::lower_stmts(const std::vector<const Expr *> &stmts) const
	{
		std::vector<NodePtr> out;
		for (const Expr *stmt: stmts)
			lower_stmt(stmt, out);
		return out;
	}

	void LoopLowering::lower_stmt(const Expr *stmt, std::vector<NodePtr> &out) const
	{
		if (!stmt)
			return;

		const Expr *target = stmt->child(0);
		const bool local_target = target && target->is(ExprKind::LOCAL);
		switch (stmt->kind)
		{
			case ExprKind::BLOCK:
				for (const source::ExprPtr &child: stmt->children)
					lower_stmt(child.get(), out);
				return;

			case ExprKind::VAR_DECL:
				out.push_back(make::assign(stmt->name, build(stmt->child(0))));
				return;

			case ExprKind::ASSIGN:
				if (!local_target)
					break;
				out.push_back(make::assign(target->name, build(stmt->child(1))));
				return;

			case ExprKind::ASSIGN_OP:
				if (!local_target)
					break;
				out.push_back(make::assign(target->name, compound(*target, stmt->op, stmt->child(1))));
				return;

			case ExprKind::UNOP:
				if (!local_target || (stmt->op != "++" && stmt->op != "--"))
					break;
				out.push_back(make::assign(target->name, make::binary(
					stmt->op == "++" ? "+" : "-", make::var(target->name), make::integer(1))));
				return;

			case ExprKind::METHOD_CALL:
				if (!local_target || stmt->name != "push" || stmt->children.size() != 2)
					break;
				out.push_back(make::assign(target->name, make::binary(
					"++", make::var(target->name), make::list(make::nodes(build(stmt->child(1)))))));
				return;

			case ExprKind::IF:
			{
				std::vector<const Expr *> branches;
				branches.push_back(stmt->child(1));
				if (const Expr *otherwise = stmt->child(2))
					branches.push_back(otherwise);
				const auto updated = updated_outer_variables(branches);

				std::vector<NodePtr> then = lower_stmts(source::statements(stmt->child(1)));
				if (updated.empty())
				{
					NodePtr otherwise = stmt->child(2) ? sequence(lower_stmts(source::statements(stmt->child(2)))) : nullptr;
					out.push_back(make::if_else(build(stmt->child(0)), sequence(std::move(then)), std::move(otherwise)));
					return;
				}

				/* branches rebind outer names; the if yields their new values */
				std::vector<NodePtr> otherwise = lower_stmts(source::statements(stmt->child(2)));
				then.push_back(state_value(updated));
				otherwise.push_back(state_value(updated));
				out.push_back(make::match(state_pattern(updated), make::if_else(
					build(stmt->child(0)), sequence(std::move(then)), sequence(std::move(otherwise)))));
				return;
			}

			default:
				break;
		}
		out.push_back(build(stmt));
	}

	NodePtr LoopLowering::compound(const Expr &target, const std::string &op, const Expr *value) const
	{
		NodePtr lhs = make::var(target.name);
		NodePtr rhs = build(value);

		const bool text = target.type == source::TypeTag::STRING || (value && value->type == source::TypeTag::STRING);
		if (op == "+" && text)
			return make::binary("<>", std::move(lhs), std::move(rhs));
		if (op == "%")
			return make::call("rem", make::nodes(std::move(lhs), std::move(rhs)));
		if (op == "/" && target.type == source::TypeTag::INT)
			return make::call("div", make::nodes(std::move(lhs), std::move(rhs)));
		return make::binary(op, std::move(lhs), std::move(rhs));
	}
}
