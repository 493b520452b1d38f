/* this project is part of the Rill project; licensed under the MIT license. see LICENSE for more info */

#include <rill/source/expr.hpp>

namespace rill::source
{
	namespace
	{
		ExprPtr make(const ExprKind kind)
		{
			auto expr = std::make_unique<Expr>();
			expr->kind = kind;
			return expr;
		}

		ExprPtr with_children(const ExprKind kind, std::vector<ExprPtr> children)
		{
			auto expr = make(kind);
			expr->children = std::move(children);
			return expr;
		}

		bool is_loop(const Expr *expr)
		{
			return expr->is(ExprKind::WHILE) || expr->is(ExprKind::DO_WHILE) ||
			       expr->is(ExprKind::FOR_RANGE) || expr->is(ExprKind::FOR_IN);
		}

		bool contains_exit(const Expr *expr, const bool in_nested_loop)
		{
			if (!expr)
				return false;

			switch (expr->kind)
			{
				case ExprKind::RETURN:
					return true;
				case ExprKind::BREAK:
				case ExprKind::CONTINUE:
					if (!in_nested_loop)
						return true;
					break;
				default:
					break;
			}

			const bool nested = in_nested_loop || is_loop(expr);
			for (const ExprPtr &c: expr->children)
			{
				if (contains_exit(c.get(), nested))
					return true;
			}
			return false;
		}
	}

	const Expr *Expr::child(const std::size_t i) const
	{
		return i < children.size() ? children[i].get() : nullptr;
	}

	ExprPtr local(std::string_view name, const TypeTag type)
	{
		auto expr = make(ExprKind::LOCAL);
		expr->name = name;
		expr->type = type;
		return expr;
	}

	ExprPtr int_const(const std::int64_t value)
	{
		auto expr = make(ExprKind::INT);
		expr->int_value = value;
		expr->type = TypeTag::INT;
		return expr;
	}

	ExprPtr float_const(const double value)
	{
		auto expr = make(ExprKind::FLOAT);
		expr->float_value = value;
		expr->type = TypeTag::FLOAT;
		return expr;
	}

	ExprPtr str_const(std::string_view value)
	{
		auto expr = make(ExprKind::STRING);
		expr->str_value = value;
		expr->type = TypeTag::STRING;
		return expr;
	}

	ExprPtr bool_const(const bool value)
	{
		auto expr = make(ExprKind::BOOL);
		expr->bool_value = value;
		expr->type = TypeTag::BOOL;
		return expr;
	}

	ExprPtr null_const()
	{
		return make(ExprKind::NULL_VALUE);
	}

	ExprPtr binop(std::string_view op, ExprPtr lhs, ExprPtr rhs)
	{
		auto expr = with_children(ExprKind::BINOP, exprs(std::move(lhs), std::move(rhs)));
		expr->op = op;
		return expr;
	}

	ExprPtr unop(std::string_view op, ExprPtr operand)
	{
		auto expr = with_children(ExprKind::UNOP, exprs(std::move(operand)));
		expr->op = op;
		return expr;
	}

	ExprPtr postfix(std::string_view op, ExprPtr operand)
	{
		auto expr = unop(op, std::move(operand));
		expr->postfix = true;
		return expr;
	}

	ExprPtr assign(ExprPtr target, ExprPtr value)
	{
		return with_children(ExprKind::ASSIGN, exprs(std::move(target), std::move(value)));
	}

	ExprPtr assign_op(std::string_view op, ExprPtr target, ExprPtr value)
	{
		auto expr = with_children(ExprKind::ASSIGN_OP, exprs(std::move(target), std::move(value)));
		expr->op = op;
		return expr;
	}

	ExprPtr var_decl(std::string_view name, ExprPtr init, const TypeTag type)
	{
		auto expr = make(ExprKind::VAR_DECL);
		expr->name = name;
		expr->type = type;
		if (init)
			expr->children.push_back(std::move(init));
		return expr;
	}

	ExprPtr block(std::vector<ExprPtr> stmts)
	{
		return with_children(ExprKind::BLOCK, std::move(stmts));
	}

	ExprPtr if_stmt(ExprPtr cond, ExprPtr then_branch, ExprPtr else_branch)
	{
		auto expr = with_children(ExprKind::IF, exprs(std::move(cond), std::move(then_branch)));
		if (else_branch)
			expr->children.push_back(std::move(else_branch));
		return expr;
	}

	ExprPtr while_loop(ExprPtr cond, ExprPtr body)
	{
		return with_children(ExprKind::WHILE, exprs(std::move(cond), std::move(body)));
	}

	ExprPtr do_while(ExprPtr cond, ExprPtr body)
	{
		return with_children(ExprKind::DO_WHILE, exprs(std::move(cond), std::move(body)));
	}

	ExprPtr for_range(std::string_view var, ExprPtr start, ExprPtr end, ExprPtr body)
	{
		auto expr = with_children(ExprKind::FOR_RANGE, exprs(std::move(start), std::move(end), std::move(body)));
		expr->name = var;
		return expr;
	}

	ExprPtr for_in(std::string_view var, ExprPtr collection, ExprPtr body)
	{
		auto expr = with_children(ExprKind::FOR_IN, exprs(std::move(collection), std::move(body)));
		expr->name = var;
		return expr;
	}

	ExprPtr call(std::string_view name, std::vector<ExprPtr> args)
	{
		auto expr = with_children(ExprKind::CALL, std::move(args));
		expr->name = name;
		return expr;
	}

	ExprPtr method_call(ExprPtr receiver, std::string_view name, std::vector<ExprPtr> args)
	{
		auto expr = make(ExprKind::METHOD_CALL);
		expr->name = name;
		expr->children.reserve(args.size() + 1);
		expr->children.push_back(std::move(receiver));
		for (ExprPtr &arg: args)
			expr->children.push_back(std::move(arg));
		return expr;
	}

	ExprPtr field(ExprPtr target, std::string_view name)
	{
		auto expr = with_children(ExprKind::FIELD, exprs(std::move(target)));
		expr->name = name;
		return expr;
	}

	ExprPtr index(ExprPtr target, ExprPtr key)
	{
		return with_children(ExprKind::INDEX, exprs(std::move(target), std::move(key)));
	}

	ExprPtr array(std::vector<ExprPtr> elems)
	{
		auto expr = with_children(ExprKind::ARRAY, std::move(elems));
		expr->type = TypeTag::ARRAY;
		return expr;
	}

	ExprPtr ret(ExprPtr value)
	{
		auto expr = make(ExprKind::RETURN);
		if (value)
			expr->children.push_back(std::move(value));
		return expr;
	}

	ExprPtr brk()
	{
		return make(ExprKind::BREAK);
	}

	ExprPtr cont()
	{
		return make(ExprKind::CONTINUE);
	}

	std::vector<const Expr *> statements(const Expr *body)
	{
		std::vector<const Expr *> out;
		if (!body)
			return out;
		if (!body->is(ExprKind::BLOCK))
		{
			out.push_back(body);
			return out;
		}
		out.reserve(body->children.size());
		for (const ExprPtr &stmt: body->children)
			out.push_back(stmt.get());
		return out;
	}

	bool is_local(const Expr *expr, std::string_view name)
	{
		return expr && expr->is(ExprKind::LOCAL) && expr->name == name;
	}

	bool reads(const Expr *expr, std::string_view name)
	{
		if (!expr)
			return false;
		if (expr->is(ExprKind::LOCAL))
			return expr->name == name;
		for (const ExprPtr &c: expr->children)
		{
			if (reads(c.get(), name))
				return true;
		}
		return false;
	}

	bool contains_exit(const Expr *expr)
	{
		return contains_exit(expr, false);
	}
}
