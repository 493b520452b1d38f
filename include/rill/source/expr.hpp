/* this project is part of the Rill project; licensed under the MIT license. see LICENSE for more info */

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

/* the typed, already-resolved imperative input tree. only the loop
 * analysis reads it directly; everything else sees it through an
 * expression builder callback */
namespace rill::source
{
	/**
	 * @brief Kind of an input expression
	 * @note Child layout per kind is documented on each enumerator
	 */
	enum class ExprKind : std::uint8_t
	{
		/** @brief Local variable read; `name` */
		LOCAL,
		/** @brief Integer constant; `int_value` */
		INT,
		/** @brief Float constant; `float_value` */
		FLOAT,
		/** @brief String constant; `str_value` */
		STRING,
		/** @brief Boolean constant; `bool_value` */
		BOOL,
		/** @brief `null` */
		NULL_VALUE,
		/** @brief Binary operator `op`; [lhs, rhs] */
		BINOP,
		/** @brief Unary operator `op` incl. `++`/`--`; [operand]; `postfix` */
		UNOP,
		/** @brief Plain assignment; [target, value] */
		ASSIGN,
		/** @brief Compound assignment `op=`; [target, value] */
		ASSIGN_OP,
		/** @brief Local declaration `name`; [init] or [] */
		VAR_DECL,
		/** @brief Statement sequence; [stmts...] */
		BLOCK,
		/** @brief [cond, then] or [cond, then, else] */
		IF,
		/** @brief [cond, body] */
		WHILE,
		/** @brief [cond, body]; body runs before the first check */
		DO_WHILE,
		/** @brief Counted loop `for (name in start...end)`, end exclusive; [start, end, body] */
		FOR_RANGE,
		/** @brief Collection loop `for (name in coll)`; [collection, body] */
		FOR_IN,
		/** @brief Free function call `name`; [args...] */
		CALL,
		/** @brief Method call `name`; [receiver, args...] */
		METHOD_CALL,
		/** @brief Field read `name`; [target] */
		FIELD,
		/** @brief Indexed read; [target, index] */
		INDEX,
		/** @brief Array literal; [elems...] */
		ARRAY,
		/** @brief [value] or [] */
		RETURN,
		BREAK,
		CONTINUE
	};

	/**
	 * @brief Coarse static type resolved by the front-end
	 */
	enum class TypeTag : std::uint8_t
	{
		UNKNOWN,
		VOID,
		INT,
		FLOAT,
		BOOL,
		STRING,
		ARRAY,
		MAP,
		OBJECT,
		DYNAMIC
	};

	struct Expr;
	using ExprPtr = std::unique_ptr<Expr>;

	struct Expr
	{
		ExprKind kind = ExprKind::NULL_VALUE;
		TypeTag type = TypeTag::UNKNOWN;
		std::string name;
		std::string op;
		std::string str_value;
		std::int64_t int_value = 0;
		double float_value = 0.0;
		bool bool_value = false;
		bool postfix = false;
		std::vector<ExprPtr> children;

		/**
		 * @brief Get the child at `i`
		 * @return Child or null when the node has fewer children
		 */
		[[nodiscard]] const Expr *child(std::size_t i) const;

		[[nodiscard]] bool is(ExprKind k) const
		{
			return kind == k;
		}
	};

	template<typename... Ts>
	std::vector<ExprPtr> exprs(Ts&&... items)
	{
		std::vector<ExprPtr> out;
		out.reserve(sizeof...(items));
		(out.push_back(std::forward<Ts>(items)), ...);
		return out;
	}

	ExprPtr local(std::string_view name, TypeTag type = TypeTag::UNKNOWN);

	ExprPtr int_const(std::int64_t value);

	ExprPtr float_const(double value);

	ExprPtr str_const(std::string_view value);

	ExprPtr bool_const(bool value);

	ExprPtr null_const();

	ExprPtr binop(std::string_view op, ExprPtr lhs, ExprPtr rhs);

	/**
	 * @brief Prefix unary operator e.g. `-x`, `!x`, `++i`
	 */
	ExprPtr unop(std::string_view op, ExprPtr operand);

	/**
	 * @brief Postfix `i++` / `i--`
	 */
	ExprPtr postfix(std::string_view op, ExprPtr operand);

	ExprPtr assign(ExprPtr target, ExprPtr value);

	ExprPtr assign_op(std::string_view op, ExprPtr target, ExprPtr value);

	ExprPtr var_decl(std::string_view name, ExprPtr init = nullptr, TypeTag type = TypeTag::UNKNOWN);

	ExprPtr block(std::vector<ExprPtr> stmts);

	ExprPtr if_stmt(ExprPtr cond, ExprPtr then_branch, ExprPtr else_branch = nullptr);

	ExprPtr while_loop(ExprPtr cond, ExprPtr body);

	ExprPtr do_while(ExprPtr cond, ExprPtr body);

	ExprPtr for_range(std::string_view var, ExprPtr start, ExprPtr end, ExprPtr body);

	ExprPtr for_in(std::string_view var, ExprPtr collection, ExprPtr body);

	ExprPtr call(std::string_view name, std::vector<ExprPtr> args = {});

	ExprPtr method_call(ExprPtr receiver, std::string_view name, std::vector<ExprPtr> args = {});

	ExprPtr field(ExprPtr target, std::string_view name);

	ExprPtr index(ExprPtr target, ExprPtr key);

	ExprPtr array(std::vector<ExprPtr> elems = {});

	ExprPtr ret(ExprPtr value = nullptr);

	ExprPtr brk();

	ExprPtr cont();

	/**
	 * @brief Statements of a loop body; a non-block body is a single statement
	 */
	[[nodiscard]] std::vector<const Expr *> statements(const Expr *body);

	/**
	 * @brief Check whether an expression is a read of local `name`
	 */
	[[nodiscard]] bool is_local(const Expr *expr, std::string_view name);

	/**
	 * @brief Check whether `name` is read anywhere inside `expr`
	 */
	[[nodiscard]] bool reads(const Expr *expr, std::string_view name);

	/**
	 * @brief Check whether the subtree contains a `break`, `continue` or `return`
	 *
	 * Exits belonging to nested loops are ignored for `break` and `continue`
	 * since they do not leave the loop being inspected.
	 */
	[[nodiscard]] bool contains_exit(const Expr *expr);
}
