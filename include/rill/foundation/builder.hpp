/* this project is part of the Rill project; licensed under the MIT license. see LICENSE for more info */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <rill/foundation/ast.hpp>

/* factory helpers for target AST construction. they are used by the
 * loop lowering, by rewrite passes that synthesize nodes and by tests */
namespace rill::make
{
	/**
	 * @brief Collect move-only node pointers into a vector
	 * @note `std::initializer_list` copies, so braces cannot be used here
	 */
	template<typename... Ts>
	std::vector<NodePtr> nodes(Ts&&... items)
	{
		std::vector<NodePtr> out;
		out.reserve(sizeof...(items));
		(out.push_back(std::forward<Ts>(items)), ...);
		return out;
	}

	template<typename... Ts>
	std::vector<PatternPtr> patterns(Ts&&... items)
	{
		std::vector<PatternPtr> out;
		out.reserve(sizeof...(items));
		(out.push_back(std::forward<Ts>(items)), ...);
		return out;
	}

	NodePtr node(NodeData data);

	NodePtr var(std::string_view name);

	NodePtr nil();

	NodePtr boolean(bool value);

	NodePtr integer(std::int64_t value);

	NodePtr real(double value);

	NodePtr string(std::string_view value);

	NodePtr atom(std::string_view value);

	NodePtr alias(std::string_view module);

	NodePtr raw(std::string_view code);

	NodePtr block(std::vector<NodePtr> stmts);

	NodePtr binary(std::string_view op, NodePtr lhs, NodePtr rhs);

	NodePtr unary(std::string_view op, NodePtr operand);

	NodePtr match(PatternPtr pattern, NodePtr value);

	/**
	 * @brief `name = value`
	 */
	NodePtr assign(std::string_view name, NodePtr value);

	NodePtr if_else(NodePtr cond, NodePtr then_branch, NodePtr else_branch = nullptr);

	ast::Clause clause(PatternPtr pattern, NodePtr body, NodePtr guard = nullptr);

	NodePtr case_of(NodePtr subject, std::vector<ast::Clause> clauses);

	NodePtr with(std::vector<ast::WithClause> clauses, NodePtr body, std::vector<ast::Clause> else_clauses = {});

	ast::Generator generator(PatternPtr pattern, NodePtr source);

	NodePtr comprehension(std::vector<ast::Generator> generators, std::vector<NodePtr> filters, NodePtr body,
	                      NodePtr into = nullptr);

	/**
	 * @brief Single clause anonymous function
	 */
	NodePtr fn(std::vector<PatternPtr> params, NodePtr body);

	NodePtr fn(std::vector<ast::FnClause> clauses);

	NodePtr call(std::string_view name, std::vector<NodePtr> args = {});

	NodePtr remote(NodePtr target, std::string_view name, std::vector<NodePtr> args = {});

	/**
	 * @brief `Module.name(args)` with an alias target
	 */
	NodePtr remote(std::string_view module, std::string_view name, std::vector<NodePtr> args = {});

	NodePtr apply(NodePtr fun, std::vector<NodePtr> args = {});

	NodePtr field(NodePtr target, std::string_view name);

	NodePtr index(NodePtr target, NodePtr key);

	NodePtr list(std::vector<NodePtr> elems = {});

	NodePtr tuple(std::vector<NodePtr> elems = {});

	NodePtr map(std::vector<ast::MapEntry> entries = {});

	NodePtr structure(std::string_view module, std::vector<ast::StructField> fields);

	NodePtr try_rescue(NodePtr body, std::vector<ast::Clause> rescue_clauses, std::vector<ast::Clause> catch_clauses = {},
	                   NodePtr after = nullptr);

	NodePtr receive(std::vector<ast::Clause> clauses, NodePtr after_timeout = nullptr, NodePtr after_body = nullptr);

	NodePtr def(std::string_view name, std::vector<PatternPtr> params, NodePtr body, bool is_private = false,
	            NodePtr guard = nullptr);

	NodePtr module(std::string_view name, std::vector<NodePtr> body);

	PatternPtr pattern(PatternData data);

	PatternPtr bind(std::string_view name);

	PatternPtr wildcard();

	PatternPtr pin(std::string_view name);

	PatternPtr plit(NodePtr literal);

	PatternPtr ptuple(std::vector<PatternPtr> elems);

	PatternPtr plist(std::vector<PatternPtr> elems);

	PatternPtr cons(PatternPtr head, PatternPtr tail);

	PatternPtr pmap(std::vector<pat::MapEntry> entries);

	PatternPtr pstruct(std::string_view module, std::vector<pat::StructField> fields);

	PatternPtr palias(PatternPtr pattern, std::string_view name);

	PatternPtr pbinary(std::vector<pat::Segment> segments);
}
