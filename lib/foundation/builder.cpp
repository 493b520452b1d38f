/* this project is part of the Rill project; licensed under the MIT license. see LICENSE for more info */

#include <stdexcept>
#include <rill/foundation/builder.hpp>

namespace rill::make
{
	NodePtr node(NodeData data)
	{
		return std::make_unique<Node>(Node{ std::move(data) });
	}

	NodePtr var(std::string_view name)
	{
		return node(ast::Var{ std::string(name) });
	}

	NodePtr nil()
	{
		return node(ast::Literal{ LiteralKind::NIL, std::monostate{} });
	}

	NodePtr boolean(const bool value)
	{
		return node(ast::Literal{ LiteralKind::BOOL, value });
	}

	NodePtr integer(const std::int64_t value)
	{
		return node(ast::Literal{ LiteralKind::INT, value });
	}

	NodePtr real(const double value)
	{
		return node(ast::Literal{ LiteralKind::FLOAT, value });
	}

	NodePtr string(std::string_view value)
	{
		return node(ast::Literal{ LiteralKind::STRING, std::string(value) });
	}

	NodePtr atom(std::string_view value)
	{
		return node(ast::Literal{ LiteralKind::ATOM, std::string(value) });
	}

	NodePtr alias(std::string_view module)
	{
		return node(ast::Literal{ LiteralKind::ALIAS, std::string(module) });
	}

	NodePtr raw(std::string_view code)
	{
		return node(ast::Raw{ std::string(code) });
	}

	NodePtr block(std::vector<NodePtr> stmts)
	{
		return node(ast::Block{ std::move(stmts) });
	}

	NodePtr binary(std::string_view op, NodePtr lhs, NodePtr rhs)
	{
		return node(ast::Binary{ std::string(op), std::move(lhs), std::move(rhs) });
	}

	NodePtr unary(std::string_view op, NodePtr operand)
	{
		return node(ast::Unary{ std::string(op), std::move(operand) });
	}

	NodePtr match(PatternPtr pattern, NodePtr value)
	{
		return node(ast::Match{ std::move(pattern), std::move(value) });
	}

	NodePtr assign(std::string_view name, NodePtr value)
	{
		return match(bind(name), std::move(value));
	}

	NodePtr if_else(NodePtr cond, NodePtr then_branch, NodePtr else_branch)
	{
		return node(ast::If{ std::move(cond), std::move(then_branch), std::move(else_branch) });
	}

	ast::Clause clause(PatternPtr pattern, NodePtr body, NodePtr guard)
	{
		return ast::Clause{ std::move(pattern), std::move(guard), std::move(body) };
	}

	NodePtr case_of(NodePtr subject, std::vector<ast::Clause> clauses)
	{
		return node(ast::Case{ std::move(subject), std::move(clauses) });
	}

	NodePtr with(std::vector<ast::WithClause> clauses, NodePtr body, std::vector<ast::Clause> else_clauses)
	{
		return node(ast::With{ std::move(clauses), std::move(body), std::move(else_clauses) });
	}

	ast::Generator generator(PatternPtr pattern, NodePtr source)
	{
		return ast::Generator{ std::move(pattern), std::move(source) };
	}

	NodePtr comprehension(std::vector<ast::Generator> generators, std::vector<NodePtr> filters, NodePtr body,
	                      NodePtr into)
	{
		return node(ast::For{ std::move(generators), std::move(filters), std::move(into), std::move(body) });
	}

	NodePtr fn(std::vector<PatternPtr> params, NodePtr body)
	{
		std::vector<ast::FnClause> clauses;
		clauses.push_back(ast::FnClause{ std::move(params), nullptr, std::move(body) });
		return fn(std::move(clauses));
	}

	NodePtr fn(std::vector<ast::FnClause> clauses)
	{
		if (clauses.empty())
			throw std::invalid_argument("anonymous function requires at least one clause");
		return node(ast::Fn{ std::move(clauses) });
	}

	NodePtr call(std::string_view name, std::vector<NodePtr> args)
	{
		return node(ast::Call{ std::string(name), std::move(args) });
	}

	NodePtr remote(NodePtr target, std::string_view name, std::vector<NodePtr> args)
	{
		return node(ast::RemoteCall{ std::move(target), std::string(name), std::move(args) });
	}

	NodePtr remote(std::string_view module, std::string_view name, std::vector<NodePtr> args)
	{
		return remote(alias(module), name, std::move(args));
	}

	NodePtr apply(NodePtr fun, std::vector<NodePtr> args)
	{
		return node(ast::Apply{ std::move(fun), std::move(args) });
	}

	NodePtr field(NodePtr target, std::string_view name)
	{
		return node(ast::Field{ std::move(target), std::string(name) });
	}

	NodePtr index(NodePtr target, NodePtr key)
	{
		return node(ast::Index{ std::move(target), std::move(key) });
	}

	NodePtr list(std::vector<NodePtr> elems)
	{
		return node(ast::List{ std::move(elems) });
	}

	NodePtr tuple(std::vector<NodePtr> elems)
	{
		return node(ast::Tuple{ std::move(elems) });
	}

	NodePtr map(std::vector<ast::MapEntry> entries)
	{
		return node(ast::Map{ std::move(entries) });
	}

	NodePtr structure(std::string_view module, std::vector<ast::StructField> fields)
	{
		return node(ast::Struct{ std::string(module), std::move(fields) });
	}

	NodePtr try_rescue(NodePtr body, std::vector<ast::Clause> rescue_clauses, std::vector<ast::Clause> catch_clauses,
	                   NodePtr after)
	{
		return node(ast::Try{ std::move(body), std::move(rescue_clauses), std::move(catch_clauses), std::move(after) });
	}

	NodePtr receive(std::vector<ast::Clause> clauses, NodePtr after_timeout, NodePtr after_body)
	{
		return node(ast::Receive{ std::move(clauses), std::move(after_timeout), std::move(after_body) });
	}

	NodePtr def(std::string_view name, std::vector<PatternPtr> params, NodePtr body, const bool is_private,
	            NodePtr guard)
	{
		return node(ast::Def{ std::string(name), std::move(params), std::move(guard), std::move(body), is_private });
	}

	NodePtr module(std::string_view name, std::vector<NodePtr> body)
	{
		return node(ast::Module{ std::string(name), std::move(body) });
	}

	PatternPtr pattern(PatternData data)
	{
		return std::make_unique<Pattern>(Pattern{ std::move(data) });
	}

	PatternPtr bind(std::string_view name)
	{
		return pattern(pat::Bind{ std::string(name) });
	}

	PatternPtr wildcard()
	{
		return bind("_");
	}

	PatternPtr pin(std::string_view name)
	{
		return pattern(pat::Pin{ std::string(name) });
	}

	PatternPtr plit(NodePtr literal)
	{
		const auto *lit = as<ast::Literal>(literal.get());
		if (!lit)
			throw std::invalid_argument("literal pattern requires a literal node");
		return pattern(pat::Literal{ *lit });
	}

	PatternPtr ptuple(std::vector<PatternPtr> elems)
	{
		return pattern(pat::Tuple{ std::move(elems) });
	}

	PatternPtr plist(std::vector<PatternPtr> elems)
	{
		return pattern(pat::List{ std::move(elems) });
	}

	PatternPtr cons(PatternPtr head, PatternPtr tail)
	{
		return pattern(pat::Cons{ std::move(head), std::move(tail) });
	}

	PatternPtr pmap(std::vector<pat::MapEntry> entries)
	{
		return pattern(pat::Map{ std::move(entries) });
	}

	PatternPtr pstruct(std::string_view module, std::vector<pat::StructField> fields)
	{
		return pattern(pat::Struct{ std::string(module), std::move(fields) });
	}

	PatternPtr palias(PatternPtr pattern, std::string_view name)
	{
		return make::pattern(pat::Alias{ std::move(pattern), std::string(name) });
	}

	PatternPtr pbinary(std::vector<pat::Segment> segments)
	{
		return pattern(pat::Binary{ std::move(segments) });
	}
}
