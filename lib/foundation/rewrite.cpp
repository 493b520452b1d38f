/* this project is part of the Rill project; licensed under the MIT license. see LICENSE for more info */

#include <type_traits>
#include <rill/foundation/rewrite.hpp>

namespace rill
{
	namespace
	{
		void apply(NodePtr &slot, const NodeRewrite &fn)
		{
			if (slot)
				slot = fn(std::move(slot));
		}

		void apply_all(std::vector<NodePtr> &slots, const NodeRewrite &fn)
		{
			for (NodePtr &slot: slots)
				apply(slot, fn);
		}

		void apply_clauses(std::vector<ast::Clause> &clauses, const NodeRewrite &fn)
		{
			for (ast::Clause &c: clauses)
			{
				apply(c.guard, fn);
				apply(c.body, fn);
			}
		}

		struct ChildMapper
		{
			const NodeRewrite &fn;

			void operator()(ast::Var &) const {}
			void operator()(ast::Literal &) const {}
			void operator()(ast::Raw &) const {}

			void operator()(ast::Block &n) const
			{
				apply_all(n.stmts, fn);
			}

			void operator()(ast::Binary &n) const
			{
				apply(n.lhs, fn);
				apply(n.rhs, fn);
			}

			void operator()(ast::Unary &n) const
			{
				apply(n.operand, fn);
			}

			void operator()(ast::Match &n) const
			{
				apply(n.value, fn);
			}

			void operator()(ast::If &n) const
			{
				apply(n.cond, fn);
				apply(n.then_branch, fn);
				apply(n.else_branch, fn);
			}

			void operator()(ast::Case &n) const
			{
				apply(n.subject, fn);
				apply_clauses(n.clauses, fn);
			}

			void operator()(ast::With &n) const
			{
				for (ast::WithClause &c: n.clauses)
					apply(c.value, fn);
				apply(n.body, fn);
				apply_clauses(n.else_clauses, fn);
			}

			void operator()(ast::For &n) const
			{
				for (ast::Generator &g: n.generators)
					apply(g.source, fn);
				apply_all(n.filters, fn);
				apply(n.into, fn);
				apply(n.body, fn);
			}

			void operator()(ast::Fn &n) const
			{
				for (ast::FnClause &c: n.clauses)
				{
					apply(c.guard, fn);
					apply(c.body, fn);
				}
			}

			void operator()(ast::Call &n) const
			{
				apply_all(n.args, fn);
			}

			void operator()(ast::RemoteCall &n) const
			{
				apply(n.target, fn);
				apply_all(n.args, fn);
			}

			void operator()(ast::Apply &n) const
			{
				apply(n.fun, fn);
				apply_all(n.args, fn);
			}

			void operator()(ast::Field &n) const
			{
				apply(n.target, fn);
			}

			void operator()(ast::Index &n) const
			{
				apply(n.target, fn);
				apply(n.key, fn);
			}

			void operator()(ast::List &n) const
			{
				apply_all(n.elems, fn);
			}

			void operator()(ast::Tuple &n) const
			{
				apply_all(n.elems, fn);
			}

			void operator()(ast::Map &n) const
			{
				for (ast::MapEntry &e: n.entries)
				{
					apply(e.key, fn);
					apply(e.value, fn);
				}
			}

			void operator()(ast::Struct &n) const
			{
				for (ast::StructField &f: n.fields)
					apply(f.value, fn);
			}

			void operator()(ast::Try &n) const
			{
				apply(n.body, fn);
				apply_clauses(n.rescue_clauses, fn);
				apply_clauses(n.catch_clauses, fn);
				apply(n.after, fn);
			}

			void operator()(ast::Receive &n) const
			{
				apply_clauses(n.clauses, fn);
				apply(n.after_timeout, fn);
				apply(n.after_body, fn);
			}

			void operator()(ast::Def &n) const
			{
				apply(n.guard, fn);
				apply(n.body, fn);
			}

			void operator()(ast::Module &n) const
			{
				apply_all(n.body, fn);
			}
		};

		void visit_clause_patterns(std::vector<ast::Clause> &clauses, const std::function<void(Pattern &)> &fn)
		{
			for (ast::Clause &c: clauses)
			{
				if (c.pattern)
					fn(*c.pattern);
			}
		}

		void visit_params(std::vector<PatternPtr> &params, const std::function<void(Pattern &)> &fn)
		{
			for (PatternPtr &p: params)
			{
				if (p)
					fn(*p);
			}
		}

		struct PatternRenamer
		{
			const std::function<void(std::string &)> &fn;
			bool include_pins;

			void rename(PatternPtr &p) const
			{
				if (p)
					std::visit(*this, p->data);
			}

			void operator()(pat::Bind &p) const
			{
				if (!is_wildcard(p.name))
					fn(p.name);
			}

			void operator()(pat::Literal &) const {}

			void operator()(pat::Tuple &p) const
			{
				for (PatternPtr &e: p.elems)
					rename(e);
			}

			void operator()(pat::List &p) const
			{
				for (PatternPtr &e: p.elems)
					rename(e);
			}

			void operator()(pat::Cons &p) const
			{
				rename(p.head);
				rename(p.tail);
			}

			void operator()(pat::Map &p) const
			{
				for (pat::MapEntry &e: p.entries)
				{
					rename(e.key);
					rename(e.value);
				}
			}

			void operator()(pat::Struct &p) const
			{
				for (pat::StructField &f: p.fields)
					rename(f.value);
			}

			void operator()(pat::Pin &p) const
			{
				if (include_pins)
					fn(p.name);
			}

			void operator()(pat::Alias &p) const
			{
				rename(p.pattern);
				fn(p.name);
			}

			void operator()(pat::Binary &p) const
			{
				for (pat::Segment &s: p.segments)
					rename(s.value);
			}
		};
	}

	void map_children(Node &node, const NodeRewrite &fn)
	{
		std::visit(ChildMapper{ fn }, node.data);
	}

	void for_each_pattern(Node &node, const std::function<void(Pattern &)> &fn)
	{
		std::visit([&fn]<typename T>(T &n)
		{
			if constexpr (std::is_same_v<T, ast::Match>)
			{
				if (n.pattern)
					fn(*n.pattern);
			}
			else if constexpr (std::is_same_v<T, ast::Case> || std::is_same_v<T, ast::Receive>)
			{
				visit_clause_patterns(n.clauses, fn);
			}
			else if constexpr (std::is_same_v<T, ast::With>)
			{
				for (ast::WithClause &c: n.clauses)
				{
					if (c.pattern)
						fn(*c.pattern);
				}
				visit_clause_patterns(n.else_clauses, fn);
			}
			else if constexpr (std::is_same_v<T, ast::For>)
			{
				for (ast::Generator &g: n.generators)
				{
					if (g.pattern)
						fn(*g.pattern);
				}
			}
			else if constexpr (std::is_same_v<T, ast::Fn>)
			{
				for (ast::FnClause &c: n.clauses)
					visit_params(c.params, fn);
			}
			else if constexpr (std::is_same_v<T, ast::Try>)
			{
				visit_clause_patterns(n.rescue_clauses, fn);
				visit_clause_patterns(n.catch_clauses, fn);
			}
			else if constexpr (std::is_same_v<T, ast::Def>)
			{
				visit_params(n.params, fn);
			}
		}, node.data);
	}

	NodePtr rewrite_bottom_up(NodePtr node, const NodeRewrite &fn)
	{
		if (!node)
			return node;

		map_children(*node, [&fn](NodePtr child)
		{
			return rewrite_bottom_up(std::move(child), fn);
		});
		return fn(std::move(node));
	}

	NodePtr collapse_block(NodePtr node)
	{
		if (auto *block = as<ast::Block>(node.get());
			block && block->stmts.size() == 1)
		{
			return std::move(block->stmts.front());
		}
		return node;
	}

	void rename_pattern(Pattern &pattern, const std::function<void(std::string &)> &fn)
	{
		std::visit(PatternRenamer{ fn, true }, pattern.data);
	}

	void rename_binders(Pattern &pattern, const std::function<void(std::string &)> &fn)
	{
		std::visit(PatternRenamer{ fn, false }, pattern.data);
	}
}
