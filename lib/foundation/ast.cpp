/* this project is part of the Rill project; licensed under the MIT license. see LICENSE for more info */

#include <rill/foundation/ast.hpp>

namespace rill
{
	namespace
	{
		template<typename T>
		std::vector<std::unique_ptr<T>> clone_all(const std::vector<std::unique_ptr<T>> &items)
		{
			std::vector<std::unique_ptr<T>> out;
			out.reserve(items.size());
			for (const auto &item: items)
				out.push_back(clone(item.get()));
			return out;
		}

		std::vector<ast::Clause> clone_clauses(const std::vector<ast::Clause> &clauses)
		{
			std::vector<ast::Clause> out;
			out.reserve(clauses.size());
			for (const auto &c: clauses)
				out.push_back({ clone(c.pattern.get()), clone(c.guard.get()), clone(c.body.get()) });
			return out;
		}

		struct NodeCloner
		{
			NodeData operator()(const ast::Var &n) const
			{
				return n;
			}

			NodeData operator()(const ast::Literal &n) const
			{
				return n;
			}

			NodeData operator()(const ast::Raw &n) const
			{
				return n;
			}

			NodeData operator()(const ast::Block &n) const
			{
				return ast::Block{ clone_all(n.stmts) };
			}

			NodeData operator()(const ast::Binary &n) const
			{
				return ast::Binary{ n.op, clone(n.lhs.get()), clone(n.rhs.get()) };
			}

			NodeData operator()(const ast::Unary &n) const
			{
				return ast::Unary{ n.op, clone(n.operand.get()) };
			}

			NodeData operator()(const ast::Match &n) const
			{
				return ast::Match{ clone(n.pattern.get()), clone(n.value.get()) };
			}

			NodeData operator()(const ast::If &n) const
			{
				return ast::If{ clone(n.cond.get()), clone(n.then_branch.get()), clone(n.else_branch.get()) };
			}

			NodeData operator()(const ast::Case &n) const
			{
				return ast::Case{ clone(n.subject.get()), clone_clauses(n.clauses) };
			}

			NodeData operator()(const ast::With &n) const
			{
				ast::With out;
				for (const auto &c: n.clauses)
					out.clauses.push_back({ clone(c.pattern.get()), clone(c.value.get()) });
				out.body = clone(n.body.get());
				out.else_clauses = clone_clauses(n.else_clauses);
				return out;
			}

			NodeData operator()(const ast::For &n) const
			{
				ast::For out;
				for (const auto &g: n.generators)
					out.generators.push_back({ clone(g.pattern.get()), clone(g.source.get()) });
				out.filters = clone_all(n.filters);
				out.into = clone(n.into.get());
				out.body = clone(n.body.get());
				return out;
			}

			NodeData operator()(const ast::Fn &n) const
			{
				ast::Fn out;
				for (const auto &c: n.clauses)
					out.clauses.push_back({ clone_all(c.params), clone(c.guard.get()), clone(c.body.get()) });
				return out;
			}

			NodeData operator()(const ast::Call &n) const
			{
				return ast::Call{ n.name, clone_all(n.args) };
			}

			NodeData operator()(const ast::RemoteCall &n) const
			{
				return ast::RemoteCall{ clone(n.target.get()), n.name, clone_all(n.args) };
			}

			NodeData operator()(const ast::Apply &n) const
			{
				return ast::Apply{ clone(n.fun.get()), clone_all(n.args) };
			}

			NodeData operator()(const ast::Field &n) const
			{
				return ast::Field{ clone(n.target.get()), n.name };
			}

			NodeData operator()(const ast::Index &n) const
			{
				return ast::Index{ clone(n.target.get()), clone(n.key.get()) };
			}

			NodeData operator()(const ast::List &n) const
			{
				return ast::List{ clone_all(n.elems) };
			}

			NodeData operator()(const ast::Tuple &n) const
			{
				return ast::Tuple{ clone_all(n.elems) };
			}

			NodeData operator()(const ast::Map &n) const
			{
				ast::Map out;
				for (const auto &e: n.entries)
					out.entries.push_back({ clone(e.key.get()), clone(e.value.get()) });
				return out;
			}

			NodeData operator()(const ast::Struct &n) const
			{
				ast::Struct out{ n.module, {} };
				for (const auto &f: n.fields)
					out.fields.push_back({ f.name, clone(f.value.get()) });
				return out;
			}

			NodeData operator()(const ast::Try &n) const
			{
				return ast::Try{
					clone(n.body.get()),
					clone_clauses(n.rescue_clauses),
					clone_clauses(n.catch_clauses),
					clone(n.after.get())
				};
			}

			NodeData operator()(const ast::Receive &n) const
			{
				return ast::Receive{ clone_clauses(n.clauses), clone(n.after_timeout.get()), clone(n.after_body.get()) };
			}

			NodeData operator()(const ast::Def &n) const
			{
				return ast::Def{ n.name, clone_all(n.params), clone(n.guard.get()), clone(n.body.get()), n.is_private };
			}

			NodeData operator()(const ast::Module &n) const
			{
				return ast::Module{ n.name, clone_all(n.body) };
			}
		};

		struct PatternCloner
		{
			PatternData operator()(const pat::Bind &p) const
			{
				return p;
			}

			PatternData operator()(const pat::Literal &p) const
			{
				return p;
			}

			PatternData operator()(const pat::Tuple &p) const
			{
				return pat::Tuple{ clone_all(p.elems) };
			}

			PatternData operator()(const pat::List &p) const
			{
				return pat::List{ clone_all(p.elems) };
			}

			PatternData operator()(const pat::Cons &p) const
			{
				return pat::Cons{ clone(p.head.get()), clone(p.tail.get()) };
			}

			PatternData operator()(const pat::Map &p) const
			{
				pat::Map out;
				for (const auto &e: p.entries)
					out.entries.push_back({ clone(e.key.get()), clone(e.value.get()) });
				return out;
			}

			PatternData operator()(const pat::Struct &p) const
			{
				pat::Struct out{ p.module, {} };
				for (const auto &f: p.fields)
					out.fields.push_back({ f.name, clone(f.value.get()) });
				return out;
			}

			PatternData operator()(const pat::Pin &p) const
			{
				return p;
			}

			PatternData operator()(const pat::Alias &p) const
			{
				return pat::Alias{ clone(p.pattern.get()), p.name };
			}

			PatternData operator()(const pat::Binary &p) const
			{
				pat::Binary out;
				for (const auto &s: p.segments)
					out.segments.push_back({ clone(s.value.get()), s.spec });
				return out;
			}
		};

		template<typename T>
		bool equal_all(const std::vector<std::unique_ptr<T>> &lhs, const std::vector<std::unique_ptr<T>> &rhs)
		{
			if (lhs.size() != rhs.size())
				return false;
			for (std::size_t i = 0; i < lhs.size(); ++i)
			{
				if (!equal(lhs[i].get(), rhs[i].get()))
					return false;
			}
			return true;
		}

		bool equal_clauses(const std::vector<ast::Clause> &lhs, const std::vector<ast::Clause> &rhs)
		{
			if (lhs.size() != rhs.size())
				return false;
			for (std::size_t i = 0; i < lhs.size(); ++i)
			{
				if (!equal(lhs[i].pattern.get(), rhs[i].pattern.get()) ||
				    !equal(lhs[i].guard.get(), rhs[i].guard.get()) ||
				    !equal(lhs[i].body.get(), rhs[i].body.get()))
					return false;
			}
			return true;
		}

		bool equal_literal(const ast::Literal &a, const ast::Literal &b)
		{
			return a.kind == b.kind && a.value == b.value;
		}

		/* both operands are known to hold the same alternative */
		struct NodeComparer
		{
			bool operator()(const ast::Var &a, const ast::Var &b) const
			{
				return a.name == b.name;
			}

			bool operator()(const ast::Literal &a, const ast::Literal &b) const
			{
				return equal_literal(a, b);
			}

			bool operator()(const ast::Raw &a, const ast::Raw &b) const
			{
				return a.code == b.code;
			}

			bool operator()(const ast::Block &a, const ast::Block &b) const
			{
				return equal_all(a.stmts, b.stmts);
			}

			bool operator()(const ast::Binary &a, const ast::Binary &b) const
			{
				return a.op == b.op && equal(a.lhs.get(), b.lhs.get()) && equal(a.rhs.get(), b.rhs.get());
			}

			bool operator()(const ast::Unary &a, const ast::Unary &b) const
			{
				return a.op == b.op && equal(a.operand.get(), b.operand.get());
			}

			bool operator()(const ast::Match &a, const ast::Match &b) const
			{
				return equal(a.pattern.get(), b.pattern.get()) && equal(a.value.get(), b.value.get());
			}

			bool operator()(const ast::If &a, const ast::If &b) const
			{
				return equal(a.cond.get(), b.cond.get()) &&
				       equal(a.then_branch.get(), b.then_branch.get()) &&
				       equal(a.else_branch.get(), b.else_branch.get());
			}

			bool operator()(const ast::Case &a, const ast::Case &b) const
			{
				return equal(a.subject.get(), b.subject.get()) && equal_clauses(a.clauses, b.clauses);
			}

			bool operator()(const ast::With &a, const ast::With &b) const
			{
				if (a.clauses.size() != b.clauses.size())
					return false;
				for (std::size_t i = 0; i < a.clauses.size(); ++i)
				{
					if (!equal(a.clauses[i].pattern.get(), b.clauses[i].pattern.get()) ||
					    !equal(a.clauses[i].value.get(), b.clauses[i].value.get()))
						return false;
				}
				return equal(a.body.get(), b.body.get()) && equal_clauses(a.else_clauses, b.else_clauses);
			}

			bool operator()(const ast::For &a, const ast::For &b) const
			{
				if (a.generators.size() != b.generators.size())
					return false;
				for (std::size_t i = 0; i < a.generators.size(); ++i)
				{
					if (!equal(a.generators[i].pattern.get(), b.generators[i].pattern.get()) ||
					    !equal(a.generators[i].source.get(), b.generators[i].source.get()))
						return false;
				}
				return equal_all(a.filters, b.filters) &&
				       equal(a.into.get(), b.into.get()) &&
				       equal(a.body.get(), b.body.get());
			}

			bool operator()(const ast::Fn &a, const ast::Fn &b) const
			{
				if (a.clauses.size() != b.clauses.size())
					return false;
				for (std::size_t i = 0; i < a.clauses.size(); ++i)
				{
					if (!equal_all(a.clauses[i].params, b.clauses[i].params) ||
					    !equal(a.clauses[i].guard.get(), b.clauses[i].guard.get()) ||
					    !equal(a.clauses[i].body.get(), b.clauses[i].body.get()))
						return false;
				}
				return true;
			}

			bool operator()(const ast::Call &a, const ast::Call &b) const
			{
				return a.name == b.name && equal_all(a.args, b.args);
			}

			bool operator()(const ast::RemoteCall &a, const ast::RemoteCall &b) const
			{
				return a.name == b.name && equal(a.target.get(), b.target.get()) && equal_all(a.args, b.args);
			}

			bool operator()(const ast::Apply &a, const ast::Apply &b) const
			{
				return equal(a.fun.get(), b.fun.get()) && equal_all(a.args, b.args);
			}

			bool operator()(const ast::Field &a, const ast::Field &b) const
			{
				return a.name == b.name && equal(a.target.get(), b.target.get());
			}

			bool operator()(const ast::Index &a, const ast::Index &b) const
			{
				return equal(a.target.get(), b.target.get()) && equal(a.key.get(), b.key.get());
			}

			bool operator()(const ast::List &a, const ast::List &b) const
			{
				return equal_all(a.elems, b.elems);
			}

			bool operator()(const ast::Tuple &a, const ast::Tuple &b) const
			{
				return equal_all(a.elems, b.elems);
			}

			bool operator()(const ast::Map &a, const ast::Map &b) const
			{
				if (a.entries.size() != b.entries.size())
					return false;
				for (std::size_t i = 0; i < a.entries.size(); ++i)
				{
					if (!equal(a.entries[i].key.get(), b.entries[i].key.get()) ||
					    !equal(a.entries[i].value.get(), b.entries[i].value.get()))
						return false;
				}
				return true;
			}

			bool operator()(const ast::Struct &a, const ast::Struct &b) const
			{
				if (a.module != b.module || a.fields.size() != b.fields.size())
					return false;
				for (std::size_t i = 0; i < a.fields.size(); ++i)
				{
					if (a.fields[i].name != b.fields[i].name ||
					    !equal(a.fields[i].value.get(), b.fields[i].value.get()))
						return false;
				}
				return true;
			}

			bool operator()(const ast::Try &a, const ast::Try &b) const
			{
				return equal(a.body.get(), b.body.get()) &&
				       equal_clauses(a.rescue_clauses, b.rescue_clauses) &&
				       equal_clauses(a.catch_clauses, b.catch_clauses) &&
				       equal(a.after.get(), b.after.get());
			}

			bool operator()(const ast::Receive &a, const ast::Receive &b) const
			{
				return equal_clauses(a.clauses, b.clauses) &&
				       equal(a.after_timeout.get(), b.after_timeout.get()) &&
				       equal(a.after_body.get(), b.after_body.get());
			}

			bool operator()(const ast::Def &a, const ast::Def &b) const
			{
				return a.name == b.name && a.is_private == b.is_private &&
				       equal_all(a.params, b.params) &&
				       equal(a.guard.get(), b.guard.get()) &&
				       equal(a.body.get(), b.body.get());
			}

			bool operator()(const ast::Module &a, const ast::Module &b) const
			{
				return a.name == b.name && equal_all(a.body, b.body);
			}
		};

		struct PatternComparer
		{
			bool operator()(const pat::Bind &a, const pat::Bind &b) const
			{
				return a.name == b.name;
			}

			bool operator()(const pat::Literal &a, const pat::Literal &b) const
			{
				return equal_literal(a.value, b.value);
			}

			bool operator()(const pat::Tuple &a, const pat::Tuple &b) const
			{
				return equal_all(a.elems, b.elems);
			}

			bool operator()(const pat::List &a, const pat::List &b) const
			{
				return equal_all(a.elems, b.elems);
			}

			bool operator()(const pat::Cons &a, const pat::Cons &b) const
			{
				return equal(a.head.get(), b.head.get()) && equal(a.tail.get(), b.tail.get());
			}

			bool operator()(const pat::Map &a, const pat::Map &b) const
			{
				if (a.entries.size() != b.entries.size())
					return false;
				for (std::size_t i = 0; i < a.entries.size(); ++i)
				{
					if (!equal(a.entries[i].key.get(), b.entries[i].key.get()) ||
					    !equal(a.entries[i].value.get(), b.entries[i].value.get()))
						return false;
				}
				return true;
			}

			bool operator()(const pat::Struct &a, const pat::Struct &b) const
			{
				if (a.module != b.module || a.fields.size() != b.fields.size())
					return false;
				for (std::size_t i = 0; i < a.fields.size(); ++i)
				{
					if (a.fields[i].name != b.fields[i].name ||
					    !equal(a.fields[i].value.get(), b.fields[i].value.get()))
						return false;
				}
				return true;
			}

			bool operator()(const pat::Pin &a, const pat::Pin &b) const
			{
				return a.name == b.name;
			}

			bool operator()(const pat::Alias &a, const pat::Alias &b) const
			{
				return a.name == b.name && equal(a.pattern.get(), b.pattern.get());
			}

			bool operator()(const pat::Binary &a, const pat::Binary &b) const
			{
				if (a.segments.size() != b.segments.size())
					return false;
				for (std::size_t i = 0; i < a.segments.size(); ++i)
				{
					if (a.segments[i].spec != b.segments[i].spec ||
					    !equal(a.segments[i].value.get(), b.segments[i].value.get()))
						return false;
				}
				return true;
			}
		};
	}

	NodePtr clone(const Node *node)
	{
		if (!node)
			return nullptr;
		return std::make_unique<Node>(Node{ std::visit(NodeCloner{}, node->data) });
	}

	PatternPtr clone(const Pattern *pattern)
	{
		if (!pattern)
			return nullptr;
		return std::make_unique<Pattern>(Pattern{ std::visit(PatternCloner{}, pattern->data) });
	}

	bool equal(const Node *lhs, const Node *rhs)
	{
		if (!lhs || !rhs)
			return lhs == rhs;
		if (lhs->data.index() != rhs->data.index())
			return false;

		return std::visit([rhs](const auto &a)
		{
			using T = std::decay_t<decltype(a)>;
			return NodeComparer{}(a, std::get<T>(rhs->data));
		}, lhs->data);
	}

	bool equal(const Pattern *lhs, const Pattern *rhs)
	{
		if (!lhs || !rhs)
			return lhs == rhs;
		if (lhs->data.index() != rhs->data.index())
			return false;

		return std::visit([rhs](const auto &a)
		{
			using T = std::decay_t<decltype(a)>;
			return PatternComparer{}(a, std::get<T>(rhs->data));
		}, lhs->data);
	}

	bool is_wildcard(const std::string &name)
	{
		return name == "_";
	}
}
