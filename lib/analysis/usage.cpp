/* this project is part of the Rill project; licensed under the MIT license. see LICENSE for more info */

#include <algorithm>
#include <string>
#include <vector>
#include <rill/analysis/usage.hpp>
#include <rill/support/naming.hpp>

namespace rill
{
	namespace
	{
		struct BinderCollector
		{
			NameSet &out;
			bool pins;

			void collect(const PatternPtr &p) const
			{
				if (p)
					std::visit(*this, p->data);
			}

			void operator()(const pat::Bind &p) const
			{
				if (!pins && !is_wildcard(p.name))
					out.insert(p.name);
			}

			void operator()(const pat::Literal &) const {}

			void operator()(const pat::Tuple &p) const
			{
				for (const PatternPtr &e: p.elems)
					collect(e);
			}

			void operator()(const pat::List &p) const
			{
				for (const PatternPtr &e: p.elems)
					collect(e);
			}

			void operator()(const pat::Cons &p) const
			{
				collect(p.head);
				collect(p.tail);
			}

			void operator()(const pat::Map &p) const
			{
				for (const pat::MapEntry &e: p.entries)
				{
					collect(e.key);
					collect(e.value);
				}
			}

			void operator()(const pat::Struct &p) const
			{
				for (const pat::StructField &f: p.fields)
					collect(f.value);
			}

			void operator()(const pat::Pin &p) const
			{
				if (pins)
					out.insert(p.name);
			}

			void operator()(const pat::Alias &p) const
			{
				collect(p.pattern);
				if (!pins)
					out.insert(p.name);
			}

			void operator()(const pat::Binary &p) const
			{
				for (const pat::Segment &s: p.segments)
					collect(s.value);
			}
		};

		/**
		 * @brief The one scoped traversal every usage query goes through
		 *
		 * Each operator() returns true when the visitor asked to stop.
		 * Binders are pushed on `shadow` on scope entry and popped on exit.
		 */
		class Scanner
		{
		public:
			Scanner(const UseVisitor &on_use, const ScanOptions options,
			        const std::function<void(std::string_view)> *on_bind = nullptr)
				: on_use(on_use), on_bind(on_bind), options(options) {}

			bool scan(const Node *node)
			{
				if (!node)
					return false;
				return std::visit(*this, node->data);
			}

			bool operator()(const ast::Var &n)
			{
				return use(n.name);
			}

			bool operator()(const ast::Literal &n)
			{
				if (n.kind != LiteralKind::STRING)
					return false;

				bool stop = false;
				for_each_interpolation(std::get<std::string>(n.value), [&](std::string_view code)
				{
					if (!stop)
						stop = scan_code(code);
				});
				return stop;
			}

			bool operator()(const ast::Raw &n)
			{
				return scan_code(n.code);
			}

			bool operator()(const ast::Block &n)
			{
				const std::size_t mark = shadow.size();
				for (const NodePtr &stmt: n.stmts)
				{
					if (scan(stmt.get()))
						return true;
					if (options.sequential_blocks)
					{
						if (const auto *m = as<ast::Match>(stmt.get()))
							bind(m->pattern.get());
					}
				}
				unbind(mark);
				return false;
			}

			bool operator()(const ast::Binary &n)
			{
				return scan(n.lhs.get()) || scan(n.rhs.get());
			}

			bool operator()(const ast::Unary &n)
			{
				return scan(n.operand.get());
			}

			bool operator()(const ast::Match &n)
			{
				/* the left-hand side binds; only pins in it are uses */
				if (scan_pins(n.pattern.get()) || scan(n.value.get()))
					return true;
				if (on_bind)
					report_binders(n.pattern.get());
				return false;
			}

			bool operator()(const ast::If &n)
			{
				return scan(n.cond.get()) || scan(n.then_branch.get()) || scan(n.else_branch.get());
			}

			bool operator()(const ast::Case &n)
			{
				return scan(n.subject.get()) || scan_clauses(n.clauses);
			}

			bool operator()(const ast::With &n)
			{
				const std::size_t mark = shadow.size();
				for (const ast::WithClause &c: n.clauses)
				{
					if (scan(c.value.get()) || scan_pins(c.pattern.get()))
						return true;
					bind(c.pattern.get());
				}
				if (scan(n.body.get()))
					return true;
				unbind(mark);
				return scan_clauses(n.else_clauses);
			}

			bool operator()(const ast::For &n)
			{
				if (scan(n.into.get()))
					return true;

				const std::size_t mark = shadow.size();
				for (const ast::Generator &g: n.generators)
				{
					if (scan(g.source.get()) || scan_pins(g.pattern.get()))
						return true;
					bind(g.pattern.get());
				}
				for (const NodePtr &filter: n.filters)
				{
					if (scan(filter.get()))
						return true;
				}
				if (scan(n.body.get()))
					return true;
				unbind(mark);
				return false;
			}

			bool operator()(const ast::Fn &n)
			{
				for (const ast::FnClause &c: n.clauses)
				{
					if (scan_head(c.params, c.guard.get(), c.body.get()))
						return true;
				}
				return false;
			}

			bool operator()(const ast::Call &n)
			{
				return scan_all(n.args);
			}

			bool operator()(const ast::RemoteCall &n)
			{
				return scan(n.target.get()) || scan_all(n.args);
			}

			bool operator()(const ast::Apply &n)
			{
				return scan(n.fun.get()) || scan_all(n.args);
			}

			bool operator()(const ast::Field &n)
			{
				return scan(n.target.get());
			}

			bool operator()(const ast::Index &n)
			{
				return scan(n.target.get()) || scan(n.key.get());
			}

			bool operator()(const ast::List &n)
			{
				return scan_all(n.elems);
			}

			bool operator()(const ast::Tuple &n)
			{
				return scan_all(n.elems);
			}

			bool operator()(const ast::Map &n)
			{
				return std::ranges::any_of(n.entries, [this](const ast::MapEntry &e)
				{
					return scan(e.key.get()) || scan(e.value.get());
				});
			}

			bool operator()(const ast::Struct &n)
			{
				return std::ranges::any_of(n.fields, [this](const ast::StructField &f)
				{
					return scan(f.value.get());
				});
			}

			bool operator()(const ast::Try &n)
			{
				return scan(n.body.get()) ||
				       scan_clauses(n.rescue_clauses) ||
				       scan_clauses(n.catch_clauses) ||
				       scan(n.after.get());
			}

			bool operator()(const ast::Receive &n)
			{
				return scan_clauses(n.clauses) || scan(n.after_timeout.get()) || scan(n.after_body.get());
			}

			bool operator()(const ast::Def &n)
			{
				return scan_head(n.params, n.guard.get(), n.body.get());
			}

			bool operator()(const ast::Module &n)
			{
				return scan_all(n.body);
			}

		private:
			const UseVisitor &on_use;
			const std::function<void(std::string_view)> *on_bind;
			ScanOptions options;
			std::vector<std::string> shadow;

			bool use(std::string_view name)
			{
				if (name.empty() || std::ranges::find(shadow, name) != shadow.end())
					return false;
				return on_use(name);
			}

			bool scan_code(std::string_view code)
			{
				bool stop = false;
				for_each_identifier(code, [&](std::string_view token)
				{
					if (!stop)
						stop = use(token);
				});
				return stop;
			}

			bool scan_all(const std::vector<NodePtr> &nodes)
			{
				return std::ranges::any_of(nodes, [this](const NodePtr &n)
				{
					return scan(n.get());
				});
			}

			bool scan_pins(const Pattern *pattern)
			{
				NameSet pins;
				collect_pins(pattern, pins);
				return std::ranges::any_of(pins, [this](const std::string &name)
				{
					return use(name);
				});
			}

			void report_binders(const Pattern *pattern) const
			{
				for (const std::string &name: binders(pattern))
					(*on_bind)(name);
			}

			void bind(const Pattern *pattern)
			{
				for (const std::string &name: binders(pattern))
				{
					if (on_bind)
						(*on_bind)(name);
					shadow.push_back(name);
				}
			}

			void unbind(const std::size_t mark)
			{
				shadow.resize(mark);
			}

			/* clause-local scope: pattern binders shadow guard and body only */
			bool scan_clauses(const std::vector<ast::Clause> &clauses)
			{
				for (const ast::Clause &c: clauses)
				{
					if (scan_pins(c.pattern.get()))
						return true;

					const std::size_t mark = shadow.size();
					bind(c.pattern.get());
					if (scan(c.guard.get()) || scan(c.body.get()))
						return true;
					unbind(mark);
				}
				return false;
			}

			bool scan_head(const std::vector<PatternPtr> &params, const Node *guard, const Node *body)
			{
				for (const PatternPtr &p: params)
				{
					if (scan_pins(p.get()))
						return true;
				}

				const std::size_t mark = shadow.size();
				for (const PatternPtr &p: params)
					bind(p.get());
				if (scan(guard) || scan(body))
					return true;
				unbind(mark);
				return false;
			}
		};

		bool matches(std::string_view use, std::string_view name, std::string_view canonical, const NameMatch mode)
		{
			if (use == name)
				return true;
			return mode == NameMatch::FUZZY && canonical_name(use) == canonical;
		}
	}

	bool scan_uses(const Node *node, const UseVisitor &on_use, const ScanOptions options)
	{
		Scanner scanner(on_use, options);
		return scanner.scan(node);
	}

	bool is_used(const Node *node, std::string_view name)
	{
		return is_used(node, name, NameMatch::EXACT);
	}

	bool is_used_fuzzy(const Node *node, std::string_view name)
	{
		return is_used(node, name, NameMatch::FUZZY);
	}

	bool is_used(const Node *node, std::string_view name, const NameMatch mode)
	{
		if (!node || name.empty())
			return false;

		const std::string canonical = mode == NameMatch::FUZZY ? canonical_name(name) : std::string();
		return scan_uses(node, [&](std::string_view use)
		{
			return matches(use, name, canonical, mode);
		});
	}

	NameSet used_names(const Node *node)
	{
		NameSet names;
		scan_uses(node, [&names](std::string_view use)
		{
			names.emplace(use);
			return false;
		});
		return names;
	}

	NameSet binders(const Pattern *pattern)
	{
		NameSet out;
		collect_binders(pattern, out);
		return out;
	}

	void collect_binders(const Pattern *pattern, NameSet &out)
	{
		if (pattern)
			std::visit(BinderCollector{ out, false }, pattern->data);
	}

	void collect_pins(const Pattern *pattern, NameSet &out)
	{
		if (pattern)
			std::visit(BinderCollector{ out, true }, pattern->data);
	}

	NameSet bound_names(const Node *node)
	{
		NameSet names;
		const UseVisitor ignore = [](std::string_view) { return false; };
		const std::function<void(std::string_view)> on_bind = [&names](std::string_view name)
		{
			names.emplace(name);
		};
		Scanner scanner(ignore, {}, &on_bind);
		scanner.scan(node);
		return names;
	}
}
