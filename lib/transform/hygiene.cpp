/* this project is part of the Rill project; licensed under the MIT license. see LICENSE for more info */

#include <rill/analysis/closure-collector.hpp>
#include <rill/analysis/usage-index.hpp>
#include <rill/analysis/usage.hpp>
#include <rill/foundation/rewrite.hpp>
#include <rill/support/naming.hpp>
#include <rill/transform/hygiene.hpp>

namespace rill
{
	namespace
	{
		bool is_underscored(const std::string &name)
		{
			return !name.empty() && name.front() == '_' && !is_wildcard(name);
		}

		class UnderscoreRestorer
		{
		public:
			void visit(Node &node, const NameSet *scope)
			{
				NameSet own;
				if (auto *def = as<ast::Def>(&node))
				{
					own = bound_names(&node);
					scope = &own;
					restore_params(def->params, def->guard.get(), def->body.get(), *scope);
				}
				else if (auto *fn = as<ast::Fn>(&node))
				{
					if (!scope)
					{
						own = bound_names(&node);
						scope = &own;
					}
					for (ast::FnClause &clause: fn->clauses)
						restore_params(clause.params, clause.guard.get(), clause.body.get(), *scope);
				}
				else if (auto *block = as<ast::Block>(&node))
				{
					NameSet fallback;
					if (!scope)
					{
						fallback = bound_names(&node);
						scope = &fallback;
					}
					restore_locals(*block, *scope);
				}

				map_children(node, [this, scope](NodePtr child)
				{
					visit(*child, scope);
					return child;
				});
			}

		private:
			static bool restorable(const std::string &name, const NameSet &scope,
			                       const std::function<bool(std::string_view)> &used)
			{
				if (!is_underscored(name))
					return false;
				const std::string_view plain = strip_underscore(name);
				if (plain.empty() || scope.contains(plain))
					return false;
				return !used(name) && used(plain);
			}

			static void restore_params(std::vector<PatternPtr> &params, const Node *guard, const Node *body,
			                           const NameSet &scope)
			{
				const auto used = [guard, body](std::string_view name)
				{
					return is_used(guard, name) || is_used(body, name);
				};

				for (PatternPtr &param: params)
				{
					rename_binders(*param, [&](std::string &name)
					{
						if (restorable(name, scope, used))
							name = std::string(strip_underscore(name));
					});
				}
			}

			static void restore_locals(ast::Block &block, const NameSet &scope)
			{
				const UsageIndex index = UsageIndex::build(block.stmts);
				for (std::size_t i = 0; i < block.stmts.size(); ++i)
				{
					auto *m = as<ast::Match>(block.stmts[i].get());
					if (!m)
						continue;

					const auto used = [&block, i](std::string_view name)
					{
						return brute_force_used_later(block.stmts, i + 1, name, NameMatch::EXACT);
					};

					rename_binders(*m->pattern, [&](std::string &name)
					{
						/* the fuzzy index rules out most binders before the exact rescan */
						if (!is_underscored(name) || !index.used_later(i + 1, name))
							return;
						if (restorable(name, scope, used))
							name = std::string(strip_underscore(name));
					});
				}
			}
		};

		void underscore_params(std::vector<PatternPtr> &params, const Node *guard, const Node *body)
		{
			const NameSet unused = ClosureCollector::unused_params(params, guard, body);
			if (unused.empty())
				return;

			for (PatternPtr &param: params)
			{
				rename_binders(*param, [&unused](std::string &name)
				{
					if (name.front() != '_' && unused.contains(name))
						name = "_" + name;
				});
			}
		}

		/**
		 * @brief Check whether `name` is read from `stmts[from]` onwards before a top-level match rebinds it
		 */
		bool read_before_rebinding(const std::vector<NodePtr> &stmts, const std::size_t from, const std::string &name)
		{
			for (std::size_t j = from; j < stmts.size(); ++j)
			{
				if (is_used(stmts[j].get(), name))
					return true;
				if (const auto *m = as<ast::Match>(stmts[j].get()); m && binders(m->pattern.get()).contains(name))
					return false;
			}
			return false;
		}

		/* a block spliced into another block shares its bindings with the
		 * statements after it, so only the outermost one is rewritten */
		void underscore_locals(Node &node, const bool spliced)
		{
			auto *block = as<ast::Block>(&node);
			if (block && !spliced)
			{
				const UsageIndex index = UsageIndex::build_exact(block->stmts);
				for (std::size_t i = 0; i < block->stmts.size(); ++i)
				{
					auto *m = as<ast::Match>(block->stmts[i].get());
					if (!m)
						continue;

					rename_binders(*m->pattern, [&index, block, i](std::string &name)
					{
						if (name.front() == '_')
							return;
						if (!index.used_later(i + 1, name) || !read_before_rebinding(block->stmts, i + 1, name))
							name = "_" + name;
					});
				}
			}

			const bool in_block = block != nullptr;
			map_children(node, [in_block](NodePtr child)
			{
				underscore_locals(*child, in_block && is<ast::Block>(child.get()));
				return child;
			});
		}
	}

	NodePtr restore_used_underscored(NodePtr root)
	{
		if (root)
			UnderscoreRestorer{}.visit(*root, nullptr);
		return root;
	}

	NodePtr underscore_unused_params(NodePtr root)
	{
		return rewrite_bottom_up(std::move(root), [](NodePtr node)
		{
			if (auto *def = as<ast::Def>(node.get()))
				underscore_params(def->params, def->guard.get(), def->body.get());
			else if (auto *fn = as<ast::Fn>(node.get()))
			{
				for (ast::FnClause &clause: fn->clauses)
					underscore_params(clause.params, clause.guard.get(), clause.body.get());
			}
			return node;
		});
	}

	NodePtr underscore_unused_locals(NodePtr root)
	{
		if (root)
			underscore_locals(*root, false);
		return root;
	}

	PassGroup hygiene_passes()
	{
		PassGroup group;
		group.name = "hygiene";
		group.passes.push_back(make_pass(
			"restore-used-underscored",
			"rename `_x` binders back to `x` when `x` is referenced",
			restore_used_underscored,
			{ "snake-case-identifiers" }));
		group.passes.push_back(make_pass(
			"underscore-unused-params",
			"prefix unreferenced parameters with `_`",
			underscore_unused_params,
			{ "restore-used-underscored" }));
		group.passes.push_back(make_pass(
			"underscore-unused-locals",
			"prefix unreferenced local binders with `_`",
			underscore_unused_locals,
			{ "underscore-unused-params" }));
		return group;
	}
}
