/* this project is part of the Rill project; licensed under the MIT license. see LICENSE for more info */

#include <rill/foundation/builder.hpp>
#include <rill/foundation/rewrite.hpp>
#include <rill/transform/simplify.hpp>

namespace rill
{
	namespace
	{
		/* `x = e` followed by a trailing `x` */
		bool ends_in_binding(const ast::Block &block)
		{
			if (block.stmts.size() < 2)
				return false;

			const auto *var = as<ast::Var>(block.stmts.back().get());
			const auto *m = as<ast::Match>(block.stmts[block.stmts.size() - 2].get());
			if (!var || !m)
				return false;

			const auto *bind = as<pat::Bind>(m->pattern.get());
			return bind && !is_wildcard(bind->name) && bind->name == var->name;
		}
	}

	NodePtr inline_trailing_binding(NodePtr root)
	{
		return rewrite_bottom_up(std::move(root), [](NodePtr node)
		{
			auto *block = as<ast::Block>(node.get());
			if (!block)
				return node;

			while (ends_in_binding(*block))
			{
				block->stmts.pop_back();
				NodePtr value = std::move(as<ast::Match>(block->stmts.back().get())->value);
				block->stmts.pop_back();

				if (auto *inner = as<ast::Block>(value.get()))
				{
					for (NodePtr &stmt: inner->stmts)
						block->stmts.push_back(std::move(stmt));
				}
				else
					block->stmts.push_back(std::move(value));
			}
			return collapse_block(std::move(node));
		});
	}

	NodePtr local_self_calls(NodePtr root, const PassContext &context)
	{
		if (context.module_name.empty())
			return root;

		const std::string &module = context.module_name;
		return rewrite_bottom_up(std::move(root), [&module](NodePtr node)
		{
			auto *call = as<ast::RemoteCall>(node.get());
			if (!call)
				return node;

			const auto *target = as<ast::Literal>(call->target.get());
			if (!target || target->kind != LiteralKind::ALIAS)
				return node;

			const auto *name = std::get_if<std::string>(&target->value);
			if (!name || *name != module)
				return node;

			return make::call(call->name, std::move(call->args));
		});
	}

	PassGroup simplification_passes()
	{
		PassGroup group;
		group.name = "simplification";
		group.passes.push_back(make_pass(
			"inline-trailing-binding",
			"return `e` directly instead of binding it and returning the binding",
			inline_trailing_binding,
			{ "underscore-unused-locals" }));
		group.passes.push_back(make_contextual_pass(
			"local-self-calls",
			"call functions of the module being compiled without the module prefix",
			local_self_calls,
			{ "snake-case-identifiers" }));
		return group;
	}
}
