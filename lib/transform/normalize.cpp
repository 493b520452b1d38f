/* this project is part of the Rill project; licensed under the MIT license. see LICENSE for more info */

#include <algorithm>
#include <cctype>
#include <rill/foundation/builder.hpp>
#include <rill/foundation/rewrite.hpp>
#include <rill/support/naming.hpp>
#include <rill/transform/normalize.hpp>

namespace rill
{
	namespace
	{
		bool is_self_assignment(const Node *node)
		{
			const auto *m = as<ast::Match>(node);
			if (!m)
				return false;
			const auto *bind = as<pat::Bind>(m->pattern.get());
			const auto *var = as<ast::Var>(m->value.get());
			return bind && var && !is_wildcard(bind->name) && bind->name == var->name;
		}

		/* renames the local references inside `#{...}` spans. field names after
		 * a dot, atoms and capitalised aliases keep their spelling */
		std::string snake_case_interpolations(const std::string &text)
		{
			std::string out;
			out.reserve(text.size());
			std::size_t i = 0;
			while (i < text.size())
			{
				const std::size_t open = text.find("#{", i);
				if (open == std::string::npos)
					break;
				const std::size_t close = text.find('}', open + 2);
				if (close == std::string::npos)
					break;

				out.append(text, i, open + 2 - i);
				std::size_t j = open + 2;
				while (j < close)
				{
					if (!is_identifier_char(text[j]))
					{
						out.push_back(text[j++]);
						continue;
					}
					std::size_t end = j;
					while (end < close && is_identifier_char(text[end]))
						++end;
					const std::string_view token(text.data() + j, end - j);
					const char before = j > 0 ? text[j - 1] : ' ';
					const bool keep = std::isdigit(static_cast<unsigned char>(token.front())) ||
					                  std::isupper(static_cast<unsigned char>(token.front())) ||
					                  before == '.' || before == ':';
					out += keep ? std::string(token) : to_snake_case(token);
					j = end;
				}
				out.push_back('}');
				i = close + 1;
			}
			out.append(text, std::min(i, text.size()), std::string::npos);
			return out;
		}

		/**
		 * @brief Interpolation spans may only name variables or their fields
		 */
		bool pure_string(const std::string &text)
		{
			bool pure = true;
			for_each_interpolation(text, [&pure](std::string_view code)
			{
				pure = pure && std::ranges::all_of(code, [](const char c)
				{
					return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.' ||
					       std::isspace(static_cast<unsigned char>(c));
				});
			});
			return pure;
		}

		bool is_pure(const Node *node)
		{
			if (const auto *lit = as<ast::Literal>(node); lit && lit->kind == LiteralKind::STRING)
				return pure_string(std::get<std::string>(lit->value));
			return is<ast::Var>(node) || is<ast::Literal>(node) || is<ast::Fn>(node);
		}

		NodePtr eliminate(NodePtr node)
		{
			if (!node)
				return node;

			if (auto *block = as<ast::Block>(node.get()))
			{
				std::vector<NodePtr> kept;
				for (std::size_t i = 0; i < block->stmts.size(); ++i)
				{
					const bool last = i + 1 == block->stmts.size();
					if (!last && is_self_assignment(block->stmts[i].get()))
						continue;
					kept.push_back(eliminate(std::move(block->stmts[i])));
				}
				block->stmts = std::move(kept);
				return collapse_block(std::move(node));
			}

			if (is_self_assignment(node.get()))
			{
				const auto &name = as<ast::Var>(as<ast::Match>(node.get())->value.get())->name;
				return make::var(name);
			}

			map_children(*node, eliminate);
			return node;
		}
	}

	NodePtr flatten_blocks(NodePtr root)
	{
		return rewrite_bottom_up(std::move(root), [](NodePtr node)
		{
			auto *block = as<ast::Block>(node.get());
			if (!block)
				return node;

			std::vector<NodePtr> stmts;
			stmts.reserve(block->stmts.size());
			for (NodePtr &stmt: block->stmts)
			{
				/* children are already flat, so one level of splicing suffices */
				if (auto *inner = as<ast::Block>(stmt.get()))
				{
					for (NodePtr &s: inner->stmts)
						stmts.push_back(std::move(s));
					continue;
				}
				stmts.push_back(std::move(stmt));
			}
			block->stmts = std::move(stmts);
			return collapse_block(std::move(node));
		});
	}

	NodePtr snake_case_identifiers(NodePtr root)
	{
		const auto rename = [](std::string &name)
		{
			name = to_snake_case(name);
		};

		return rewrite_bottom_up(std::move(root), [&rename](NodePtr node)
		{
			for_each_pattern(*node, [&rename](Pattern &p)
			{
				rename_pattern(p, rename);
			});

			if (auto *v = as<ast::Var>(node.get()))
				rename(v->name);
			else if (auto *lit = as<ast::Literal>(node.get()); lit && lit->kind == LiteralKind::STRING)
			{
				if (auto *text = std::get_if<std::string>(&lit->value))
					*text = snake_case_interpolations(*text);
			}
			else if (auto *c = as<ast::Call>(node.get()))
				rename(c->name);
			else if (auto *r = as<ast::RemoteCall>(node.get()))
				rename(r->name);
			else if (auto *d = as<ast::Def>(node.get()))
				rename(d->name);
			return node;
		});
	}

	NodePtr eliminate_self_assignments(NodePtr root)
	{
		return eliminate(std::move(root));
	}

	NodePtr drop_pure_statements(NodePtr root)
	{
		return rewrite_bottom_up(std::move(root), [](NodePtr node)
		{
			auto *block = as<ast::Block>(node.get());
			if (!block || block->stmts.size() < 2)
				return node;

			NodePtr last = std::move(block->stmts.back());
			block->stmts.pop_back();
			std::erase_if(block->stmts, [](const NodePtr &stmt)
			{
				return is_pure(stmt.get());
			});
			block->stmts.push_back(std::move(last));
			return collapse_block(std::move(node));
		});
	}

	PassGroup normalization_passes()
	{
		PassGroup group;
		group.name = "normalization";
		group.passes.push_back(make_pass(
			"flatten-blocks",
			"splice nested blocks and unwrap single-statement blocks",
			flatten_blocks));
		group.passes.push_back(make_pass(
			"snake-case-identifiers",
			"rename variables and functions to snake_case",
			snake_case_identifiers,
			{ "flatten-blocks" }));
		group.passes.push_back(make_pass(
			"self-assignment-elimination",
			"remove `x = x` bindings",
			eliminate_self_assignments,
			{ "snake-case-identifiers" }));
		group.passes.push_back(make_pass(
			"drop-pure-statements",
			"drop side-effect free statements whose value is discarded",
			drop_pure_statements,
			{ "self-assignment-elimination" }));
		return group;
	}
}
