/* this project is part of the Rill project; licensed under the MIT license. see LICENSE for more info */

#include <rill/analysis/closure-collector.hpp>

namespace rill
{
	namespace
	{
		constexpr ScanOptions closure_scope{ .sequential_blocks = true };

		void collect_into(const Node *node, NameSet &out)
		{
			scan_uses(node, [&out](std::string_view use)
			{
				out.emplace(use);
				return false;
			}, closure_scope);
		}

		NameSet collect_head(const std::vector<PatternPtr> &params, const Node *guard, const Node *body)
		{
			NameSet uses;
			collect_into(guard, uses);
			collect_into(body, uses);

			NameSet bound;
			for (const PatternPtr &p: params)
				collect_binders(p.get(), bound);
			for (const std::string &name: bound)
				uses.erase(name);

			/* pins in the head read the enclosing scope */
			for (const PatternPtr &p: params)
				collect_pins(p.get(), uses);
			return uses;
		}
	}

	NameSet ClosureCollector::collect(const Node *body)
	{
		NameSet out;
		collect_into(body, out);
		return out;
	}

	NameSet ClosureCollector::collect(const ast::FnClause &clause)
	{
		return collect_head(clause.params, clause.guard.get(), clause.body.get());
	}

	NameSet ClosureCollector::collect(const ast::Def &def)
	{
		return collect_head(def.params, def.guard.get(), def.body.get());
	}

	bool ClosureCollector::references(const Node *body, std::string_view name)
	{
		if (!body || name.empty())
			return false;
		return scan_uses(body, [name](std::string_view use)
		{
			return use == name;
		}, closure_scope);
	}

	NameSet ClosureCollector::unused_params(const std::vector<PatternPtr> &params,
	                                        const Node *guard, const Node *body)
	{
		NameSet uses;
		collect_into(guard, uses);
		collect_into(body, uses);

		NameSet unused;
		for (const PatternPtr &p: params)
		{
			for (const std::string &name: binders(p.get()))
			{
				if (!uses.contains(name))
					unused.insert(name);
			}
		}
		return unused;
	}
}
