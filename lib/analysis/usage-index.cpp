/* this project is part of the Rill project; licensed under the MIT license. see LICENSE for more info */

#include <rill/analysis/usage-index.hpp>
#include <rill/support/naming.hpp>

namespace rill
{
	UsageIndex::UsageIndex(const std::size_t count, const NameMatch mode) : count(count), match(mode) {}

	UsageIndex UsageIndex::build(const std::vector<NodePtr> &stmts)
	{
		return build(stmts, NameMatch::FUZZY);
	}

	UsageIndex UsageIndex::build_exact(const std::vector<NodePtr> &stmts)
	{
		return build(stmts, NameMatch::EXACT);
	}

	UsageIndex UsageIndex::build(const std::vector<NodePtr> &stmts, const NameMatch mode)
	{
		UsageIndex index(stmts.size(), mode);

		/* walking backwards, the first sighting of a name is its last use */
		for (std::size_t i = stmts.size(); i-- > 0;)
		{
			scan_uses(stmts[i].get(), [&](std::string_view use)
			{
				const StringTable::StringId id = mode == NameMatch::FUZZY
					                                 ? index.names.intern(canonical_name(use))
					                                 : index.names.intern(use);
				if (id == index.last_use.size())
					index.last_use.push_back(i + 1);
				return false;
			});
		}
		return index;
	}

	bool UsageIndex::used_later(const std::size_t start, std::string_view name) const
	{
		if (start >= count || name.empty())
			return false;

		const StringTable::StringId id = match == NameMatch::FUZZY
			                                 ? names.find(canonical_name(name))
			                                 : names.find(name);
		if (id == StringTable::INVALID_STRING_ID)
			return false;
		return last_use[id] > start;
	}

	NameSet UsageIndex::suffix(const std::size_t i) const
	{
		NameSet out;
		for (StringTable::StringId id = 0; id < last_use.size(); ++id)
		{
			if (last_use[id] > i)
				out.emplace(names.get(id));
		}
		return out;
	}

	std::size_t UsageIndex::size() const
	{
		return count;
	}

	NameMatch UsageIndex::mode() const
	{
		return match;
	}

	bool brute_force_used_later(const std::vector<NodePtr> &stmts, const std::size_t start,
	                            std::string_view name, const NameMatch mode)
	{
		for (std::size_t i = start; i < stmts.size(); ++i)
		{
			if (is_used(stmts[i].get(), name, mode))
				return true;
		}
		return false;
	}
}
