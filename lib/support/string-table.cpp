/* this project is part of the Rill project; licensed under the MIT license. see LICENSE for more info */

#include <format>
#include <stdexcept>
#include <rill/support/string-table.hpp>

namespace rill
{
	StringTable::StringId StringTable::intern(std::string_view str)
	{
		if (const auto it = ids.find(str);
			it != ids.end())
		{
			return it->second;
		}

		const auto id = static_cast<StringId>(strs.size());
		auto [it, inserted] = ids.emplace(std::string(str), id);
		strs.emplace_back(it->first);
		return id;
	}

	StringTable::StringId StringTable::find(std::string_view str) const
	{
		if (const auto it = ids.find(str);
			it != ids.end())
		{
			return it->second;
		}
		return INVALID_STRING_ID;
	}

	std::string_view StringTable::get(const StringId id) const
	{
		if (id >= strs.size())
			throw std::out_of_range(std::format("StringTable::get: invalid string id {}", id));
		return strs[id];
	}

	bool StringTable::contains(std::string_view str) const
	{
		return ids.contains(str);
	}

	std::size_t StringTable::size() const
	{
		return strs.size();
	}

	void StringTable::clear()
	{
		strs.clear();
		ids.clear();
	}
}
