/* this project is part of the Rill project; licensed under the MIT license. see LICENSE for more info */

#pragma once

#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace rill
{
	/**
	 * @brief Interns identifier names into dense integer ids
	 *
	 * Ids are assigned in first-seen order starting at zero, so a table
	 * filled from a deterministic traversal is itself deterministic.
	 */
	class StringTable
	{
	public:
		using StringId = std::uint32_t;
		static constexpr StringId INVALID_STRING_ID = std::numeric_limits<StringId>::max();

		StringTable() = default;

		/* `strs` views into the keys of `ids`; a copy would dangle */
		StringTable(const StringTable &) = delete;
		StringTable &operator=(const StringTable &) = delete;
		StringTable(StringTable &&) noexcept = default;
		StringTable &operator=(StringTable &&) noexcept = default;

		/**
		 * @param str String to intern
		 * @return Existing id when already present, otherwise a fresh one
		 */
		StringId intern(std::string_view str);

		/**
		 * @param str String to look up
		 * @return Id of `str` or `INVALID_STRING_ID` when it was never interned
		 */
		[[nodiscard]] StringId find(std::string_view str) const;

		/**
		 * @param id Id to resolve
		 * @return Interned string
		 * @throws std::out_of_range when `id` was not handed out by this table
		 */
		[[nodiscard]] std::string_view get(StringId id) const;

		[[nodiscard]] bool contains(std::string_view str) const;

		[[nodiscard]] std::size_t size() const;

		void clear();

	private:
		/* transparent hashing so lookups by string_view do not allocate */
		struct StringHash
		{
			using is_transparent = void;
			std::size_t operator()(const std::string_view sv) const
			{
				return std::hash<std::string_view>{}(sv);
			}
		};

		struct StringEqual
		{
			using is_transparent = void;
			bool operator()(const std::string_view lhs, const std::string_view rhs) const
			{
				return lhs == rhs;
			}
		};

		/* map nodes are stable, so `strs` can view into the keys */
		std::unordered_map<std::string, StringId, StringHash, StringEqual> ids;
		std::vector<std::string_view> strs;
	};
}
