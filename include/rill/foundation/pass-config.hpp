/* this project is part of the Rill project; licensed under the MIT license. see LICENSE for more info */

#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace rill
{
	struct PassDescriptor;

	/**
	 * @brief Explicit per-pass enable/disable overrides
	 *
	 * Threaded into the PassManager at construction; nothing is read from
	 * ambient process state.
	 */
	class PassConfig
	{
	public:
		using Entries = std::map<std::string, bool, std::less<>>;

		PassConfig() = default;

		PassConfig &set(std::string_view name, bool enabled);

		PassConfig &enable(std::string_view name);

		PassConfig &disable(std::string_view name);

		/**
		 * @param name Pass name
		 * @return Override for `name` or nullopt when the descriptor default applies
		 */
		[[nodiscard]] std::optional<bool> lookup(std::string_view name) const;

		/**
		 * @brief Effective enablement of a pass
		 */
		[[nodiscard]] bool is_enabled(const PassDescriptor &pass) const;

		[[nodiscard]] const Entries &overrides() const;

		[[nodiscard]] bool empty() const;

		/**
		 * @brief Parse `name = on|off|true|false` lines
		 *
		 * `#` starts a comment; blank lines are ignored. A later line for the
		 * same name replaces the earlier one.
		 *
		 * @param text Configuration text
		 * @return Parsed configuration
		 * @throws std::invalid_argument on a malformed line, naming its line number
		 */
		static PassConfig parse(std::string_view text);

	private:
		Entries entries;
	};
}
