/* this project is part of the Rill project; licensed under the MIT license. see LICENSE for more info */

#include <format>
#include <stdexcept>
#include <rill/foundation/pass-config.hpp>
#include <rill/foundation/pass.hpp>

namespace rill
{
	namespace
	{
		std::string_view trim(std::string_view text)
		{
			constexpr std::string_view ws = " \t\r";
			const auto first = text.find_first_not_of(ws);
			if (first == std::string_view::npos)
				return {};
			const auto last = text.find_last_not_of(ws);
			return text.substr(first, last - first + 1);
		}

		std::optional<bool> parse_switch(std::string_view value)
		{
			if (value == "on" || value == "true")
				return true;
			if (value == "off" || value == "false")
				return false;
			return std::nullopt;
		}
	}

	PassConfig &PassConfig::set(std::string_view name, const bool enabled)
	{
		if (const auto it = entries.find(name);
			it != entries.end())
		{
			it->second = enabled;
			return *this;
		}
		entries.emplace(std::string(name), enabled);
		return *this;
	}

	PassConfig &PassConfig::enable(std::string_view name)
	{
		return set(name, true);
	}

	PassConfig &PassConfig::disable(std::string_view name)
	{
		return set(name, false);
	}

	std::optional<bool> PassConfig::lookup(std::string_view name) const
	{
		if (const auto it = entries.find(name);
			it != entries.end())
		{
			return it->second;
		}
		return std::nullopt;
	}

	bool PassConfig::is_enabled(const PassDescriptor &pass) const
	{
		return lookup(pass.name).value_or(pass.enabled);
	}

	const PassConfig::Entries &PassConfig::overrides() const
	{
		return entries;
	}

	bool PassConfig::empty() const
	{
		return entries.empty();
	}

	PassConfig PassConfig::parse(std::string_view text)
	{
		PassConfig config;
		std::size_t line_no = 0;
		while (!text.empty())
		{
			++line_no;
			const auto eol = text.find('\n');
			std::string_view line = text.substr(0, eol);
			text = eol == std::string_view::npos ? std::string_view{} : text.substr(eol + 1);

			if (const auto hash = line.find('#');
				hash != std::string_view::npos)
			{
				line = line.substr(0, hash);
			}
			line = trim(line);
			if (line.empty())
				continue;

			const auto eq = line.find('=');
			if (eq == std::string_view::npos)
				throw std::invalid_argument(std::format("pass config line {}: expected 'name = on|off'", line_no));

			const std::string_view name = trim(line.substr(0, eq));
			const std::string_view value = trim(line.substr(eq + 1));
			if (name.empty())
				throw std::invalid_argument(std::format("pass config line {}: missing pass name", line_no));

			const auto enabled = parse_switch(value);
			if (!enabled)
			{
				throw std::invalid_argument(
					std::format("pass config line {}: invalid value '{}' for pass '{}'", line_no, value, name)
				);
			}
			config.set(name, *enabled);
		}
		return config;
	}
}
