/* this project is part of the Rill project; licensed under the MIT license. see LICENSE for more info */

#include <cctype>
#include <rill/support/naming.hpp>

namespace rill
{
	namespace
	{
		bool is_upper(const char c)
		{
			return std::isupper(static_cast<unsigned char>(c)) != 0;
		}

		bool is_lower_or_digit(const char c)
		{
			return std::islower(static_cast<unsigned char>(c)) != 0 ||
			       std::isdigit(static_cast<unsigned char>(c)) != 0;
		}

		char lower(const char c)
		{
			return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
		}

		char upper(const char c)
		{
			return static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
		}

		std::size_t leading_underscores(std::string_view name)
		{
			std::size_t n = 0;
			while (n < name.size() && name[n] == '_')
				++n;
			return n;
		}

		/* returns the index of the closing brace matching the `{` at `open`;
		 * an unterminated span closes at the end of the text */
		std::size_t closing_brace(std::string_view text, const std::size_t open)
		{
			std::size_t depth = 0;
			for (std::size_t i = open; i < text.size(); ++i)
			{
				if (text[i] == '{')
					++depth;
				else if (text[i] == '}' && --depth == 0)
					return i;
			}
			return text.size();
		}
	}

	bool is_identifier_char(const char c)
	{
		return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
	}

	std::string to_snake_case(std::string_view name)
	{
		const std::size_t prefix = leading_underscores(name);
		std::string out(name.substr(0, prefix));
		out.reserve(name.size() + 4);

		for (std::size_t i = prefix; i < name.size(); ++i)
		{
			const char c = name[i];
			if (!is_upper(c))
			{
				out.push_back(c);
				continue;
			}

			/* a word boundary is either lower->Upper or the last capital of
			 * an acronym followed by a lowercase letter e.g. `HTTPServer` */
			if (i > prefix && out.back() != '_')
			{
				const char prev = name[i - 1];
				const bool next_lower = i + 1 < name.size() && std::islower(static_cast<unsigned char>(name[i + 1]));
				if (is_lower_or_digit(prev) || (is_upper(prev) && next_lower))
					out.push_back('_');
			}
			out.push_back(lower(c));
		}
		return out;
	}

	std::string to_camel_case(std::string_view name)
	{
		const std::size_t prefix = leading_underscores(name);
		std::string out(name.substr(0, prefix));
		out.reserve(name.size());

		bool capitalize = false;
		for (std::size_t i = prefix; i < name.size(); ++i)
		{
			const char c = name[i];
			if (c == '_')
			{
				/* trailing underscores stay as they are */
				if (i + 1 == name.size())
					out.push_back(c);
				else
					capitalize = true;
				continue;
			}

			out.push_back(capitalize ? upper(c) : c);
			capitalize = false;
		}
		return out;
	}

	std::string_view strip_underscore(std::string_view name)
	{
		return name.substr(leading_underscores(name));
	}

	std::string canonical_name(std::string_view name)
	{
		std::string key = to_snake_case(strip_underscore(name));
		for (char &c: key)
			c = lower(c);
		return key;
	}

	bool fuzzy_equal(std::string_view lhs, std::string_view rhs)
	{
		if (lhs == rhs)
			return true;
		return canonical_name(lhs) == canonical_name(rhs);
	}

	void for_each_identifier(std::string_view code, const std::function<void(std::string_view)> &fn)
	{
		std::size_t i = 0;
		while (i < code.size())
		{
			const char c = code[i];
			if (c == '"' || c == '\'')
			{
				/* quoted text is opaque apart from interpolation spans */
				const char quote = c;
				++i;
				while (i < code.size() && code[i] != quote)
				{
					if (code[i] == '\\' && i + 1 < code.size())
					{
						i += 2;
						continue;
					}
					if (code[i] == '#' && i + 1 < code.size() && code[i + 1] == '{')
					{
						const std::size_t close = closing_brace(code, i + 1);
						for_each_identifier(code.substr(i + 2, close - (i + 2)), fn);
						i = close + 1;
						continue;
					}
					++i;
				}
				++i;
				continue;
			}

			if (c == '#')
			{
				/* line comment */
				while (i < code.size() && code[i] != '\n')
					++i;
				continue;
			}

			if (!is_identifier_char(c))
			{
				++i;
				continue;
			}

			const std::size_t begin = i;
			while (i < code.size() && is_identifier_char(code[i]))
				++i;

			if (!std::isdigit(static_cast<unsigned char>(code[begin])))
				fn(code.substr(begin, i - begin));
		}
	}

	void for_each_interpolation(std::string_view text, const std::function<void(std::string_view)> &fn)
	{
		std::size_t i = 0;
		while (i + 1 < text.size())
		{
			if (text[i] == '\\')
			{
				i += 2;
				continue;
			}
			if (text[i] != '#' || text[i + 1] != '{')
			{
				++i;
				continue;
			}

			const std::size_t close = closing_brace(text, i + 1);
			fn(text.substr(i + 2, close - (i + 2)));
			i = close + 1;
		}
	}
}
