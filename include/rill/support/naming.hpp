/* this project is part of the Rill project; licensed under the MIT license. see LICENSE for more info */

#pragma once

#include <functional>
#include <string>
#include <string_view>

namespace rill
{
	/**
	 * @brief Check whether a character may appear inside an identifier
	 */
	[[nodiscard]] bool is_identifier_char(char c);

	/**
	 * @brief Convert `camelCase` / `PascalCase` to `snake_case`
	 *
	 * Leading underscores are preserved. Names that are already snake case
	 * are returned unchanged.
	 */
	[[nodiscard]] std::string to_snake_case(std::string_view name);

	/**
	 * @brief Convert `snake_case` to `camelCase`; leading underscores are preserved
	 */
	[[nodiscard]] std::string to_camel_case(std::string_view name);

	/**
	 * @brief Strip all leading hygiene underscores
	 * @note The bare wildcard `_` becomes empty
	 */
	[[nodiscard]] std::string_view strip_underscore(std::string_view name);

	/**
	 * @brief Canonical key under which case-style and underscore variants collide
	 *
	 * `userName`, `user_name`, `_user_name` and `_userName` all share
	 * the key `user_name`.
	 */
	[[nodiscard]] std::string canonical_name(std::string_view name);

	/**
	 * @brief Check whether two names are the same modulo case style and hygiene prefix
	 */
	[[nodiscard]] bool fuzzy_equal(std::string_view lhs, std::string_view rhs);

	/**
	 * @brief Visit every identifier token of a raw code fragment
	 *
	 * A token is a maximal run of identifier characters that does not start
	 * with a digit. Tokens inside string quotes are skipped except for the
	 * content of `#{...}` interpolation spans.
	 *
	 * @param code Code text to scan
	 * @param fn Callback receiving each token
	 */
	void for_each_identifier(std::string_view code, const std::function<void(std::string_view)> &fn);

	/**
	 * @brief Visit the code of every `#{...}` span inside a string literal value
	 * @param text Literal text
	 * @param fn Callback receiving the code between the braces
	 */
	void for_each_interpolation(std::string_view text, const std::function<void(std::string_view)> &fn);
}
