/* this project is part of the Rill project; licensed under the MIT license. see LICENSE for more info */

#pragma once

#include <iostream>
#include <string>

namespace rill
{
	struct Node;
	struct Pattern;

	/**
	 * @brief Render a target tree as compact single-line target-language text
	 *
	 * The rendering depends only on the tree, so identical trees always
	 * render byte-identically. Block statements are separated by `; `.
	 *
	 * @param node Node to dump
	 * @param os Output stream (defaults to stdout)
	 */
	void dump(const Node &node, std::ostream &os = std::cout);

	/**
	 * @brief Render a pattern
	 * @param pattern Pattern to dump
	 * @param os Output stream (defaults to stdout)
	 */
	void dump(const Pattern &pattern, std::ostream &os = std::cout);

	/**
	 * @brief Render into a string
	 */
	[[nodiscard]] std::string to_string(const Node &node);

	[[nodiscard]] std::string to_string(const Pattern &pattern);

	/**
	 * @brief Debug dump to stderr followed by a newline
	 */
	void dump_dbg(const Node &node);
}
