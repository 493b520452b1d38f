/* this project is part of the Rill project; licensed under the MIT license. see LICENSE for more info */

#pragma once

#include <rill/foundation/ast.hpp>
#include <rill/foundation/pass.hpp>

namespace rill
{
	/**
	 * @brief Undo a hygiene prefix on binders that turned out to be used
	 *
	 * A parameter or local `_name` is renamed back to `name` when the body
	 * never mentions `_name` but does reference `name`, and nothing else in
	 * the enclosing function binds `name`.
	 */
	NodePtr restore_used_underscored(NodePtr root);

	/**
	 * @brief Prefix function and closure parameters that are never referenced with `_`
	 */
	NodePtr underscore_unused_params(NodePtr root);

	/**
	 * @brief Prefix local match binders that no later statement references with `_`
	 *
	 * A binder overwritten by a later top-level match before any read counts
	 * as unreferenced.
	 */
	NodePtr underscore_unused_locals(NodePtr root);

	/**
	 * @brief The `hygiene` group, in declaration order
	 */
	[[nodiscard]] PassGroup hygiene_passes();
}
