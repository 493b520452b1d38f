/* this project is part of the Rill project; licensed under the MIT license. see LICENSE for more info */

#pragma once

#include <rill/foundation/ast.hpp>
#include <rill/foundation/pass.hpp>

namespace rill
{
	/**
	 * @brief Replace a block ending in `x = e; x` with a block ending in `e`
	 */
	NodePtr inline_trailing_binding(NodePtr root);

	/**
	 * @brief Turn `Module.f(args)` into the local call `f(args)` inside `Module` itself
	 * @param root Tree to rewrite
	 * @param context Supplies the module being compiled; nothing changes when it is empty
	 */
	NodePtr local_self_calls(NodePtr root, const PassContext &context);

	/**
	 * @brief The `simplification` group, in declaration order
	 */
	[[nodiscard]] PassGroup simplification_passes();
}
