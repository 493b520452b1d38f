/* this project is part of the Rill project; licensed under the MIT license. see LICENSE for more info */

#pragma once

#include <rill/foundation/ast.hpp>
#include <rill/foundation/pass.hpp>

namespace rill
{
	/**
	 * @brief Splice blocks nested directly in blocks and unwrap single-statement blocks
	 */
	NodePtr flatten_blocks(NodePtr root);

	/**
	 * @brief Rename variables, binders, pins and function names to snake_case
	 *
	 * Leading hygiene underscores are kept. Atoms, fields, struct keys and
	 * module names are left alone.
	 */
	NodePtr snake_case_identifiers(NodePtr root);

	/**
	 * @brief Remove `x = x`; in value position it becomes `x`
	 */
	NodePtr eliminate_self_assignments(NodePtr root);

	/**
	 * @brief Drop variables, literals and anonymous functions whose value is discarded
	 */
	NodePtr drop_pure_statements(NodePtr root);

	/**
	 * @brief The `normalization` group, in declaration order
	 */
	[[nodiscard]] PassGroup normalization_passes();
}
