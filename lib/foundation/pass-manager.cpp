/* this project is part of the Rill project; licensed under the MIT license. see LICENSE for more info */

#include <algorithm>
#include <format>
#include <ranges>
#include <stdexcept>
#include <rill/foundation/pass-manager.hpp>
#include <rill/foundation/taskgraph.hpp>

namespace rill
{
	bool PassContext::flag(std::string_view key) const
	{
		const auto it = attributes.find(key);
		return it != attributes.end() && it->second != "false";
	}

	std::string_view PassContext::attribute(std::string_view key) const
	{
		if (const auto it = attributes.find(key);
			it != attributes.end())
		{
			return it->second;
		}
		return {};
	}

	PassManager::PassManager(TaskGraph &&task_graph, PassConfig config) : pass_config(std::move(config)),
	                                                                       sink(task_graph.sink)
	{
		task_graph.resolve();

		for (const std::size_t idx: task_graph.order)
		{
			PassDescriptor &pass = task_graph.nodes[idx].pass;
			enabled.push_back(pass_config.is_enabled(pass));
			passes.push_back(std::move(pass));
		}

		for (const auto &name: pass_config.overrides() | std::views::keys)
		{
			if (!task_graph.contains(name))
			{
				sink->report(DiagnosticKind::UNKNOWN_PASS_OVERRIDE,
				             "configuration names unknown pass '{}'; override ignored", name);
			}
		}
	}

	NodePtr PassManager::run(NodePtr root, const PassContext &context) const
	{
		if (!root)
			throw std::runtime_error("PassManager::run: null input tree");

		for (std::size_t i = 0; i < passes.size(); ++i)
		{
			if (!enabled[i])
				continue;

			root = execute_single_pass(passes[i], std::move(root), context);
			if (observer)
				observer(passes[i], *root);
		}
		return root;
	}

	void PassManager::set_observer(Observer fn)
	{
		observer = std::move(fn);
	}

	std::size_t PassManager::pass_count() const
	{
		return static_cast<std::size_t>(std::ranges::count(enabled, true));
	}

	std::vector<std::string> PassManager::execution_order() const
	{
		std::vector<std::string> names;
		for (std::size_t i = 0; i < passes.size(); ++i)
		{
			if (enabled[i])
				names.push_back(passes[i].name);
		}
		return names;
	}

	bool PassManager::is_enabled(std::string_view name) const
	{
		for (std::size_t i = 0; i < passes.size(); ++i)
		{
			if (passes[i].name == name)
				return enabled[i];
		}
		return false;
	}

	const PassConfig &PassManager::config() const
	{
		return pass_config;
	}

	NodePtr PassManager::execute_single_pass(const PassDescriptor &pass, NodePtr root, const PassContext &context) const
	{
		NodePtr result = pass.is_contextual()
			                 ? pass.run_with_context(std::move(root), context)
			                 : pass.run(std::move(root));
		if (!result)
			throw std::runtime_error(std::format("pass '{}' returned a null tree", pass.name));
		return result;
	}
}
