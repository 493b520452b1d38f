/* this project is part of the Rill project; licensed under the MIT license. see LICENSE for more info */

#include <algorithm>
#include <format>
#include <functional>
#include <queue>
#include <rill/foundation/pass-manager.hpp>
#include <rill/foundation/taskgraph.hpp>

namespace rill
{
	TaskGraph::TaskGraph(DiagnosticSink &sink) : sink(&sink) {}

	TaskGraph &TaskGraph::add(PassDescriptor pass)
	{
		if (const auto it = name_to_node.find(pass.name);
			it != name_to_node.end())
		{
			sink->report(DiagnosticKind::DUPLICATE_PASS,
			             "duplicate pass '{}' dropped; keeping the declaration at position {}",
			             pass.name, it->second + 1);
			return *this;
		}
		if (!pass.has_rewrite())
		{
			sink->report(DiagnosticKind::EMPTY_PASS, "pass '{}' has no rewrite function; dropped", pass.name);
			return *this;
		}

		const std::size_t index = nodes.size();
		name_to_node.emplace(pass.name, index);
		TaskNode &node = nodes.emplace_back();
		node.pass = std::move(pass);
		node.index = index;
		resolved = false;
		return *this;
	}

	TaskGraph &TaskGraph::add(PassGroup group)
	{
		for (PassDescriptor &pass: group.passes)
			add(std::move(pass));
		return *this;
	}

	PassManager TaskGraph::build(PassConfig config)
	{
		return PassManager(std::move(*this), std::move(config));
	}

	std::size_t TaskGraph::pass_count() const
	{
		return nodes.size();
	}

	bool TaskGraph::contains(const std::string &name) const
	{
		return name_to_node.contains(name);
	}

	std::vector<std::string> TaskGraph::execution_order()
	{
		resolve();
		std::vector<std::string> names;
		names.reserve(order.size());
		for (const std::size_t idx: order)
			names.push_back(nodes[idx].pass.name);
		return names;
	}

	std::string TaskGraph::order_report(const PassConfig &config)
	{
		resolve();
		std::string report;
		std::size_t position = 0;
		for (const std::size_t idx: order)
		{
			if (!config.is_enabled(nodes[idx].pass))
				continue;
			report += std::format("{}. {}\n", ++position, nodes[idx].pass.name);
		}
		return report;
	}

	DiagnosticSink &TaskGraph::diagnostics() const
	{
		return *sink;
	}

	void TaskGraph::resolve()
	{
		if (resolved)
			return;
		build_dependencies();
		break_cycles();
		topological_sort();
		resolved = true;
	}

	void TaskGraph::build_dependencies()
	{
		/* reset all dependency connections */
		for (TaskNode &node: nodes)
		{
			node.depends_on.clear();
			node.dependents.clear();
			node.in_degree = 0;
		}

		/* edge dep -> node for each `run_after` entry */
		for (TaskNode &node: nodes)
		{
			for (const std::string &dep_name: node.pass.run_after)
			{
				const auto it = name_to_node.find(dep_name);
				if (it == name_to_node.end())
				{
					sink->report(DiagnosticKind::MISSING_DEPENDENCY,
					             "pass '{}' runs after unknown pass '{}'; edge ignored",
					             node.pass.name, dep_name);
					continue;
				}

				const std::size_t dep = it->second;
				if (dep == node.index)
				{
					sink->report(DiagnosticKind::DEPENDENCY_CYCLE,
					             "pass '{}' runs after itself; edge dropped", node.pass.name);
					continue;
				}
				if (std::ranges::find(node.depends_on, dep) != node.depends_on.end())
					continue;

				nodes[dep].dependents.push_back(node.index);
				node.depends_on.push_back(dep);
			}
		}
	}

	void TaskGraph::break_cycles()
	{
		std::vector<std::uint8_t> state(nodes.size(), 0);
		std::vector<std::size_t> stack;
		std::vector<std::pair<std::size_t, std::size_t>> back_edges;

		for (std::size_t i = 0; i < nodes.size(); ++i)
		{
			if (state[i] == 0)
				dfs_cycle_check(i, state, stack, back_edges);
		}

		/* without its DFS back edges the graph is acyclic */
		for (const auto &[from, to]: back_edges)
		{
			std::erase(nodes[from].dependents, to);
			std::erase(nodes[to].depends_on, from);
		}

		for (TaskNode &node: nodes)
			node.in_degree = node.depends_on.size();
	}

	void TaskGraph::dfs_cycle_check(const std::size_t node,
	                                std::vector<std::uint8_t> &state,
	                                std::vector<std::size_t> &stack,
	                                std::vector<std::pair<std::size_t, std::size_t>> &back_edges)
	{
		state[node] = 1;
		stack.push_back(node);
		for (const std::size_t dependent: nodes[node].dependents)
		{
			if (state[dependent] == 1)
			{
				std::string path;
				const auto start = std::ranges::find(stack, dependent);
				for (auto it = start; it != stack.end(); ++it)
					path += std::format("'{}' -> ", nodes[*it].pass.name);
				path += std::format("'{}'", nodes[dependent].pass.name);

				sink->report(DiagnosticKind::DEPENDENCY_CYCLE,
				             "dependency cycle {}; dropping '{}' run-after '{}'",
				             path, nodes[dependent].pass.name, nodes[node].pass.name);
				back_edges.emplace_back(node, dependent);
				continue;
			}

			if (state[dependent] == 0)
				dfs_cycle_check(dependent, state, stack, back_edges);
		}

		stack.pop_back();
		state[node] = 2;
	}

	void TaskGraph::topological_sort()
	{
		order.clear();
		order.reserve(nodes.size());

		std::vector<std::size_t> in_degree(nodes.size());
		std::priority_queue<std::size_t, std::vector<std::size_t>, std::greater<>> ready;
		for (const TaskNode &node: nodes)
		{
			in_degree[node.index] = node.in_degree;
			if (node.in_degree == 0)
				ready.push(node.index);
		}

		while (!ready.empty())
		{
			const std::size_t idx = ready.top();
			ready.pop();
			order.push_back(idx);
			for (const std::size_t dependent: nodes[idx].dependents)
			{
				if (--in_degree[dependent] == 0)
					ready.push(dependent);
			}
		}
	}
}
