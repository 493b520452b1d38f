/* this project is part of the Rill project; licensed under the MIT license. see LICENSE for more info */

#include <rill/foundation/pass-manager.hpp>
#include <rill/transform/hygiene.hpp>
#include <rill/transform/normalize.hpp>
#include <rill/transform/pipeline.hpp>
#include <rill/transform/simplify.hpp>

namespace rill
{
	std::vector<PassGroup> default_pass_groups()
	{
		std::vector<PassGroup> groups;
		groups.push_back(normalization_passes());
		groups.push_back(hygiene_passes());
		groups.push_back(simplification_passes());
		return groups;
	}

	TaskGraph &add_default_passes(TaskGraph &graph)
	{
		for (PassGroup &group: default_pass_groups())
			graph.add(std::move(group));
		return graph;
	}

	NodePtr run_default_pipeline(NodePtr root, DiagnosticSink &sink, const PassContext &context, PassConfig config)
	{
		TaskGraph graph(sink);
		add_default_passes(graph);
		const PassManager manager = graph.build(std::move(config));
		return manager.run(std::move(root), context);
	}
}
