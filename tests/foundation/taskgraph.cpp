/* this project is part of the Rill project; licensed under the MIT license. see LICENSE for more info */

#include <memory>
#include <string>
#include <vector>
#include <rill/foundation/pass-manager.hpp>
#include <rill/foundation/taskgraph.hpp>
#include <gtest/gtest.h>

class TaskGraphFixture : public testing::Test
{
protected:
	void SetUp() override
	{
		sink = std::make_unique<rill::DiagnosticSink>(nullptr);
		graph = std::make_unique<rill::TaskGraph>(*sink);
	}

	void TearDown() override
	{
		graph.reset();
		sink.reset();
	}

	static rill::PassDescriptor pass(std::string name, std::vector<std::string> run_after = {})
	{
		return rill::make_pass(std::move(name), "", [](rill::NodePtr n) { return n; }, std::move(run_after));
	}

	std::unique_ptr<rill::DiagnosticSink> sink;
	std::unique_ptr<rill::TaskGraph> graph;
};

TEST_F(TaskGraphFixture, DeclarationOrderWithoutEdges)
{
	graph->add(pass("c")).add(pass("a")).add(pass("b"));
	EXPECT_EQ(graph->execution_order(), (std::vector<std::string>{ "c", "a", "b" }));
	EXPECT_TRUE(sink->empty());
}

TEST_F(TaskGraphFixture, RunAfterMovesPassLater)
{
	graph->add(pass("a", { "b" })).add(pass("b")).add(pass("c"));
	/* b is ready first, then a (declared before c) */
	EXPECT_EQ(graph->execution_order(), (std::vector<std::string>{ "b", "a", "c" }));
}

TEST_F(TaskGraphFixture, DuplicateFirstDeclarationWins)
{
	graph->add(pass("a")).add(pass("b")).add(pass("a", { "b" }));

	EXPECT_EQ(graph->pass_count(), 2);
	EXPECT_EQ(graph->execution_order(), (std::vector<std::string>{ "a", "b" }));
	ASSERT_EQ(sink->count(rill::DiagnosticKind::DUPLICATE_PASS), 1);
	EXPECT_EQ(sink->diagnostics()[0].message, "duplicate pass 'a' dropped; keeping the declaration at position 1");
}

TEST_F(TaskGraphFixture, DanglingEdgeIsIgnored)
{
	graph->add(pass("a", { "ghost" })).add(pass("b"));

	EXPECT_EQ(graph->execution_order(), (std::vector<std::string>{ "a", "b" }));
	ASSERT_EQ(sink->count(rill::DiagnosticKind::MISSING_DEPENDENCY), 1);
	EXPECT_EQ(sink->diagnostics()[0].message, "pass 'a' runs after unknown pass 'ghost'; edge ignored");
}

TEST_F(TaskGraphFixture, CycleBrokenByDeclarationOrder)
{
	graph->add(pass("a", { "b" })).add(pass("b", { "a" })).add(pass("c"));

	EXPECT_EQ(graph->execution_order(), (std::vector<std::string>{ "a", "b", "c" }));
	ASSERT_EQ(sink->count(rill::DiagnosticKind::DEPENDENCY_CYCLE), 1);
	EXPECT_EQ(sink->diagnostics()[0].message, "dependency cycle 'a' -> 'b' -> 'a'; dropping 'a' run-after 'b'");
}

TEST_F(TaskGraphFixture, LongerCycleKeepsOtherEdges)
{
	graph->add(pass("a", { "c" })).add(pass("b", { "a" })).add(pass("c", { "b" })).add(pass("d", { "a" }));

	const auto order = graph->execution_order();
	EXPECT_EQ(order, (std::vector<std::string>{ "a", "b", "c", "d" }));
	EXPECT_EQ(sink->count(rill::DiagnosticKind::DEPENDENCY_CYCLE), 1);
}

TEST_F(TaskGraphFixture, SelfEdgeIsDropped)
{
	graph->add(pass("a", { "a" }));
	EXPECT_EQ(graph->execution_order(), (std::vector<std::string>{ "a" }));
	EXPECT_EQ(sink->count(rill::DiagnosticKind::DEPENDENCY_CYCLE), 1);
}

TEST_F(TaskGraphFixture, PassWithoutRewriteIsDropped)
{
	rill::PassDescriptor empty;
	empty.name = "nothing";
	graph->add(std::move(empty)).add(pass("a"));

	EXPECT_FALSE(graph->contains("nothing"));
	EXPECT_EQ(graph->pass_count(), 1);
	EXPECT_EQ(sink->count(rill::DiagnosticKind::EMPTY_PASS), 1);
}

TEST_F(TaskGraphFixture, GroupsConcatenateInOrder)
{
	rill::PassGroup first{ "first", {} };
	first.passes.push_back(pass("x"));
	first.passes.push_back(pass("y"));
	rill::PassGroup second{ "second", {} };
	second.passes.push_back(pass("z", { "x" }));

	graph->add(std::move(second)).add(std::move(first));
	/* z only waits for x; y is declared after z */
	EXPECT_EQ(graph->execution_order(), (std::vector<std::string>{ "x", "z", "y" }));
}

TEST_F(TaskGraphFixture, OrderReportListsEnabledPasses)
{
	auto off = pass("off");
	off.enabled = false;
	graph->add(pass("b", { "a" })).add(pass("a")).add(std::move(off)).add(pass("c"));

	EXPECT_EQ(graph->order_report(), "1. a\n2. b\n3. c\n");

	rill::PassConfig config;
	config.disable("b").enable("off");
	EXPECT_EQ(graph->order_report(config), "1. a\n2. off\n3. c\n");
}

TEST(TaskGraphTest, OrderIsDeterministic)
{
	const auto build_order = []
	{
		rill::DiagnosticSink sink(nullptr);
		rill::TaskGraph graph(sink);
		for (int i = 0; i < 20; ++i)
		{
			std::vector<std::string> after;
			if (i % 3 == 0 && i > 0)
				after.push_back("p" + std::to_string(i - 2));
			if (i % 5 == 4)
				after.push_back("p" + std::to_string(i + 1));
			graph.add(rill::make_pass("p" + std::to_string(i), "", [](rill::NodePtr n) { return n; }, after));
		}
		return std::make_pair(graph.execution_order(), sink.diagnostics());
	};

	const auto first = build_order();
	for (int run = 0; run < 5; ++run)
		EXPECT_EQ(build_order(), first);
}
