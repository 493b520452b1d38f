/* this project is part of the Rill project; licensed under the MIT license. see LICENSE for more info */

#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include <rill/foundation/builder.hpp>
#include <rill/foundation/pass-manager.hpp>
#include <rill/foundation/taskgraph.hpp>
#include <rill/support/dump.hpp>
#include <gtest/gtest.h>

class PassManagerFixture : public testing::Test
{
protected:
	void SetUp() override
	{
		sink = std::make_unique<rill::DiagnosticSink>(nullptr);
		graph = std::make_unique<rill::TaskGraph>(*sink);
		execution_order.clear();
	}

	void TearDown() override
	{
		graph.reset();
		sink.reset();
	}

	/* records its name and wraps the tree in a call named after it */
	static rill::PassDescriptor tracing_pass(const std::string &name, std::vector<std::string> run_after = {})
	{
		return rill::make_pass(name, "test pass", [name](rill::NodePtr root)
		{
			execution_order.push_back(name);
			return rill::make::call(name, rill::make::nodes(std::move(root)));
		}, std::move(run_after));
	}

	std::unique_ptr<rill::DiagnosticSink> sink;
	std::unique_ptr<rill::TaskGraph> graph;
	static inline std::vector<std::string> execution_order;
};

TEST_F(PassManagerFixture, BasicPassExecution)
{
	graph->add(tracing_pass("outer", { "inner" })).add(tracing_pass("inner"));
	const auto pm = graph->build();

	EXPECT_EQ(pm.pass_count(), 2);
	const auto result = pm.run(rill::make::var("x"));

	EXPECT_EQ(execution_order, (std::vector<std::string>{ "inner", "outer" }));
	EXPECT_EQ(rill::to_string(*result), "outer(inner(x))");
}

TEST_F(PassManagerFixture, DisabledPassesNeverRun)
{
	auto off = tracing_pass("off");
	off.enabled = false;
	graph->add(tracing_pass("a")).add(std::move(off)).add(tracing_pass("b"));

	rill::PassConfig config;
	config.disable("a");
	const auto pm = graph->build(config);

	EXPECT_EQ(pm.execution_order(), (std::vector<std::string>{ "b" }));
	EXPECT_FALSE(pm.is_enabled("a"));
	EXPECT_FALSE(pm.is_enabled("off"));
	EXPECT_TRUE(pm.is_enabled("b"));

	const auto result = pm.run(rill::make::var("x"));
	EXPECT_EQ(execution_order, (std::vector<std::string>{ "b" }));
	EXPECT_EQ(rill::to_string(*result), "b(x)");
}

TEST_F(PassManagerFixture, ConfigCanEnableDefaultOffPass)
{
	auto off = tracing_pass("opt-in");
	off.enabled = false;
	graph->add(std::move(off));

	rill::PassConfig config;
	config.enable("opt-in");
	const auto pm = graph->build(config);
	EXPECT_TRUE(pm.is_enabled("opt-in"));
	EXPECT_EQ(pm.config().lookup("opt-in"), true);
}

TEST_F(PassManagerFixture, UnknownOverrideIsDiagnosed)
{
	graph->add(tracing_pass("a"));
	rill::PassConfig config;
	config.disable("does-not-exist");
	const auto pm = graph->build(config);

	ASSERT_EQ(sink->count(rill::DiagnosticKind::UNKNOWN_PASS_OVERRIDE), 1);
	EXPECT_EQ(sink->diagnostics().back().message,
	          "configuration names unknown pass 'does-not-exist'; override ignored");
	EXPECT_EQ(pm.pass_count(), 1);
}

TEST_F(PassManagerFixture, NullResultThrows)
{
	graph->add(rill::make_pass("broken", "", [](rill::NodePtr) { return rill::NodePtr{}; }));
	const auto pm = graph->build();
	EXPECT_THROW((void)pm.run(rill::make::var("x")), std::runtime_error);
}

TEST_F(PassManagerFixture, NullInputThrows)
{
	graph->add(tracing_pass("a"));
	const auto pm = graph->build();
	EXPECT_THROW((void)pm.run(nullptr), std::runtime_error);
}

TEST_F(PassManagerFixture, ObserverSeesEveryExecutedPass)
{
	graph->add(tracing_pass("first")).add(tracing_pass("second"));
	auto pm = graph->build();

	std::vector<std::string> trace;
	pm.set_observer([&trace](const rill::PassDescriptor &pass, const rill::Node &tree)
	{
		trace.push_back(pass.name + ": " + rill::to_string(tree));
	});
	(void)pm.run(rill::make::var("x"));

	EXPECT_EQ(trace, (std::vector<std::string>{ "first: first(x)", "second: second(first(x))" }));
}

TEST_F(PassManagerFixture, ContextualPassReadsContext)
{
	graph->add(rill::make_contextual_pass("ctx", "", [](rill::NodePtr root, const rill::PassContext &context)
	{
		if (context.flag("wrap"))
			return rill::make::call(std::string(context.attribute("wrapper")), rill::make::nodes(std::move(root)));
		return root;
	}));
	const auto pm = graph->build();

	rill::PassContext context;
	context.module_name = "App";
	context.attributes["wrap"] = "true";
	context.attributes["wrapper"] = "log";
	EXPECT_EQ(rill::to_string(*pm.run(rill::make::var("x"), context)), "log(x)");

	context.attributes["wrap"] = "false";
	EXPECT_EQ(rill::to_string(*pm.run(rill::make::var("x"), context)), "x");
	EXPECT_EQ(rill::to_string(*pm.run(rill::make::var("x"))), "x");
}

TEST(PassContextTest, FlagsAndAttributes)
{
	rill::PassContext context;
	context.attributes["web"] = "yes";
	context.attributes["debug"] = "false";

	EXPECT_TRUE(context.flag("web"));
	EXPECT_FALSE(context.flag("debug"));
	EXPECT_FALSE(context.flag("missing"));
	EXPECT_EQ(context.attribute("web"), "yes");
	EXPECT_EQ(context.attribute("missing"), "");
}
