/* this project is part of the Rill project; licensed under the MIT license. see LICENSE for more info */

#include <rill/foundation/builder.hpp>
#include <rill/support/dump.hpp>
#include <rill/transform/hygiene.hpp>
#include <gtest/gtest.h>

namespace make = rill::make;

namespace
{
	std::string text(const rill::NodePtr &node)
	{
		return node ? rill::to_string(*node) : "<null>";
	}
}

TEST(UnderscoreUnusedParamsTest, DefinitionParams)
{
	auto root = make::def("pick", make::patterns(make::bind("a"), make::bind("b"), make::bind("_c")), make::var("a"));
	EXPECT_EQ(text(rill::underscore_unused_params(std::move(root))), "def pick(a, _b, _c) do a end");
}

TEST(UnderscoreUnusedParamsTest, DestructuredParamsAndPins)
{
	auto root = make::def("first", make::patterns(
		make::ptuple(make::patterns(make::bind("a"), make::bind("b"))),
		make::pin("limit")), make::var("a"));
	EXPECT_EQ(text(rill::underscore_unused_params(std::move(root))), "def first({a, _b}, ^limit) do a end");
}

TEST(UnderscoreUnusedParamsTest, ClosureParams)
{
	auto root = make::remote("Enum", "map", make::nodes(
		make::var("pairs"),
		make::fn(make::patterns(make::bind("key"), make::bind("value")), make::var("value"))));
	EXPECT_EQ(text(rill::underscore_unused_params(std::move(root))), "Enum.map(pairs, fn _key, value -> value end)");
}

TEST(UnderscoreUnusedParamsTest, InnerClosureDoesNotUseOuterParam)
{
	/* the inner `x` shadows the outer one */
	auto root = make::def("wrap", make::patterns(make::bind("x")),
	                      make::fn(make::patterns(make::bind("x")), make::var("x")));
	EXPECT_EQ(text(rill::underscore_unused_params(std::move(root))), "def wrap(_x) do fn x -> x end end");
}

TEST(UnderscoreUnusedParamsTest, GuardUse)
{
	auto root = make::def("positive", make::patterns(make::bind("n")), make::boolean(true), false,
	                      make::binary(">", make::var("n"), make::integer(0)));
	EXPECT_EQ(text(rill::underscore_unused_params(std::move(root))), "def positive(n) when n > 0 do true end");
}

TEST(UnderscoreUnusedLocalsTest, PrefixesUnreadBindings)
{
	auto root = make::block(make::nodes(
		make::assign("a", make::integer(1)),
		make::match(make::ptuple(make::patterns(make::bind("b"), make::bind("c"))), make::call("pair")),
		make::binary("+", make::var("a"), make::var("c"))));
	EXPECT_EQ(text(rill::underscore_unused_locals(std::move(root))), "(a = 1; {_b, c} = pair(); a + c)");
}

TEST(UnderscoreUnusedLocalsTest, RebindingReadsPreviousValue)
{
	auto root = make::block(make::nodes(
		make::assign("x", make::integer(1)),
		make::assign("x", make::binary("+", make::var("x"), make::integer(1))),
		make::var("x")));
	EXPECT_EQ(text(rill::underscore_unused_locals(std::move(root))), "(x = 1; x = x + 1; x)");
}

TEST(UnderscoreUnusedLocalsTest, OverwrittenBeforeAnyRead)
{
	auto root = make::block(make::nodes(
		make::assign("x", make::call("f")),
		make::assign("x", make::call("g")),
		make::var("x")));
	EXPECT_EQ(text(rill::underscore_unused_locals(std::move(root))), "(_x = f(); x = g(); x)");

	auto nested = make::block(make::nodes(
		make::assign("x", make::call("f")),
		make::call("log", make::nodes(make::var("x"))),
		make::assign("x", make::call("g")),
		make::var("x")));
	EXPECT_EQ(text(rill::underscore_unused_locals(std::move(nested))), "(x = f(); log(x); x = g(); x)");
}

TEST(UnderscoreUnusedLocalsTest, InterpolationCountsAsUse)
{
	auto root = make::block(make::nodes(
		make::assign("name", make::call("fetch")),
		make::assign("unused", make::integer(0)),
		make::string("hello #{name}")));
	EXPECT_EQ(text(rill::underscore_unused_locals(std::move(root))),
	          "(name = fetch(); _unused = 0; \"hello #{name}\")");
}

TEST(UnderscoreUnusedLocalsTest, ClosureBodies)
{
	auto root = make::fn(make::patterns(), make::block(make::nodes(
		make::assign("t", make::integer(1)),
		make::integer(2))));
	EXPECT_EQ(text(rill::underscore_unused_locals(std::move(root))), "fn -> _t = 1; 2 end");
}

TEST(UnderscoreUnusedLocalsTest, SplicedBlockIsLeftAlone)
{
	/* bindings of a spliced block are visible to the statements after it */
	auto root = make::block(make::nodes(
		make::block(make::nodes(
			make::assign("a", make::integer(1)),
			make::assign("b", make::integer(2)))),
		make::var("a")));
	EXPECT_EQ(text(rill::underscore_unused_locals(std::move(root))), "((a = 1; b = 2); a)");
}

TEST(RestoreUsedUnderscoredTest, DefinitionParam)
{
	auto root = make::def("inc", make::patterns(make::bind("_x")),
	                      make::binary("+", make::var("x"), make::integer(1)));
	EXPECT_EQ(text(rill::restore_used_underscored(std::move(root))), "def inc(x) do x + 1 end");
}

TEST(RestoreUsedUnderscoredTest, KeepsGenuineUnderscoredUses)
{
	auto used = make::def("id", make::patterns(make::bind("_x")), make::var("_x"));
	EXPECT_EQ(text(rill::restore_used_underscored(std::move(used))), "def id(_x) do _x end");

	/* `x` is already bound in the same function */
	auto taken = make::def("second", make::patterns(make::bind("_x"), make::bind("x")), make::var("x"));
	EXPECT_EQ(text(rill::restore_used_underscored(std::move(taken))), "def second(_x, x) do x end");

	auto unused = make::def("drop", make::patterns(make::bind("_x")), make::atom("ok"));
	EXPECT_EQ(text(rill::restore_used_underscored(std::move(unused))), "def drop(_x) do :ok end");
}

TEST(RestoreUsedUnderscoredTest, LocalsAndClosures)
{
	auto root = make::block(make::nodes(
		make::assign("_total", make::integer(0)),
		make::remote("Enum", "each", make::nodes(
			make::var("items"),
			make::fn(make::patterns(make::bind("_item")), make::call("print", make::nodes(make::var("item")))))),
		make::binary("+", make::var("total"), make::integer(1))));
	EXPECT_EQ(text(rill::restore_used_underscored(std::move(root))),
	          "(total = 0; Enum.each(items, fn item -> print(item) end); total + 1)");
}

TEST(HygieneGroupTest, OrderedAfterSnakeCase)
{
	const rill::PassGroup group = rill::hygiene_passes();
	EXPECT_EQ(group.name, "hygiene");
	ASSERT_EQ(group.passes.size(), 3);
	EXPECT_EQ(group.passes[0].name, "restore-used-underscored");
	EXPECT_EQ(group.passes[0].run_after, (std::vector<std::string>{ "snake-case-identifiers" }));
	EXPECT_EQ(group.passes[1].name, "underscore-unused-params");
	EXPECT_EQ(group.passes[2].name, "underscore-unused-locals");
	EXPECT_EQ(group.passes[2].run_after, (std::vector<std::string>{ "underscore-unused-params" }));
}

TEST(HygieneGroupTest, PassesAreIdempotent)
{
	const auto build = []
	{
		return make::def("calc", make::patterns(make::bind("a"), make::bind("_b"), make::bind("unused")), make::block(make::nodes(
			make::assign("tmp", make::binary("*", make::var("a"), make::var("b"))),
			make::assign("scratch", make::integer(0)),
			make::var("tmp"))));
	};

	auto once = build();
	for (const rill::PassDescriptor &pass: rill::hygiene_passes().passes)
		once = pass.run(std::move(once));
	EXPECT_EQ(text(once), "def calc(a, b, _unused) do tmp = a * b; _scratch = 0; tmp end");

	auto twice = rill::clone(once.get());
	for (const rill::PassDescriptor &pass: rill::hygiene_passes().passes)
		twice = pass.run(std::move(twice));
	EXPECT_TRUE(rill::equal(once.get(), twice.get())) << text(twice);
}
