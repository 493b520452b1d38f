/* this project is part of the Rill project; licensed under the MIT license. see LICENSE for more info */

#include <string>
#include <vector>
#include <rill/foundation/builder.hpp>
#include <rill/foundation/rewrite.hpp>
#include <rill/support/dump.hpp>
#include <gtest/gtest.h>

namespace make = rill::make;

TEST(RewriteTest, BottomUpVisitsChildrenFirst)
{
	auto tree = make::binary("+", make::var("a"), make::binary("*", make::var("b"), make::var("c")));

	std::vector<std::string> visited;
	tree = rill::rewrite_bottom_up(std::move(tree), [&visited](rill::NodePtr node)
	{
		visited.push_back(rill::to_string(*node));
		return node;
	});

	EXPECT_EQ(visited, (std::vector<std::string>{ "a", "b", "c", "b * c", "a + (b * c)" }));
}

TEST(RewriteTest, BottomUpReplacesNodes)
{
	auto tree = make::call("f", make::nodes(make::var("x"), make::list(make::nodes(make::var("x")))));
	tree = rill::rewrite_bottom_up(std::move(tree), [](rill::NodePtr node)
	{
		if (const auto *var = rill::as<rill::ast::Var>(node.get()); var && var->name == "x")
			return make::integer(1);
		return node;
	});
	EXPECT_EQ(rill::to_string(*tree), "f(1, [1])");
}

TEST(RewriteTest, MapChildrenSkipsPatterns)
{
	auto tree = make::match(make::bind("x"), make::var("x"));
	std::size_t calls = 0;
	rill::map_children(*tree, [&calls](rill::NodePtr child)
	{
		++calls;
		return child;
	});
	EXPECT_EQ(calls, 1);
}

TEST(RewriteTest, MapChildrenSkipsNullChildren)
{
	auto tree = make::if_else(make::var("c"), make::var("t"));
	std::size_t calls = 0;
	rill::map_children(*tree, [&calls](rill::NodePtr child)
	{
		++calls;
		return child;
	});
	EXPECT_EQ(calls, 2);
}

TEST(RewriteTest, ForEachPatternCoversHeadsAndClauses)
{
	std::vector<rill::ast::Clause> clauses;
	clauses.push_back(make::clause(make::bind("a"), make::nil()));
	clauses.push_back(make::clause(make::bind("b"), make::nil()));
	auto subject = make::case_of(make::var("v"), std::move(clauses));

	std::vector<std::string> seen;
	rill::for_each_pattern(*subject, [&seen](rill::Pattern &p)
	{
		seen.push_back(rill::to_string(p));
	});
	EXPECT_EQ(seen, (std::vector<std::string>{ "a", "b" }));

	auto def = make::def("f", make::patterns(make::bind("x"), make::pin("y")), make::nil());
	seen.clear();
	rill::for_each_pattern(*def, [&seen](rill::Pattern &p)
	{
		seen.push_back(rill::to_string(p));
	});
	EXPECT_EQ(seen, (std::vector<std::string>{ "x", "^y" }));
}

TEST(RewriteTest, CollapseBlock)
{
	auto single = rill::collapse_block(make::block(make::nodes(make::var("x"))));
	EXPECT_EQ(rill::to_string(*single), "x");

	auto pair = rill::collapse_block(make::block(make::nodes(make::var("x"), make::var("y"))));
	EXPECT_EQ(rill::to_string(*pair), "(x; y)");

	auto other = rill::collapse_block(make::var("z"));
	EXPECT_EQ(rill::to_string(*other), "z");
}

TEST(RewriteTest, RenamePatternIncludesPins)
{
	auto pattern = make::ptuple(make::patterns(make::bind("a"), make::pin("b"), make::wildcard()));
	rill::rename_pattern(*pattern, [](std::string &name)
	{
		name = name + "1";
	});
	EXPECT_EQ(rill::to_string(*pattern), "{a1, ^b1, _}");
}

TEST(RewriteTest, RenameBindersSkipsPinsAndWildcard)
{
	auto pattern = make::ptuple(make::patterns(
		make::bind("a"), make::pin("b"), make::wildcard(), make::palias(make::plist(make::patterns(make::bind("c"))), "all")));
	rill::rename_binders(*pattern, [](std::string &name)
	{
		name = "_" + name;
	});
	EXPECT_EQ(rill::to_string(*pattern), "{_a, ^b, _, [_c] = _all}");
}
