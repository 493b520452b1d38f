/* this project is part of the Rill project; licensed under the MIT license. see LICENSE for more info */

#include <rill/analysis/usage.hpp>
#include <rill/foundation/builder.hpp>
#include <gtest/gtest.h>

namespace make = rill::make;

TEST(UsageTest, PlainReferences)
{
	const auto node = make::binary("+", make::var("a"), make::call("f", make::nodes(make::var("b"))));
	EXPECT_TRUE(rill::is_used(node.get(), "a"));
	EXPECT_TRUE(rill::is_used(node.get(), "b"));
	/* call names are not variable references */
	EXPECT_FALSE(rill::is_used(node.get(), "f"));
	EXPECT_FALSE(rill::is_used(node.get(), "c"));
}

TEST(UsageTest, NullAndEmpty)
{
	const auto node = make::var("a");
	EXPECT_FALSE(rill::is_used(nullptr, "a"));
	EXPECT_FALSE(rill::is_used(node.get(), ""));
	EXPECT_FALSE(rill::is_used_fuzzy(nullptr, "a"));
}

TEST(UsageTest, MatchLeftSideIsNotAUse)
{
	const auto node = make::assign("x", make::integer(1));
	EXPECT_FALSE(rill::is_used(node.get(), "x"));

	const auto rebound = make::assign("x", make::binary("+", make::var("x"), make::integer(1)));
	EXPECT_TRUE(rill::is_used(rebound.get(), "x"));
}

TEST(UsageTest, PinsAreUses)
{
	const auto node = make::match(make::ptuple(make::patterns(make::pin("expected"), make::bind("rest"))),
	                              make::var("value"));
	EXPECT_TRUE(rill::is_used(node.get(), "expected"));
	EXPECT_FALSE(rill::is_used(node.get(), "rest"));
	EXPECT_TRUE(rill::is_used(node.get(), "value"));
}

TEST(UsageTest, ClosureParameterShadowsOuterName)
{
	/* Enum.map(xs, fn x -> x * 2 end) does not use an outer `x` */
	const auto node = make::remote("Enum", "map", make::nodes(
		make::var("xs"),
		make::fn(make::patterns(make::bind("x")), make::binary("*", make::var("x"), make::integer(2)))));
	EXPECT_FALSE(rill::is_used(node.get(), "x"));
	EXPECT_TRUE(rill::is_used(node.get(), "xs"));
}

TEST(UsageTest, ClosureFreeReferenceIsAUse)
{
	const auto node = make::fn(make::patterns(make::bind("x")), make::binary("+", make::var("x"), make::var("offset")));
	EXPECT_TRUE(rill::is_used(node.get(), "offset"));
}

TEST(UsageTest, CaseClauseScopesItsBinders)
{
	std::vector<rill::ast::Clause> clauses;
	clauses.push_back(make::clause(make::ptuple(make::patterns(make::plit(make::atom("ok")), make::bind("v"))),
	                               make::var("v"),
	                               make::binary(">", make::var("v"), make::var("limit"))));
	clauses.push_back(make::clause(make::wildcard(), make::var("fallback")));
	const auto node = make::case_of(make::var("v"), std::move(clauses));

	/* the subject is outside the clause scope */
	EXPECT_TRUE(rill::is_used(node.get(), "v"));
	EXPECT_TRUE(rill::is_used(node.get(), "limit"));
	EXPECT_TRUE(rill::is_used(node.get(), "fallback"));

	std::vector<rill::ast::Clause> inner;
	inner.push_back(make::clause(make::bind("v"), make::var("v")));
	const auto shadowed = make::case_of(make::integer(1), std::move(inner));
	EXPECT_FALSE(rill::is_used(shadowed.get(), "v"));
}

TEST(UsageTest, ComprehensionGeneratorsBindSequentially)
{
	std::vector<rill::ast::Generator> generators;
	generators.push_back(make::generator(make::bind("row"), make::var("rows")));
	generators.push_back(make::generator(make::bind("cell"), make::var("row")));
	const auto node = make::comprehension(std::move(generators),
	                                      make::nodes(make::var("cell")),
	                                      make::tuple(make::nodes(make::var("row"), make::var("cell"))),
	                                      make::var("row"));

	EXPECT_TRUE(rill::is_used(node.get(), "rows"));
	EXPECT_FALSE(rill::is_used(node.get(), "cell"));
	/* `into:` is evaluated outside the generators */
	EXPECT_TRUE(rill::is_used(node.get(), "row"));
}

TEST(UsageTest, StringInterpolation)
{
	const auto node = make::string("hello #{userName}, you have #{count + 1} messages");
	EXPECT_TRUE(rill::is_used(node.get(), "userName"));
	EXPECT_TRUE(rill::is_used(node.get(), "count"));
	EXPECT_FALSE(rill::is_used(node.get(), "hello"));
	EXPECT_FALSE(rill::is_used(node.get(), "messages"));
}

TEST(UsageTest, RawCodeRespectsTokenBoundaries)
{
	const auto node = make::raw("items |> Enum.map(&(&1 * factor))");
	EXPECT_TRUE(rill::is_used(node.get(), "items"));
	EXPECT_TRUE(rill::is_used(node.get(), "factor"));
	EXPECT_FALSE(rill::is_used(node.get(), "item"));
	EXPECT_FALSE(rill::is_used(node.get(), "fact"));
}

TEST(UsageTest, FuzzyMatchesCaseAndHygieneVariants)
{
	const auto node = make::binary("+", make::var("userName"), make::var("_total"));

	EXPECT_FALSE(rill::is_used(node.get(), "user_name"));
	EXPECT_TRUE(rill::is_used_fuzzy(node.get(), "user_name"));
	EXPECT_TRUE(rill::is_used_fuzzy(node.get(), "_user_name"));
	EXPECT_TRUE(rill::is_used_fuzzy(node.get(), "total"));
	EXPECT_TRUE(rill::is_used(node.get(), "total", rill::NameMatch::FUZZY));
	EXPECT_FALSE(rill::is_used(node.get(), "total", rill::NameMatch::EXACT));
	EXPECT_FALSE(rill::is_used_fuzzy(node.get(), "totals"));
}

TEST(UsageTest, UsedNamesAndBinders)
{
	const auto node = make::block(make::nodes(
		make::match(make::ptuple(make::patterns(make::bind("a"), make::pin("b"), make::wildcard())), make::var("c")),
		make::binary("+", make::var("a"), make::var("d"))));

	EXPECT_EQ(rill::used_names(node.get()), (rill::NameSet{ "a", "b", "c", "d" }));
	EXPECT_EQ(rill::bound_names(node.get()), (rill::NameSet{ "a" }));

	const auto pattern = make::palias(make::cons(make::bind("h"), make::bind("t")), "list");
	EXPECT_EQ(rill::binders(pattern.get()), (rill::NameSet{ "h", "list", "t" }));
}

TEST(UsageTest, BoundNamesIncludeNestedScopes)
{
	const auto def = make::def("f", make::patterns(make::bind("x")), make::block(make::nodes(
		make::assign("y", make::var("x")),
		make::fn(make::patterns(make::bind("z")), make::var("z")))));
	EXPECT_EQ(rill::bound_names(def.get()), (rill::NameSet{ "x", "y", "z" }));
}

TEST(UsageTest, ScanCanStopEarly)
{
	const auto node = make::list(make::nodes(make::var("a"), make::var("b"), make::var("c")));
	std::vector<std::string> seen;
	const bool stopped = rill::scan_uses(node.get(), [&seen](std::string_view use)
	{
		seen.emplace_back(use);
		return use == "b";
	});
	EXPECT_TRUE(stopped);
	EXPECT_EQ(seen, (std::vector<std::string>{ "a", "b" }));
}

TEST(UsageTest, SequentialBlocksShadowLaterStatements)
{
	const auto node = make::block(make::nodes(
		make::assign("x", make::integer(1)),
		make::var("x")));

	EXPECT_TRUE(rill::is_used(node.get(), "x"));

	bool found = false;
	rill::scan_uses(node.get(), [&found](std::string_view use)
	{
		found = found || use == "x";
		return false;
	}, rill::ScanOptions{ .sequential_blocks = true });
	EXPECT_FALSE(found);
}
