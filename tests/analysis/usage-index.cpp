/* this project is part of the Rill project; licensed under the MIT license. see LICENSE for more info */

#include <format>
#include <random>
#include <rill/analysis/usage-index.hpp>
#include <rill/foundation/builder.hpp>
#include <gtest/gtest.h>

namespace make = rill::make;

class UsageIndexFixture : public testing::Test
{
protected:
	void SetUp() override
	{
		/* 0: a = 1
		 * 1: b = a + userName
		 * 2: Enum.each(xs, fn x -> IO.puts(x) end)
		 * 3: _c = b
		 * 4: "#{b}" */
		stmts.push_back(make::assign("a", make::integer(1)));
		stmts.push_back(make::assign("b", make::binary("+", make::var("a"), make::var("userName"))));
		stmts.push_back(make::remote("Enum", "each", make::nodes(
			make::var("xs"),
			make::fn(make::patterns(make::bind("x")), make::remote("IO", "puts", make::nodes(make::var("x")))))));
		stmts.push_back(make::assign("_c", make::var("b")));
		stmts.push_back(make::string("#{b}"));
	}

	void TearDown() override
	{
		stmts.clear();
	}

	std::vector<rill::NodePtr> stmts;
};

TEST_F(UsageIndexFixture, ExactQueries)
{
	const auto index = rill::UsageIndex::build_exact(stmts);
	EXPECT_EQ(index.size(), 5);
	EXPECT_EQ(index.mode(), rill::NameMatch::EXACT);

	EXPECT_TRUE(index.used_later(0, "a"));
	EXPECT_TRUE(index.used_later(1, "a"));
	EXPECT_FALSE(index.used_later(2, "a"));

	EXPECT_TRUE(index.used_later(4, "b"));
	EXPECT_FALSE(index.used_later(5, "b"));

	EXPECT_FALSE(index.used_later(0, "x"));
	EXPECT_FALSE(index.used_later(0, "user_name"));
	EXPECT_FALSE(index.used_later(0, "c"));
}

TEST_F(UsageIndexFixture, FuzzyQueries)
{
	const auto index = rill::UsageIndex::build(stmts);
	EXPECT_EQ(index.mode(), rill::NameMatch::FUZZY);

	EXPECT_TRUE(index.used_later(0, "user_name"));
	EXPECT_TRUE(index.used_later(1, "_userName"));
	EXPECT_FALSE(index.used_later(2, "user_name"));
	EXPECT_TRUE(index.used_later(4, "_b"));
}

TEST_F(UsageIndexFixture, OutOfRangeStartIsEmpty)
{
	const auto index = rill::UsageIndex::build_exact(stmts);
	EXPECT_FALSE(index.used_later(100, "a"));
	EXPECT_TRUE(index.suffix(index.size()).empty());
	EXPECT_FALSE(index.used_later(0, ""));
}

TEST_F(UsageIndexFixture, SuffixSetsAreNested)
{
	const auto index = rill::UsageIndex::build_exact(stmts);
	EXPECT_EQ(index.suffix(0), (rill::NameSet{ "a", "b", "userName", "xs" }));
	EXPECT_EQ(index.suffix(2), (rill::NameSet{ "b", "xs" }));
	EXPECT_EQ(index.suffix(3), (rill::NameSet{ "b" }));

	for (std::size_t i = 0; i < index.size(); ++i)
	{
		const auto outer = index.suffix(i);
		for (const auto &name: index.suffix(i + 1))
			EXPECT_TRUE(outer.contains(name)) << name << " missing from suffix " << i;
	}
}

TEST_F(UsageIndexFixture, AgreesWithBruteForce)
{
	const auto exact = rill::UsageIndex::build_exact(stmts);
	const auto fuzzy = rill::UsageIndex::build(stmts);
	for (const char *name: { "a", "b", "_b", "userName", "user_name", "x", "xs", "_c", "c" })
	{
		for (std::size_t i = 0; i <= stmts.size(); ++i)
		{
			EXPECT_EQ(exact.used_later(i, name),
			          rill::brute_force_used_later(stmts, i, name, rill::NameMatch::EXACT)) << name << " @" << i;
			EXPECT_EQ(fuzzy.used_later(i, name),
			          rill::brute_force_used_later(stmts, i, name, rill::NameMatch::FUZZY)) << name << " @" << i;
		}
	}
}

TEST(UsageIndexTest, RandomStatementListsAgreeWithBruteForce)
{
	std::mt19937 rng(7);
	std::uniform_int_distribution<int> pick(0, 9);

	for (int round = 0; round < 20; ++round)
	{
		std::vector<rill::NodePtr> stmts;
		for (int i = 0; i < 30; ++i)
		{
			auto value = make::binary("+", make::var(std::format("v{}", pick(rng))),
			                          make::var(std::format("v{}", pick(rng))));
			stmts.push_back(make::assign(std::format("v{}", pick(rng)), std::move(value)));
		}

		const auto index = rill::UsageIndex::build_exact(stmts);
		for (int n = 0; n < 10; ++n)
		{
			const auto name = std::format("v{}", n);
			for (std::size_t i = 0; i <= stmts.size(); ++i)
				EXPECT_EQ(index.used_later(i, name), rill::brute_force_used_later(stmts, i, name, rill::NameMatch::EXACT));
		}
	}
}

TEST(UsageIndexTest, EmptyList)
{
	const std::vector<rill::NodePtr> stmts;
	const auto index = rill::UsageIndex::build(stmts);
	EXPECT_EQ(index.size(), 0);
	EXPECT_FALSE(index.used_later(0, "a"));
	EXPECT_TRUE(index.suffix(0).empty());
}
