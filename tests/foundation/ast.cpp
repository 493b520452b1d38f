/* this project is part of the Rill project; licensed under the MIT license. see LICENSE for more info */

#include <rill/foundation/ast.hpp>
#include <rill/foundation/builder.hpp>
#include <rill/support/dump.hpp>
#include <gtest/gtest.h>

namespace make = rill::make;

class AstFixture : public testing::Test
{
protected:
	void SetUp() override
	{
		std::vector<rill::ast::Clause> clauses;
		clauses.push_back(make::clause(
			make::ptuple(make::patterns(make::plit(make::atom("ok")), make::bind("value"))),
			make::binary("+", make::var("value"), make::var("offset")),
			make::call("is_integer", make::nodes(make::var("value")))));
		clauses.push_back(make::clause(make::wildcard(), make::integer(0)));

		tree = make::def("shift", make::patterns(make::bind("result"), make::bind("offset")),
		                 make::block(make::nodes(
			                 make::assign("base", make::case_of(make::var("result"), std::move(clauses))),
			                 make::remote("Enum", "map", make::nodes(
				                 make::list(make::nodes(make::var("base"))),
				                 make::fn(make::patterns(make::bind("x")), make::var("x"))))
		                 )));
	}

	void TearDown() override
	{
		tree.reset();
	}

	rill::NodePtr tree;
};

TEST_F(AstFixture, CloneIsStructurallyEqual)
{
	const auto copy = rill::clone(tree.get());
	ASSERT_NE(copy.get(), nullptr);
	EXPECT_NE(copy.get(), tree.get());
	EXPECT_TRUE(rill::equal(copy.get(), tree.get()));
	EXPECT_EQ(rill::to_string(*copy), rill::to_string(*tree));
}

TEST_F(AstFixture, CloneIsIndependent)
{
	auto copy = rill::clone(tree.get());
	auto *def = rill::as<rill::ast::Def>(copy.get());
	ASSERT_NE(def, nullptr);
	def->name = "unshift";

	EXPECT_FALSE(rill::equal(copy.get(), tree.get()));
	EXPECT_EQ(rill::as<rill::ast::Def>(tree.get())->name, "shift");
}

TEST_F(AstFixture, EqualityComparesPatterns)
{
	auto copy = rill::clone(tree.get());
	auto *def = rill::as<rill::ast::Def>(copy.get());
	rill::as<rill::pat::Bind>(def->params[1].get())->name = "_offset";
	EXPECT_FALSE(rill::equal(copy.get(), tree.get()));
}

TEST(AstTest, NullHandling)
{
	EXPECT_EQ(rill::clone(static_cast<const rill::Node *>(nullptr)).get(), nullptr);
	EXPECT_EQ(rill::clone(static_cast<const rill::Pattern *>(nullptr)).get(), nullptr);

	const auto x = make::var("x");
	EXPECT_TRUE(rill::equal(static_cast<const rill::Node *>(nullptr), nullptr));
	EXPECT_FALSE(rill::equal(x.get(), nullptr));
	EXPECT_FALSE(rill::equal(nullptr, x.get()));
}

TEST(AstTest, DifferentVariantsAreNotEqual)
{
	const auto var = make::var("x");
	const auto call = make::call("x");
	EXPECT_FALSE(rill::equal(var.get(), call.get()));

	const auto one = make::integer(1);
	const auto one_float = make::real(1.0);
	EXPECT_FALSE(rill::equal(one.get(), one_float.get()));
}

TEST(AstTest, OptionalChildrenTakePartInEquality)
{
	const auto with_else = make::if_else(make::var("c"), make::integer(1), make::integer(2));
	const auto without_else = make::if_else(make::var("c"), make::integer(1));
	EXPECT_FALSE(rill::equal(with_else.get(), without_else.get()));
}

TEST(AstTest, Wildcard)
{
	EXPECT_TRUE(rill::is_wildcard("_"));
	EXPECT_FALSE(rill::is_wildcard("_x"));
	EXPECT_FALSE(rill::is_wildcard("x"));
}
