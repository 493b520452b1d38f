/* this project is part of the Rill project; licensed under the MIT license. see LICENSE for more info */

#include <string>
#include <vector>
#include <rill/support/naming.hpp>
#include <gtest/gtest.h>

namespace
{
	std::vector<std::string> identifiers(std::string_view code)
	{
		std::vector<std::string> out;
		rill::for_each_identifier(code, [&out](std::string_view token)
		{
			out.emplace_back(token);
		});
		return out;
	}
}

TEST(NamingTest, SnakeCase)
{
	EXPECT_EQ(rill::to_snake_case("userName"), "user_name");
	EXPECT_EQ(rill::to_snake_case("UserName"), "user_name");
	EXPECT_EQ(rill::to_snake_case("user_name"), "user_name");
	EXPECT_EQ(rill::to_snake_case("HTTPServer"), "http_server");
	EXPECT_EQ(rill::to_snake_case("parseJSON"), "parse_json");
	EXPECT_EQ(rill::to_snake_case("item2Count"), "item2_count");
	EXPECT_EQ(rill::to_snake_case("x"), "x");
}

TEST(NamingTest, SnakeCaseKeepsHygienePrefix)
{
	EXPECT_EQ(rill::to_snake_case("_userName"), "_user_name");
	EXPECT_EQ(rill::to_snake_case("__Tmp"), "__tmp");
	EXPECT_EQ(rill::to_snake_case("_"), "_");
}

TEST(NamingTest, CamelCase)
{
	EXPECT_EQ(rill::to_camel_case("user_name"), "userName");
	EXPECT_EQ(rill::to_camel_case("_user_name"), "_userName");
	EXPECT_EQ(rill::to_camel_case("name"), "name");
}

TEST(NamingTest, StripUnderscore)
{
	EXPECT_EQ(rill::strip_underscore("_acc"), "acc");
	EXPECT_EQ(rill::strip_underscore("__acc"), "acc");
	EXPECT_EQ(rill::strip_underscore("acc"), "acc");
	EXPECT_EQ(rill::strip_underscore("_"), "");
}

TEST(NamingTest, CanonicalNamesCollide)
{
	EXPECT_EQ(rill::canonical_name("userName"), "user_name");
	EXPECT_EQ(rill::canonical_name("_user_name"), "user_name");
	EXPECT_EQ(rill::canonical_name("_userName"), "user_name");

	EXPECT_TRUE(rill::fuzzy_equal("userName", "_user_name"));
	EXPECT_TRUE(rill::fuzzy_equal("count", "_count"));
	EXPECT_FALSE(rill::fuzzy_equal("count", "counter"));
}

TEST(NamingTest, IdentifierTokens)
{
	EXPECT_EQ(identifiers("foo + bar_baz(1)"), (std::vector<std::string>{ "foo", "bar_baz" }));
	EXPECT_EQ(identifiers("x2 + 3y"), (std::vector<std::string>{ "x2" }));
}

TEST(NamingTest, IdentifierTokensRespectBoundaries)
{
	/* `item` must not be found inside `items` */
	const auto tokens = identifiers("items ++ [other_item]");
	EXPECT_EQ(tokens, (std::vector<std::string>{ "items", "other_item" }));
}

TEST(NamingTest, IdentifierTokensSkipStringsExceptInterpolation)
{
	const auto tokens = identifiers(R"(IO.puts("hello name #{name}"))");
	EXPECT_EQ(tokens, (std::vector<std::string>{ "IO", "puts", "name" }));
}

TEST(NamingTest, Interpolations)
{
	std::vector<std::string> spans;
	rill::for_each_interpolation("a #{x + 1} b #{y}", [&spans](std::string_view code)
	{
		spans.emplace_back(code);
	});
	EXPECT_EQ(spans, (std::vector<std::string>{ "x + 1", "y" }));
}
