/* this project is part of the Rill project; licensed under the MIT license. see LICENSE for more info */

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace rill
{
	struct Node;
	struct Pattern;

	using NodePtr = std::unique_ptr<Node>;
	using PatternPtr = std::unique_ptr<Pattern>;

	/**
	 * @brief Kind of a literal value in the target language
	 */
	enum class LiteralKind : std::uint8_t
	{
		/** @brief `nil` */
		NIL,
		/** @brief `true` / `false` */
		BOOL,
		/** @brief Integer literal */
		INT,
		/** @brief Float literal */
		FLOAT,
		/** @brief String literal; may carry `#{...}` interpolation spans */
		STRING,
		/** @brief Atom literal e.g. `:ok` */
		ATOM,
		/** @brief Module alias e.g. `Enum` */
		ALIAS
	};

	using LiteralValue = std::variant<std::monostate, bool, std::int64_t, double, std::string>;

	/* expression variants. every child is owned outright by its parent;
	 * nullable children are documented per field */
	namespace ast
	{
		/** @brief Reference to a variable; never binds */
		struct Var
		{
			std::string name;
		};

		struct Literal
		{
			LiteralKind kind = LiteralKind::NIL;
			LiteralValue value;
		};

		/** @brief Pass-through code fragment; scanned by token boundary */
		struct Raw
		{
			std::string code;
		};

		struct Block
		{
			std::vector<NodePtr> stmts;
		};

		struct Binary
		{
			std::string op;
			NodePtr lhs;
			NodePtr rhs;
		};

		struct Unary
		{
			std::string op;
			NodePtr operand;
		};

		/** @brief Assignment-as-match; `pattern = value` */
		struct Match
		{
			PatternPtr pattern;
			NodePtr value;
		};

		struct If
		{
			NodePtr cond;
			NodePtr then_branch;
			/** @brief Nullable */
			NodePtr else_branch;
		};

		/** @brief A single `pattern when guard -> body` arm */
		struct Clause
		{
			PatternPtr pattern;
			/** @brief Nullable */
			NodePtr guard;
			NodePtr body;
		};

		struct Case
		{
			NodePtr subject;
			std::vector<Clause> clauses;
		};

		struct WithClause
		{
			PatternPtr pattern;
			NodePtr value;
		};

		struct With
		{
			std::vector<WithClause> clauses;
			NodePtr body;
			std::vector<Clause> else_clauses;
		};

		struct Generator
		{
			PatternPtr pattern;
			NodePtr source;
		};

		/** @brief Comprehension; generators bind left to right */
		struct For
		{
			std::vector<Generator> generators;
			std::vector<NodePtr> filters;
			/** @brief Nullable */
			NodePtr into;
			NodePtr body;
		};

		struct FnClause
		{
			std::vector<PatternPtr> params;
			/** @brief Nullable */
			NodePtr guard;
			NodePtr body;
		};

		/** @brief Anonymous function with one or more clauses */
		struct Fn
		{
			std::vector<FnClause> clauses;
		};

		/** @brief Local call `name(args)` */
		struct Call
		{
			std::string name;
			std::vector<NodePtr> args;
		};

		/** @brief Remote call `target.name(args)`; target is usually an alias */
		struct RemoteCall
		{
			NodePtr target;
			std::string name;
			std::vector<NodePtr> args;
		};

		/** @brief Anonymous function application `fun.(args)` */
		struct Apply
		{
			NodePtr fun;
			std::vector<NodePtr> args;
		};

		struct Field
		{
			NodePtr target;
			std::string name;
		};

		struct Index
		{
			NodePtr target;
			NodePtr key;
		};

		struct List
		{
			std::vector<NodePtr> elems;
		};

		struct Tuple
		{
			std::vector<NodePtr> elems;
		};

		struct MapEntry
		{
			NodePtr key;
			NodePtr value;
		};

		struct Map
		{
			std::vector<MapEntry> entries;
		};

		struct StructField
		{
			std::string name;
			NodePtr value;
		};

		struct Struct
		{
			std::string module;
			std::vector<StructField> fields;
		};

		struct Try
		{
			NodePtr body;
			std::vector<Clause> rescue_clauses;
			std::vector<Clause> catch_clauses;
			/** @brief Nullable */
			NodePtr after;
		};

		struct Receive
		{
			std::vector<Clause> clauses;
			/** @brief Nullable; present together with `after_body` */
			NodePtr after_timeout;
			NodePtr after_body;
		};

		/** @brief Named function definition inside a module */
		struct Def
		{
			std::string name;
			std::vector<PatternPtr> params;
			/** @brief Nullable */
			NodePtr guard;
			NodePtr body;
			bool is_private = false;
		};

		struct Module
		{
			std::string name;
			std::vector<NodePtr> body;
		};
	}

	using NodeData = std::variant<
		ast::Var,
		ast::Literal,
		ast::Raw,
		ast::Block,
		ast::Binary,
		ast::Unary,
		ast::Match,
		ast::If,
		ast::Case,
		ast::With,
		ast::For,
		ast::Fn,
		ast::Call,
		ast::RemoteCall,
		ast::Apply,
		ast::Field,
		ast::Index,
		ast::List,
		ast::Tuple,
		ast::Map,
		ast::Struct,
		ast::Try,
		ast::Receive,
		ast::Def,
		ast::Module>;

	/**
	 * @brief Target AST node
	 *
	 * Expression position never binds a name. Bindings only happen through
	 * `Pattern` children of `Match`, clauses, generators and function heads.
	 */
	struct Node
	{
		NodeData data;
	};

	/* pattern variants; the match/bind side of the tree */
	namespace pat
	{
		/** @brief Binds `name`; the bare `_` binds nothing */
		struct Bind
		{
			std::string name;
		};

		struct Literal
		{
			ast::Literal value;
		};

		struct Tuple
		{
			std::vector<PatternPtr> elems;
		};

		struct List
		{
			std::vector<PatternPtr> elems;
		};

		/** @brief `[head | tail]` */
		struct Cons
		{
			PatternPtr head;
			PatternPtr tail;
		};

		struct MapEntry
		{
			PatternPtr key;
			PatternPtr value;
		};

		struct Map
		{
			std::vector<MapEntry> entries;
		};

		struct StructField
		{
			std::string name;
			PatternPtr value;
		};

		struct Struct
		{
			std::string module;
			std::vector<StructField> fields;
		};

		/** @brief `^name`; a use of an existing binding, never a new one */
		struct Pin
		{
			std::string name;
		};

		/** @brief `pattern = name` */
		struct Alias
		{
			PatternPtr pattern;
			std::string name;
		};

		struct Segment
		{
			PatternPtr value;
			std::string spec;
		};

		struct Binary
		{
			std::vector<Segment> segments;
		};
	}

	using PatternData = std::variant<
		pat::Bind,
		pat::Literal,
		pat::Tuple,
		pat::List,
		pat::Cons,
		pat::Map,
		pat::Struct,
		pat::Pin,
		pat::Alias,
		pat::Binary>;

	struct Pattern
	{
		PatternData data;
	};

	/**
	 * @brief Deep copy a node and everything below it
	 * @param node Node to copy; may be null
	 * @return Independent copy, or null if `node` is null
	 */
	NodePtr clone(const Node *node);

	/**
	 * @brief Deep copy a pattern
	 * @param pattern Pattern to copy; may be null
	 * @return Independent copy, or null if `pattern` is null
	 */
	PatternPtr clone(const Pattern *pattern);

	/**
	 * @brief Structural equality over two trees
	 * @note Two null pointers are equal; a null and a non-null are not
	 */
	[[nodiscard]] bool equal(const Node *lhs, const Node *rhs);

	[[nodiscard]] bool equal(const Pattern *lhs, const Pattern *rhs);

	/**
	 * @brief Check whether a bind name is the bare wildcard `_`
	 */
	[[nodiscard]] bool is_wildcard(const std::string &name);

	/**
	 * @brief Check whether a node holds a given variant
	 */
	template<typename T>
	[[nodiscard]] bool is(const Node *node)
	{
		return node && std::holds_alternative<T>(node->data);
	}

	template<typename T>
	[[nodiscard]] bool is(const Pattern *pattern)
	{
		return pattern && std::holds_alternative<T>(pattern->data);
	}

	/**
	 * @brief Get a variant from a node or null if it holds another one
	 */
	template<typename T>
	T *as(Node *node)
	{
		return node ? std::get_if<T>(&node->data) : nullptr;
	}

	template<typename T>
	const T *as(const Node *node)
	{
		return node ? std::get_if<T>(&node->data) : nullptr;
	}

	template<typename T>
	T *as(Pattern *pattern)
	{
		return pattern ? std::get_if<T>(&pattern->data) : nullptr;
	}

	template<typename T>
	const T *as(const Pattern *pattern)
	{
		return pattern ? std::get_if<T>(&pattern->data) : nullptr;
	}
}
