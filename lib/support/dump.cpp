/* this project is part of the Rill project; licensed under the MIT license. see LICENSE for more info */

#include <cctype>
#include <format>
#include <sstream>
#include <rill/foundation/ast.hpp>
#include <rill/support/dump.hpp>

namespace rill
{
	namespace
	{
		std::string escape(const std::string &text)
		{
			std::string out;
			out.reserve(text.size());
			for (const char c: text)
			{
				switch (c)
				{
					case '"':
						out += "\\\"";
						break;
					case '\\':
						out += "\\\\";
						break;
					case '\n':
						out += "\\n";
						break;
					case '\t':
						out += "\\t";
						break;
					default:
						out.push_back(c);
				}
			}
			return out;
		}

		std::string format_float(const double value)
		{
			std::string text = std::format("{}", value);
			if (text.find_first_of(".eEn") == std::string::npos)
				text += ".0";
			return text;
		}

		class Printer
		{
		public:
			explicit Printer(std::ostream &os) : os(os) {}

			void print(const Node *node)
			{
				if (!node)
				{
					os << "nil";
					return;
				}
				std::visit([this](const auto &n) { emit(n); }, node->data);
			}

			void print(const Pattern *pattern)
			{
				if (!pattern)
				{
					os << "_";
					return;
				}
				std::visit([this](const auto &p) { emit(p); }, pattern->data);
			}

		private:
			std::ostream &os;

			template<typename T>
			void print_list(const std::vector<std::unique_ptr<T>> &items)
			{
				for (std::size_t i = 0; i < items.size(); ++i)
				{
					if (i)
						os << ", ";
					print(items[i].get());
				}
			}

			/* statement sequence without surrounding delimiters */
			void print_body(const Node *node)
			{
				if (const auto *block = as<ast::Block>(node))
				{
					for (std::size_t i = 0; i < block->stmts.size(); ++i)
					{
						if (i)
							os << "; ";
						print(block->stmts[i].get());
					}
					return;
				}
				print(node);
			}

			void print_operand(const Node *node)
			{
				if (is<ast::Binary>(node) || is<ast::Match>(node))
				{
					os << '(';
					print(node);
					os << ')';
					return;
				}
				print(node);
			}

			void print_clauses(const std::vector<ast::Clause> &clauses)
			{
				for (std::size_t i = 0; i < clauses.size(); ++i)
				{
					if (i)
						os << "; ";
					print(clauses[i].pattern.get());
					if (clauses[i].guard)
					{
						os << " when ";
						print(clauses[i].guard.get());
					}
					os << " -> ";
					print_body(clauses[i].body.get());
				}
			}

			void emit_literal(const ast::Literal &n)
			{
				switch (n.kind)
				{
					case LiteralKind::NIL:
						os << "nil";
						break;
					case LiteralKind::BOOL:
						os << (std::get<bool>(n.value) ? "true" : "false");
						break;
					case LiteralKind::INT:
						os << std::get<std::int64_t>(n.value);
						break;
					case LiteralKind::FLOAT:
						os << format_float(std::get<double>(n.value));
						break;
					case LiteralKind::STRING:
						os << '"' << escape(std::get<std::string>(n.value)) << '"';
						break;
					case LiteralKind::ATOM:
						os << ':' << std::get<std::string>(n.value);
						break;
					case LiteralKind::ALIAS:
						os << std::get<std::string>(n.value);
						break;
				}
			}

			void emit(const ast::Var &n)
			{
				os << n.name;
			}

			void emit(const ast::Literal &n)
			{
				emit_literal(n);
			}

			void emit(const ast::Raw &n)
			{
				os << n.code;
			}

			void emit(const ast::Block &n)
			{
				os << '(';
				for (std::size_t i = 0; i < n.stmts.size(); ++i)
				{
					if (i)
						os << "; ";
					print(n.stmts[i].get());
				}
				os << ')';
			}

			void emit(const ast::Binary &n)
			{
				print_operand(n.lhs.get());
				if (n.op == ".." || n.op == "//")
					os << n.op;
				else
					os << ' ' << n.op << ' ';
				print_operand(n.rhs.get());
			}

			void emit(const ast::Unary &n)
			{
				os << n.op;
				if (!n.op.empty() && std::isalpha(static_cast<unsigned char>(n.op.back())))
					os << ' ';
				print_operand(n.operand.get());
			}

			void emit(const ast::Match &n)
			{
				print(n.pattern.get());
				os << " = ";
				print(n.value.get());
			}

			void emit(const ast::If &n)
			{
				os << "if ";
				print(n.cond.get());
				os << " do ";
				print_body(n.then_branch.get());
				if (n.else_branch)
				{
					os << " else ";
					print_body(n.else_branch.get());
				}
				os << " end";
			}

			void emit(const ast::Case &n)
			{
				os << "case ";
				print(n.subject.get());
				os << " do ";
				print_clauses(n.clauses);
				os << " end";
			}

			void emit(const ast::With &n)
			{
				os << "with ";
				for (std::size_t i = 0; i < n.clauses.size(); ++i)
				{
					if (i)
						os << ", ";
					print(n.clauses[i].pattern.get());
					os << " <- ";
					print(n.clauses[i].value.get());
				}
				os << " do ";
				print_body(n.body.get());
				if (!n.else_clauses.empty())
				{
					os << " else ";
					print_clauses(n.else_clauses);
				}
				os << " end";
			}

			void emit(const ast::For &n)
			{
				os << "for ";
				for (std::size_t i = 0; i < n.generators.size(); ++i)
				{
					if (i)
						os << ", ";
					print(n.generators[i].pattern.get());
					os << " <- ";
					print(n.generators[i].source.get());
				}
				for (const auto &filter: n.filters)
				{
					os << ", ";
					print(filter.get());
				}
				if (n.into)
				{
					os << ", into: ";
					print(n.into.get());
				}
				os << ", do: ";
				print(n.body.get());
			}

			void emit(const ast::Fn &n)
			{
				os << "fn ";
				for (std::size_t i = 0; i < n.clauses.size(); ++i)
				{
					if (i)
						os << "; ";
					print_list(n.clauses[i].params);
					if (n.clauses[i].guard)
					{
						os << " when ";
						print(n.clauses[i].guard.get());
					}
					os << (n.clauses[i].params.empty() ? "-> " : " -> ");
					print_body(n.clauses[i].body.get());
				}
				os << " end";
			}

			void emit(const ast::Call &n)
			{
				os << n.name << '(';
				print_list(n.args);
				os << ')';
			}

			void emit(const ast::RemoteCall &n)
			{
				print(n.target.get());
				os << '.' << n.name << '(';
				print_list(n.args);
				os << ')';
			}

			void emit(const ast::Apply &n)
			{
				print(n.fun.get());
				os << ".(";
				print_list(n.args);
				os << ')';
			}

			void emit(const ast::Field &n)
			{
				print(n.target.get());
				os << '.' << n.name;
			}

			void emit(const ast::Index &n)
			{
				print(n.target.get());
				os << '[';
				print(n.key.get());
				os << ']';
			}

			void emit(const ast::List &n)
			{
				os << '[';
				print_list(n.elems);
				os << ']';
			}

			void emit(const ast::Tuple &n)
			{
				os << '{';
				print_list(n.elems);
				os << '}';
			}

			void emit(const ast::Map &n)
			{
				os << "%{";
				for (std::size_t i = 0; i < n.entries.size(); ++i)
				{
					if (i)
						os << ", ";
					print(n.entries[i].key.get());
					os << " => ";
					print(n.entries[i].value.get());
				}
				os << '}';
			}

			void emit(const ast::Struct &n)
			{
				os << '%' << n.module << '{';
				for (std::size_t i = 0; i < n.fields.size(); ++i)
				{
					if (i)
						os << ", ";
					os << n.fields[i].name << ": ";
					print(n.fields[i].value.get());
				}
				os << '}';
			}

			void emit(const ast::Try &n)
			{
				os << "try do ";
				print_body(n.body.get());
				if (!n.rescue_clauses.empty())
				{
					os << " rescue ";
					print_clauses(n.rescue_clauses);
				}
				if (!n.catch_clauses.empty())
				{
					os << " catch ";
					print_clauses(n.catch_clauses);
				}
				if (n.after)
				{
					os << " after ";
					print_body(n.after.get());
				}
				os << " end";
			}

			void emit(const ast::Receive &n)
			{
				os << "receive do ";
				print_clauses(n.clauses);
				if (n.after_timeout)
				{
					os << " after ";
					print(n.after_timeout.get());
					os << " -> ";
					print_body(n.after_body.get());
				}
				os << " end";
			}

			void emit(const ast::Def &n)
			{
				os << (n.is_private ? "defp " : "def ") << n.name << '(';
				print_list(n.params);
				os << ')';
				if (n.guard)
				{
					os << " when ";
					print(n.guard.get());
				}
				os << " do ";
				print_body(n.body.get());
				os << " end";
			}

			void emit(const ast::Module &n)
			{
				os << "defmodule " << n.name << " do ";
				for (std::size_t i = 0; i < n.body.size(); ++i)
				{
					if (i)
						os << "; ";
					print(n.body[i].get());
				}
				os << " end";
			}

			void emit(const pat::Bind &p)
			{
				os << p.name;
			}

			void emit(const pat::Literal &p)
			{
				emit_literal(p.value);
			}

			void emit(const pat::Tuple &p)
			{
				os << '{';
				print_list(p.elems);
				os << '}';
			}

			void emit(const pat::List &p)
			{
				os << '[';
				print_list(p.elems);
				os << ']';
			}

			void emit(const pat::Cons &p)
			{
				os << '[';
				print(p.head.get());
				os << " | ";
				print(p.tail.get());
				os << ']';
			}

			void emit(const pat::Map &p)
			{
				os << "%{";
				for (std::size_t i = 0; i < p.entries.size(); ++i)
				{
					if (i)
						os << ", ";
					print(p.entries[i].key.get());
					os << " => ";
					print(p.entries[i].value.get());
				}
				os << '}';
			}

			void emit(const pat::Struct &p)
			{
				os << '%' << p.module << '{';
				for (std::size_t i = 0; i < p.fields.size(); ++i)
				{
					if (i)
						os << ", ";
					os << p.fields[i].name << ": ";
					print(p.fields[i].value.get());
				}
				os << '}';
			}

			void emit(const pat::Pin &p)
			{
				os << '^' << p.name;
			}

			void emit(const pat::Alias &p)
			{
				print(p.pattern.get());
				os << " = " << p.name;
			}

			void emit(const pat::Binary &p)
			{
				os << "<<";
				for (std::size_t i = 0; i < p.segments.size(); ++i)
				{
					if (i)
						os << ", ";
					print(p.segments[i].value.get());
					if (!p.segments[i].spec.empty())
						os << "::" << p.segments[i].spec;
				}
				os << ">>";
			}
		};
	}

	void dump(const Node &node, std::ostream &os)
	{
		Printer(os).print(&node);
	}

	void dump(const Pattern &pattern, std::ostream &os)
	{
		Printer(os).print(&pattern);
	}

	std::string to_string(const Node &node)
	{
		std::ostringstream os;
		dump(node, os);
		return os.str();
	}

	std::string to_string(const Pattern &pattern)
	{
		std::ostringstream os;
		dump(pattern, os);
		return os.str();
	}

	void dump_dbg(const Node &node)
	{
		dump(node, std::cerr);
		std::cerr << '\n';
	}
}
