/* this project is part of the Rill project; licensed under the MIT license. see LICENSE for more info */

#pragma once

#include <cstdint>
#include <format>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace rill
{
	/**
	 * @brief Category of a scheduler/configuration finding
	 */
	enum class DiagnosticKind : std::uint8_t
	{
		/** @brief A later pass reused an existing name and was dropped */
		DUPLICATE_PASS,
		/** @brief A `run_after` edge names no known pass; the edge is ignored */
		MISSING_DEPENDENCY,
		/** @brief A `run_after` cycle; the closing edge is dropped */
		DEPENDENCY_CYCLE,
		/** @brief A configuration override names no known pass */
		UNKNOWN_PASS_OVERRIDE,
		/** @brief A descriptor without any rewrite function; dropped */
		EMPTY_PASS
	};

	[[nodiscard]] std::string_view to_string(DiagnosticKind kind);

	struct Diagnostic
	{
		DiagnosticKind kind;
		std::string message;

		bool operator==(const Diagnostic &) const = default;
	};

	/**
	 * @brief Developer-visible diagnostics channel
	 *
	 * Records every finding in emission order and echoes it to a stream.
	 * Findings are never promoted to errors.
	 */
	class DiagnosticSink
	{
	public:
		/**
		 * @brief Sink that echoes to standard error
		 */
		DiagnosticSink();

		/**
		 * @param os Stream to echo to; null records without echoing
		 */
		explicit DiagnosticSink(std::ostream *os);

		/**
		 * @brief Record a finding and echo it
		 * @param kind Finding category
		 * @param fmt Format string
		 * @param args Format arguments
		 */
		template<typename... Args>
		void report(const DiagnosticKind kind, std::format_string<Args...> fmt, Args&&... args)
		{
			emit(Diagnostic{ kind, std::format(fmt, std::forward<Args>(args)...) });
		}

		[[nodiscard]] const std::vector<Diagnostic> &diagnostics() const;

		[[nodiscard]] std::size_t count(DiagnosticKind kind) const;

		[[nodiscard]] bool empty() const;

		void clear();

	private:
		std::ostream *os;
		std::vector<Diagnostic> records;

		void emit(Diagnostic diagnostic);
	};
}
