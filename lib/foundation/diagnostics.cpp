/* this project is part of the Rill project; licensed under the MIT license. see LICENSE for more info */

#include <algorithm>
#include <iostream>
#include <print>
#include <rill/foundation/diagnostics.hpp>

namespace rill
{
	std::string_view to_string(const DiagnosticKind kind)
	{
		switch (kind)
		{
			case DiagnosticKind::DUPLICATE_PASS:
				return "duplicate-pass";
			case DiagnosticKind::MISSING_DEPENDENCY:
				return "missing-dependency";
			case DiagnosticKind::DEPENDENCY_CYCLE:
				return "dependency-cycle";
			case DiagnosticKind::UNKNOWN_PASS_OVERRIDE:
				return "unknown-pass-override";
			case DiagnosticKind::EMPTY_PASS:
				return "empty-pass";
		}
		return "unknown";
	}

	DiagnosticSink::DiagnosticSink() : os(&std::cerr) {}

	DiagnosticSink::DiagnosticSink(std::ostream *os) : os(os) {}

	const std::vector<Diagnostic> &DiagnosticSink::diagnostics() const
	{
		return records;
	}

	std::size_t DiagnosticSink::count(const DiagnosticKind kind) const
	{
		return static_cast<std::size_t>(std::ranges::count_if(records, [kind](const Diagnostic &d)
		{
			return d.kind == kind;
		}));
	}

	bool DiagnosticSink::empty() const
	{
		return records.empty();
	}

	void DiagnosticSink::clear()
	{
		records.clear();
	}

	void DiagnosticSink::emit(Diagnostic diagnostic)
	{
		if (os)
			std::println(*os, "rill: warning [{}]: {}", to_string(diagnostic.kind), diagnostic.message);
		records.push_back(std::move(diagnostic));
	}
}
