/* this project is part of the Rill project; licensed under the MIT license. see LICENSE for more info */

#include <format>
#include <random>
#include <string>
#include <vector>
#include <rill/analysis/usage-index.hpp>
#include <rill/foundation/builder.hpp>
#include <benchmark/benchmark.h>

namespace
{
	/* `v_i = v_j + v_k` chains with a fixed seed; every statement reads two
	 * earlier names so the suffix sets stay dense */
	std::vector<rill::NodePtr> generate_statements(const std::size_t count)
	{
		std::mt19937 rng(42);
		std::vector<rill::NodePtr> stmts;
		stmts.reserve(count);
		for (std::size_t i = 0; i < count; ++i)
		{
			std::uniform_int_distribution<std::size_t> pick(0, i == 0 ? 0 : i - 1);
			auto lhs = rill::make::var(std::format("v{}", pick(rng)));
			auto rhs = rill::make::var(std::format("v{}", pick(rng)));
			stmts.push_back(rill::make::assign(std::format("v{}", i),
			                                   rill::make::binary("+", std::move(lhs), std::move(rhs))));
		}
		return stmts;
	}
}

static void BM_SuffixIndex(benchmark::State &state)
{
	const auto count = static_cast<std::size_t>(state.range(0));
	const auto stmts = generate_statements(count);

	for (auto _: state)
	{
		const auto index = rill::UsageIndex::build(stmts);
		std::size_t live = 0;
		for (std::size_t i = 0; i < count; ++i)
			live += index.used_later(i + 1, std::format("v{}", i)) ? 1 : 0;
		benchmark::DoNotOptimize(live);
	}
	state.SetComplexityN(state.range(0));
}

static void BM_BruteForceScan(benchmark::State &state)
{
	const auto count = static_cast<std::size_t>(state.range(0));
	const auto stmts = generate_statements(count);

	for (auto _: state)
	{
		std::size_t live = 0;
		for (std::size_t i = 0; i < count; ++i)
			live += rill::brute_force_used_later(stmts, i + 1, std::format("v{}", i)) ? 1 : 0;
		benchmark::DoNotOptimize(live);
	}
	state.SetComplexityN(state.range(0));
}

BENCHMARK(BM_SuffixIndex)->RangeMultiplier(4)->Range(64, 4096)->Complexity()->Unit(benchmark::kMicrosecond);
BENCHMARK(BM_BruteForceScan)->RangeMultiplier(4)->Range(64, 4096)->Complexity()->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
