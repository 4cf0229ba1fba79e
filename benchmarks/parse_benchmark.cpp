/**
 * @file parse_benchmark.cpp
 * @brief Benchmarks for parsing and formatting records
 */

#include <benchmark/benchmark.h>

#include <cstdint>
#include <string>
#include <vector>

#include <fixedwidth/fixedwidth.hpp>

#include "bench_utils.hpp"

namespace {

void SkipWithStatus(benchmark::State &state, const fixedwidth::Status &status) {
    const std::string message = status.to_string();
    state.SkipWithError(message.c_str());
}

static void BM_Format(benchmark::State &state) {
    std::unique_ptr<fixedwidth::Definition> definition;
    auto status = fixedwidth::bench::make_definition(&definition);
    if (!status.ok()) {
        SkipWithStatus(state, status);
        return;
    }
    const fixedwidth::Schema *detail = definition->schema("detail");
    const auto records = fixedwidth::bench::make_records(state.range(0));

    std::string line;
    for (auto _ : state) {
        for (const auto &record : records) {
            status = detail->format(record, &line);
            if (!status.ok()) {
                SkipWithStatus(state, status);
                return;
            }
            benchmark::DoNotOptimize(line);
        }
    }

    state.SetItemsProcessed(state.iterations() * state.range(0));
}

BENCHMARK(BM_Format)->Arg(1000)->Arg(10000);

static void BM_Parse(benchmark::State &state) {
    std::unique_ptr<fixedwidth::Definition> definition;
    auto status = fixedwidth::bench::make_definition(&definition);
    if (!status.ok()) {
        SkipWithStatus(state, status);
        return;
    }
    const fixedwidth::Schema *detail = definition->schema("detail");

    std::vector<std::string> lines;
    for (const auto &record : fixedwidth::bench::make_records(state.range(0))) {
        std::string line;
        status = detail->format(record, &line);
        if (!status.ok()) {
            SkipWithStatus(state, status);
            return;
        }
        lines.push_back(std::move(line));
    }

    fixedwidth::Record record;
    for (auto _ : state) {
        for (const auto &line : lines) {
            status = detail->parse(line, &record);
            if (!status.ok()) {
                SkipWithStatus(state, status);
                return;
            }
            benchmark::DoNotOptimize(record);
        }
    }

    state.SetItemsProcessed(state.iterations() * state.range(0));
}

BENCHMARK(BM_Parse)->Arg(1000)->Arg(10000);

static void BM_ParseLine(benchmark::State &state) {
    std::unique_ptr<fixedwidth::Definition> definition;
    auto status = fixedwidth::bench::make_definition(&definition);
    if (!status.ok()) {
        SkipWithStatus(state, status);
        return;
    }
    definition->schema("money")->set_trap([](std::string_view) { return false; });

    std::string line;
    status = definition->schema("detail")->format(fixedwidth::bench::make_records(1).front(), &line);
    if (!status.ok()) {
        SkipWithStatus(state, status);
        return;
    }

    fixedwidth::Record record;
    std::string schema_name;
    for (auto _ : state) {
        status = definition->parse_line(line, &record, &schema_name);
        if (!status.ok()) {
            SkipWithStatus(state, status);
            return;
        }
        benchmark::DoNotOptimize(record);
    }

    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_ParseLine);

}  // namespace
