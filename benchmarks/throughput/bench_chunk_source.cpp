/**
 * @file bench_chunk_source.cpp
 * @brief Benchmarks for slicing bodies into parts
 */

#include <benchmark/benchmark.h>

#include <kcenon/blob/core/blob_config.h>
#include <kcenon/blob/core/chunk_source.h>

#include "utils/benchmark_helpers.h"

#include <fstream>
#include <memory>

namespace kcenon::blob::benchmark {

namespace {

void drain(::benchmark::State& state, chunk_source& source) {
    while (true) {
        auto chunk = source.next();
        if (!chunk) {
            state.SkipWithError("chunk source failed");
            return;
        }
        if (!chunk.value()) {
            return;
        }
        ::benchmark::DoNotOptimize(chunk.value()->data());
    }
}

}  // namespace

/**
 * @brief In-memory buffer sliced at various part sizes
 */
static void BM_ChunkSource_Buffer(::benchmark::State& state) {
    const auto body_size = static_cast<std::size_t>(state.range(0));
    const auto part_size = static_cast<std::size_t>(state.range(1));
    auto data = generate_random_data(body_size, 42);

    for (auto _ : state) {
        state.PauseTiming();
        auto copy = data;
        state.ResumeTiming();

        auto source = chunk_source::create(std::move(copy), part_size);
        if (!source) {
            state.SkipWithError("failed to create chunk source");
            return;
        }
        drain(state, source.value());
    }

    state.SetBytesProcessed(static_cast<int64_t>(body_size) *
                            static_cast<int64_t>(state.iterations()));
}

/**
 * @brief File stream read part by part
 */
static void BM_ChunkSource_FileStream(::benchmark::State& state) {
    const auto body_size = static_cast<std::size_t>(state.range(0));
    const auto part_size = static_cast<std::size_t>(state.range(1));

    temp_file_manager temp_files;
    auto path = temp_files.create_random_file("stream_source.bin", body_size, 42);

    for (auto _ : state) {
        auto stream = std::make_shared<std::ifstream>(path, std::ios::binary);
        auto source = chunk_source::create(std::shared_ptr<std::istream>(stream), part_size);
        if (!source) {
            state.SkipWithError("failed to create chunk source");
            return;
        }
        drain(state, source.value());
    }

    state.SetBytesProcessed(static_cast<int64_t>(body_size) *
                            static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Generator delivering small pieces re-sliced into parts
 */
static void BM_ChunkSource_Generator(::benchmark::State& state) {
    const auto body_size = static_cast<std::size_t>(state.range(0));
    const auto piece_size = static_cast<std::size_t>(state.range(1));
    auto piece = generate_random_data(piece_size, 7);

    for (auto _ : state) {
        std::size_t produced = 0;
        chunk_generator generator = [&]() -> std::optional<byte_buffer> {
            if (produced >= body_size) {
                return std::nullopt;
            }
            produced += piece.size();
            return piece;
        };
        auto source = chunk_source::create(std::move(generator), min_part_size);
        if (!source) {
            state.SkipWithError("failed to create chunk source");
            return;
        }
        drain(state, source.value());
    }

    state.SetBytesProcessed(static_cast<int64_t>(body_size) *
                            static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_ChunkSource_Buffer)
    ->Args({sizes::medium_body, 5 * sizes::MB})
    ->Args({sizes::large_body, 5 * sizes::MB})
    ->Args({sizes::large_body, 8 * sizes::MB})
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_ChunkSource_FileStream)
    ->Args({sizes::medium_body, 5 * sizes::MB})
    ->Args({sizes::large_body, 8 * sizes::MB})
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_ChunkSource_Generator)
    ->Args({sizes::medium_body, sizes::small_body})
    ->Args({sizes::medium_body, sizes::MB})
    ->Unit(::benchmark::kMillisecond);

}  // namespace kcenon::blob::benchmark
