/**
 * @file bench_multipart_upload.cpp
 * @brief Benchmarks for end-to-end put() against an in-memory service
 */

#include <benchmark/benchmark.h>

#include <kcenon/blob/client/blob_client.h>

#include "support/fake_blob_service.h"
#include "utils/benchmark_helpers.h"

#include <boost/asio/io_context.hpp>

#include <chrono>
#include <memory>
#include <string>

namespace kcenon::blob::benchmark {

namespace {

constexpr const char* bench_token = "vercel_blob_rw_bench_secret";

auto bench_config(std::size_t concurrency) -> blob_config {
    blob_config config;
    config.api_url = "http://blob.bench/api";
    config.multipart.part_size = min_part_size;
    config.multipart.threshold = min_part_size;
    config.multipart.max_concurrent_parts = concurrency;
    return config;
}

}  // namespace

/**
 * @brief Threaded model: blocking service with a per-part latency
 */
static void BM_MultipartUpload_Threaded(::benchmark::State& state) {
    const auto body_size = static_cast<std::size_t>(state.range(0));
    const auto concurrency = static_cast<std::size_t>(state.range(1));
    auto data = generate_random_data(body_size, 42);

    auto service = std::make_shared<test::fake_blob_service>();
    service->set_upload_delay(std::chrono::milliseconds(5));
    auto client = blob_client::builder()
                      .with_config(bench_config(concurrency))
                      .with_token(bench_token)
                      .with_transport(service)
                      .build();
    if (!client) {
        state.SkipWithError(client.error().message.c_str());
        return;
    }

    for (auto _ : state) {
        auto blob = client.value().put("bench/threaded.bin", data);
        if (!blob) {
            state.SkipWithError(blob.error().message.c_str());
            return;
        }
        ::benchmark::DoNotOptimize(blob.value().url);
    }

    state.SetBytesProcessed(static_cast<int64_t>(body_size) *
                            static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Cooperative model: asynchronous service on one io_context
 */
static void BM_MultipartUpload_Cooperative(::benchmark::State& state) {
    const auto body_size = static_cast<std::size_t>(state.range(0));
    const auto concurrency = static_cast<std::size_t>(state.range(1));
    auto data = generate_random_data(body_size, 42);

    boost::asio::io_context io;
    auto service = std::make_shared<test::fake_blob_service>(io);
    service->set_upload_delay(std::chrono::milliseconds(5));
    auto client = blob_client::builder()
                      .with_config(bench_config(concurrency))
                      .with_token(bench_token)
                      .with_execution_model(execution_model::cooperative)
                      .with_io_context(io)
                      .with_transport(service)
                      .build();
    if (!client) {
        state.SkipWithError(client.error().message.c_str());
        return;
    }

    for (auto _ : state) {
        auto blob = client.value().put("bench/cooperative.bin", data);
        if (!blob) {
            state.SkipWithError(blob.error().message.c_str());
            return;
        }
        ::benchmark::DoNotOptimize(blob.value().url);
    }

    state.SetBytesProcessed(static_cast<int64_t>(body_size) *
                            static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_MultipartUpload_Threaded)
    ->Args({sizes::large_body, 1})
    ->Args({sizes::large_body, 6})
    ->Unit(::benchmark::kMillisecond)
    ->UseRealTime();

BENCHMARK(BM_MultipartUpload_Cooperative)
    ->Args({sizes::large_body, 1})
    ->Args({sizes::large_body, 6})
    ->Unit(::benchmark::kMillisecond)
    ->UseRealTime();

}  // namespace kcenon::blob::benchmark
