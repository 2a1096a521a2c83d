#include <benchmark/benchmark.h>
#include "chunkrelay/crypto/hash.hpp"
#include "chunkrelay/storage/memory_sink.hpp"
#include "chunkrelay/storage/table.hpp"
#include "chunkrelay/transfer/bounded_buffer.hpp"
#include "chunkrelay/transfer/metadata_source.hpp"
#include "chunkrelay/transfer/transfer_session.hpp"
#include <algorithm>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace chunkrelay;
using namespace chunkrelay::transfer;

namespace {

std::vector<uint8_t> make_payload(size_t size) {
    std::vector<uint8_t> data(size);
    for (size_t i = 0; i < size; ++i) {
        data[i] = static_cast<uint8_t>((i * 131 + 17) & 0xFF);
    }
    return data;
}

// Serves ranges straight out of memory, revealing the size like a 206 does.
class InMemorySource : public ChunkSource {
public:
    explicit InMemorySource(const std::vector<uint8_t>& data) : data_(data) {}

    TransferResult fetch(uint64_t offset, uint64_t length, FetchResponse& response, std::stop_token) override {
        uint64_t end = std::min<uint64_t>(data_.size(), offset + length);
        if (offset < end) {
            response.data.assign(data_.begin() + static_cast<std::ptrdiff_t>(offset),
                                 data_.begin() + static_cast<std::ptrdiff_t>(end));
        }
        response.object_size = data_.size();
        response.end_of_object = end >= data_.size();
        return TransferResult::ok();
    }

private:
    const std::vector<uint8_t>& data_;
};

std::string make_csv(size_t rows) {
    std::string csv = "id,name,amount,comment\n";
    for (size_t i = 0; i < rows; ++i) {
        csv += std::to_string(i) + ",item-" + std::to_string(i) + "," + std::to_string(i * 3) +
               ",\"quoted, with comma\"\n";
    }
    return csv;
}

}

// Whole session against in-memory endpoints: the pipeline overhead alone.
static void BM_TransferSession(benchmark::State& state) {
    const auto size = static_cast<size_t>(state.range(0));
    const auto chunk_size = static_cast<uint64_t>(state.range(1));
    auto payload = make_payload(size);

    TransferOptions options;
    options.chunk_size = chunk_size;
    options.buffer_chunks = 4;

    FixedSizeMetadataSource metadata(size);
    uint64_t iteration = 0;

    for (auto _ : state) {
        InMemorySource source(payload);
        storage::MemorySink sink;

        TransferSpec spec;
        spec.object_id = "bench.bin";
        spec.total_size = size;
        spec.chunk_size = chunk_size;
        spec.buffer_capacity = 4;
        spec.destination = "memory://bench";

        TransferSession session("bench_" + std::to_string(iteration++), spec, options, metadata, source, sink);
        auto outcome = session.run();
        if (!outcome.success()) {
            state.SkipWithError(outcome.error.describe().c_str());
            break;
        }
        benchmark::DoNotOptimize(sink.data().data());
    }

    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(size));
}
BENCHMARK(BM_TransferSession)
    ->Args({1 << 20, 64 << 10})
    ->Args({1 << 20, 256 << 10})
    ->Args({8 << 20, 1 << 20})
    ->Unit(benchmark::kMillisecond);

// One producer, one consumer, handing chunks through the buffer.
static void BM_BoundedBufferHandoff(benchmark::State& state) {
    const auto items = static_cast<int>(state.range(0));
    std::vector<uint8_t> chunk_data(4096, 0x5a);

    for (auto _ : state) {
        BoundedBuffer<Chunk> buffer(8);
        std::stop_source stop;

        std::jthread producer([&] {
            for (int i = 0; i < items; ++i) {
                Chunk chunk;
                chunk.offset = static_cast<uint64_t>(i) * chunk_data.size();
                chunk.data = chunk_data;
                if (!buffer.push(std::move(chunk), stop.get_token())) {
                    return;
                }
            }
            buffer.close();
        });

        uint64_t consumed = 0;
        while (auto* chunk = buffer.peek(stop.get_token())) {
            consumed += chunk->data.size();
            buffer.release();
        }
        benchmark::DoNotOptimize(consumed);
    }

    state.SetItemsProcessed(state.iterations() * items);
}
BENCHMARK(BM_BoundedBufferHandoff)->Arg(1000);

static void BM_ContentHash(benchmark::State& state) {
    auto payload = make_payload(static_cast<size_t>(state.range(0)));

    for (auto _ : state) {
        crypto::ContentHasher hasher;
        hasher.update(payload);
        benchmark::DoNotOptimize(hasher.finalize());
    }

    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK(BM_ContentHash)->Range(4 << 10, 8 << 20);

static void BM_Sha256(benchmark::State& state) {
    auto payload = make_payload(static_cast<size_t>(state.range(0)));

    for (auto _ : state) {
        benchmark::DoNotOptimize(crypto::Sha256::hash(payload));
    }

    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK(BM_Sha256)->Range(4 << 10, 1 << 20);

static void BM_ParseCsv(benchmark::State& state) {
    auto csv = make_csv(static_cast<size_t>(state.range(0)));
    std::span<const uint8_t> bytes(reinterpret_cast<const uint8_t*>(csv.data()), csv.size());

    for (auto _ : state) {
        storage::Table table;
        auto result = storage::Table::parse_csv(bytes, storage::Table::CsvOptions{}, table);
        if (!result) {
            state.SkipWithError(result.message.c_str());
            break;
        }
        benchmark::DoNotOptimize(table.row_count());
    }

    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(csv.size()));
}
BENCHMARK(BM_ParseCsv)->Arg(100)->Arg(10000);

BENCHMARK_MAIN();
