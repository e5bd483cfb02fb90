#include <benchmark/benchmark.h>
#include "chunkstream/crypto/hash.hpp"
#include "chunkstream/crypto/random.hpp"
#include "chunkstream/storage/chunker.hpp"
#include "chunkstream/storage/chunk_store.hpp"
#include <algorithm>
#include <random>
#include <span>
#include <vector>

using namespace chunkstream;
using namespace chunkstream::crypto;

class HashBenchmarkFixture : public benchmark::Fixture {
public:
    void SetUp(const ::benchmark::State& state) override {
        std::mt19937 rng(42);
        std::uniform_int_distribution<int> dist(0, 255);
        data_.resize(static_cast<size_t>(state.range(0)));
        for (auto& b : data_) {
            b = static_cast<uint8_t>(dist(rng));
        }
    }

    void TearDown(const ::benchmark::State&) override {
        data_.clear();
    }

protected:
    std::vector<uint8_t> data_;
};

// Content address of one chunk, the per-chunk cost on both sides
BENCHMARK_DEFINE_F(HashBenchmarkFixture, ChunkId)(benchmark::State& state) {
    for (auto _ : state) {
        auto id = Sha256Hasher::hash(data_);
        benchmark::DoNotOptimize(id);
    }
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK_REGISTER_F(HashBenchmarkFixture, ChunkId)->Arg(4 * 1024)->Arg(64 * 1024)->Arg(256 * 1024);

BENCHMARK_DEFINE_F(HashBenchmarkFixture, IncrementalHash)(benchmark::State& state) {
    for (auto _ : state) {
        Sha256Hasher hasher;
        for (size_t offset = 0; offset < data_.size(); offset += 4096) {
            auto length = std::min<size_t>(4096, data_.size() - offset);
            benchmark::DoNotOptimize(hasher.update(std::span<const uint8_t>(data_).subspan(offset, length)));
        }
        auto hash = hasher.finalize();
        benchmark::DoNotOptimize(hash);
    }
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK_REGISTER_F(HashBenchmarkFixture, IncrementalHash)->Arg(1024 * 1024);

// Chunking into memory covers hashing, copying and the manifest root
BENCHMARK_DEFINE_F(HashBenchmarkFixture, ChunkBytes)(benchmark::State& state) {
    storage::Chunker chunker(256 * 1024);
    for (auto _ : state) {
        storage::MemoryChunkStore store;
        storage::Manifest manifest;
        auto result = chunker.chunk_bytes(data_, "bench", store, manifest);
        if (!result) {
            state.SkipWithError(result.message.c_str());
            break;
        }
        benchmark::DoNotOptimize(manifest);
    }
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK_REGISTER_F(HashBenchmarkFixture, ChunkBytes)->Arg(4 * 1024 * 1024)->Arg(32 * 1024 * 1024);

static void BM_ManifestRoot(benchmark::State& state) {
    std::vector<storage::ChunkDescriptor> chunks;
    for (uint32_t i = 0; i < static_cast<uint32_t>(state.range(0)); ++i) {
        storage::ChunkDescriptor descriptor{};
        descriptor.index = i;
        descriptor.size = 256 * 1024;
        if (!SecureRandom::generate_bytes(descriptor.chunk_id)) {
            state.SkipWithError("random source unavailable");
            return;
        }
        chunks.push_back(descriptor);
    }

    for (auto _ : state) {
        auto root = storage::Manifest::compute_file_hash(chunks);
        benchmark::DoNotOptimize(root);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK(BM_ManifestRoot)->Arg(16)->Arg(1024);

static void BM_RandomSessionId(benchmark::State& state) {
    if (!initialize()) {
        state.SkipWithError("libsodium initialization failed");
        return;
    }
    for (auto _ : state) {
        auto id = SecureRandom::generate_hex(8);
        benchmark::DoNotOptimize(id);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_RandomSessionId);

BENCHMARK_MAIN();
