#include <benchmark/benchmark.h>

#include "lexis/arena.hpp"
#include "lexis/lex_attrs.hpp"
#include "lexis/lexeme.hpp"
#include "lexis/vocab.hpp"

#include <random>
#include <sstream>
#include <string>
#include <vector>

namespace {

std::vector<std::string> make_words(size_t count) {
    std::vector<std::string> words;
    words.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        words.push_back("word" + std::to_string(i));
    }
    return words;
}

// Text vectors for @p words, @p dim components each
std::string make_vector_text(const std::vector<std::string>& words, int dim) {
    std::mt19937 rng(42);
    std::uniform_real_distribution<float> dist(-1.0f, 1.0f);
    std::ostringstream out;
    for (const auto& word : words) {
        out << word;
        for (int i = 0; i < dim; ++i) out << ' ' << dist(rng);
        out << '\n';
    }
    return out.str();
}

} // anonymous namespace

// Lookup of words already in the table
static void BM_VocabLookupHit(benchmark::State& state) {
    lexis::Vocab vocab(lexis::lex_attrs::default_getters());
    const auto words = make_words(static_cast<size_t>(state.range(0)));
    for (const auto& w : words) vocab.get(w);

    size_t i = 0;
    for (auto _ : state) {
        benchmark::DoNotOptimize(vocab.get(words[i++ % words.size()]));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_VocabLookupHit)->RangeMultiplier(10)->Range(100, 100000);

// Creation of new lexemes through the default attribute getters
static void BM_VocabInsert(benchmark::State& state) {
    const auto words = make_words(static_cast<size_t>(state.range(0)));
    for (auto _ : state) {
        lexis::Vocab vocab(lexis::lex_attrs::default_getters());
        for (const auto& w : words) benchmark::DoNotOptimize(vocab.get(w));
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_VocabInsert)->RangeMultiplier(10)->Range(100, 10000)->Unit(benchmark::kMicrosecond);

// Out-of-vocabulary lookups against a scratch arena
static void BM_VocabScratchMiss(benchmark::State& state) {
    lexis::Vocab vocab;
    const auto words = make_words(1000);
    for (auto _ : state) {
        lexis::Arena scratch;
        for (const auto& w : words) benchmark::DoNotOptimize(vocab.get(w, scratch));
    }
    state.SetItemsProcessed(state.iterations() * 1000);
}
BENCHMARK(BM_VocabScratchMiss)->Unit(benchmark::kMicrosecond);

static void BM_LoadTextVectors(benchmark::State& state) {
    const auto words = make_words(1000);
    const std::string text = make_vector_text(words, static_cast<int>(state.range(0)));
    for (auto _ : state) {
        lexis::Vocab vocab;
        std::istringstream in(text);
        benchmark::DoNotOptimize(vocab.load_vectors(in));
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(text.size()));
}
BENCHMARK(BM_LoadTextVectors)->Arg(50)->Arg(300)->Unit(benchmark::kMillisecond);

static void BM_Similarity(benchmark::State& state) {
    lexis::Vocab vocab;
    const auto words = make_words(2);
    std::istringstream in(make_vector_text(words, static_cast<int>(state.range(0))));
    vocab.load_vectors(in);

    lexis::Lexeme a = vocab[words[0]];
    lexis::Lexeme b = vocab[words[1]];
    for (auto _ : state) {
        benchmark::DoNotOptimize(a.similarity(b));
    }
}
BENCHMARK(BM_Similarity)->Arg(50)->Arg(300)->Arg(1000);

BENCHMARK_MAIN();
