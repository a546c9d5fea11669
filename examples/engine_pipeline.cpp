// engine_pipeline -- punctuation-cpp around a downstream text engine
//
// Demonstrates:
//   - A fake engine that would choke on punctuation (it upper-cases words
//     and rejects sentence punctuation)
//   - preserve_parallel() on a larger corpus, batched on the executor
//   - Restoring the engine's output and checking the line count survives
//
// Set PUNCTUATION_CPP_DEBUG=1 to see batch dispatch on stderr.
//
// Build: cmake --build build
// Run:   ./build/engine_pipeline

#include <punctuation-cpp/punctuation.hpp>

#include <cctype>
#include <chrono>
#include <cstddef>
#include <cstdio>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace pc = punctuation_cpp;

// =============================================================================
// The engine
// =============================================================================

// Upper-cases one chunk. Throws on sentence punctuation; separators inside
// numbers are left for the engine to read.
static auto engine_process(const std::string& chunk) -> std::string {
    auto out = std::string{};
    out.reserve(chunk.size());
    for (unsigned char c : chunk) {
        if (c == '!' || c == '?' || c == ';' || c == ':') {
            throw std::runtime_error{"engine received punctuation: " + chunk};
        }
        out.push_back(static_cast<char>(std::toupper(c)));
    }
    return out;
}

static auto engine_process(const std::vector<std::string>& chunks)
    -> std::vector<std::string> {
    auto out = std::vector<std::string>{};
    out.reserve(chunks.size());
    for (const auto& chunk : chunks) {
        out.push_back(engine_process(chunk));
    }
    return out;
}

// =============================================================================
// Corpus
// =============================================================================

static auto make_corpus(std::size_t count) -> std::vector<std::string> {
    const auto sentences = std::vector<std::string>{
        "the quick brown fox, jumps over the lazy dog.",
        "is it raining? yes; bring an umbrella!",
        "pi is roughly 3.14159, or 22/7.",
        "wait...",
        "she said: \xE2\x80\x9Cnever again\xE2\x80\x9D.",
        "",
    };
    auto corpus = std::vector<std::string>{};
    corpus.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        corpus.push_back(sentences[i % sentences.size()]);
    }
    return corpus;
}

int main() {
    auto options = pc::PunctuatorOptions{};
    options.batch_size = 2048;
    auto punctuator = pc::Punctuator{options};

    const auto corpus = make_corpus(100000);

    // -- Preserve -------------------------------------------------------------
    auto start = std::chrono::steady_clock::now();
    auto preserved = punctuator.preserve_parallel(corpus);
    auto preserve_ms = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - start).count();

    std::printf("Preserved %zu lines into %zu chunks and %zu marks (%.1f ms)\n",
                corpus.size(), preserved.chunks.size(), preserved.marks.size(),
                preserve_ms);

    // -- Engine ---------------------------------------------------------------
    auto processed = std::vector<std::string>{};
    try {
        processed = engine_process(preserved.chunks);
    } catch (const std::runtime_error& e) {
        std::printf("Engine failed: %s\n", e.what());
        return 1;
    }

    // -- Restore --------------------------------------------------------------
    start = std::chrono::steady_clock::now();
    auto restored = pc::Punctuator::restore(std::move(processed), preserved.marks);
    auto restore_ms = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - start).count();

    // Empty input lines leave no trace, so the restored text is shorter.
    std::printf("Restored %zu lines (%.1f ms)\n", restored.size(), restore_ms);
    for (std::size_t i = 0; i < 5 && i < restored.size(); ++i) {
        std::printf("  %s\n", restored[i].c_str());
    }

    return 0;
}
