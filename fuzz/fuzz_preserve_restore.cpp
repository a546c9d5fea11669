// Fuzz target for preserve/restore -- arbitrary bytes split into lines,
// preserved with the default marks, then restored without processing.

#include <punctuation-cpp/punctuation.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <string_view>
#include <vector>

namespace pc = punctuation_cpp;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    static const auto punctuator = pc::Punctuator{pc::PunctuatorOptions{}};

    const auto input = std::string_view{reinterpret_cast<const char*>(data), size};
    auto lines = std::vector<std::string>{};
    std::size_t start = 0;
    while (start <= input.size()) {
        auto end = input.find('\n', start);
        if (end == std::string_view::npos) end = input.size();
        lines.emplace_back(input.substr(start, end - start));
        start = end + 1;
    }

    auto preserved = punctuator.preserve(lines);
    for (const auto& record : preserved.marks) {
        if (record.line_index >= lines.size()) std::abort();
    }

    // Every restored line but a trailing run of leftover marks belongs to
    // one input line.
    auto restored = pc::Punctuator::restore(preserved);
    if (restored.size() > lines.size() + 1) std::abort();

    // Chunks are pieces of the input, with any digit guard placeholder undone.
    for (const auto& chunk : preserved.chunks) {
        if (input.find(chunk) == std::string_view::npos) std::abort();
    }

    // Removal must be idempotent on every line.
    for (const auto& line : lines) {
        const auto once = punctuator.remove(line);
        if (punctuator.remove(once) != once) std::abort();
    }

    return 0;
}
