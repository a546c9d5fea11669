// basic_usage -- demonstrates core punctuation-cpp API
//
// Shows preserve() and restore() around a text engine, removal without
// restoration data, custom mark sets, and what happens to numbers.
//
// Build: cmake --build build
// Run:   ./build/basic_usage

#include <punctuation-cpp/punctuation.hpp>

#include <cstdio>
#include <string>
#include <vector>

namespace pc = punctuation_cpp;

static void print_lines(const char* label, const std::vector<std::string>& lines) {
    std::printf("%s:\n", label);
    for (const auto& line : lines) {
        std::printf("  [%s]\n", line.c_str());
    }
}

int main() {
    auto punctuator = pc::Punctuator{pc::PunctuatorOptions{}};

    const auto lines = std::vector<std::string>{
        "hello, my world!",
        "no marks here",
        "...",
        "\xC2\xBF" "Qu\xC3\xA9 tal?",
        "It costs 1,000.50 dollars.",
    };
    print_lines("Input", lines);

    // -- Preserve: split lines into punctuation-free chunks -------------------
    auto preserved = punctuator.preserve(lines);
    print_lines("Chunks", preserved.chunks);

    std::printf("Marks:\n");
    for (const auto& mark : preserved.marks) {
        const auto position = std::string{pc::to_string_view(mark.position)};
        std::printf("  line %zu %-6s [%s]\n", mark.line_index,
                    position.c_str(), mark.text.c_str());
    }

    // -- Restore: chunks unchanged, so the input comes back -------------------
    auto restored = pc::Punctuator::restore(preserved);
    print_lines("Restored", restored);
    std::printf("Round trip %s\n", restored == lines ? "ok" : "FAILED");

    // -- Remove: strip marks without keeping anything -------------------------
    print_lines("Removed", punctuator.remove(lines));

    // -- Custom mark set ------------------------------------------------------
    auto commas_only = pc::Punctuator{","};
    std::printf("Custom marks [%s]: [%s]\n", commas_only.marks().c_str(),
                commas_only.remove("one, two! three").c_str());

    // -- Invalid configuration is reported as an exception --------------------
    try {
        auto bad = pc::Punctuator{"\xFF"};
        (void)bad;
    } catch (const pc::Exception& e) {
        std::printf("Rejected mark set: %s\n", e.what());
    }

    return 0;
}
