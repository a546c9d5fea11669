// json_interop_demo -- punctuation-cpp + nlohmann/json interoperability
//
// Demonstrates:
//   - Serializing a PreservedText so the chunks and marks can be stored
//     or shipped to another process
//   - Restoring from marks read back from JSON
//   - Inspecting detected mark units as JSON
//   - Decoding errors on malformed records
//
// Build: cmake --build build -DPUNCTUATION_CPP_BUILD_EXAMPLES=ON
// Run:   ./build/json_interop_demo

#include <punctuation-cpp/json.hpp>
#include <punctuation-cpp/punctuation.hpp>
#include <nlohmann/json.hpp>

#include <cctype>
#include <cstdio>
#include <string>
#include <vector>

namespace pc = punctuation_cpp;
using json = nlohmann::json;

int main() {
    auto punctuator = pc::Punctuator{pc::PunctuatorOptions{}};

    // -- Export ---------------------------------------------------------------
    auto preserved = punctuator.preserve(std::vector<std::string>{
        "Hello, world!",
        "\xC2\xA1" "Hola!",
        "...",
    });

    const auto exported = json(preserved).dump(2);
    std::printf("PreservedText as JSON:\n%s\n\n", exported.c_str());

    // -- Import and restore ---------------------------------------------------
    auto imported = json::parse(exported).get<pc::PreservedText>();
    for (auto& chunk : imported.chunks) {
        for (auto& c : chunk) {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
    }

    std::printf("Restored from JSON (lower-cased chunks):\n");
    for (const auto& line : pc::Punctuator::restore(imported)) {
        std::printf("  %s\n", line.c_str());
    }

    // -- Mark units -----------------------------------------------------------
    auto units = json(punctuator.matcher().detect("wait... what?!"));
    std::printf("\nDetected units: %s\n", units.dump().c_str());

    // -- Malformed input ------------------------------------------------------
    try {
        auto record = json::parse(R"({"line": 0, "text": "!", "position": "top"})")
                          .get<pc::MarkRecord>();
        (void)record;
    } catch (const pc::Exception& e) {
        std::printf("Rejected record (%s): %s\n",
                    std::string{pc::to_string_view(e.kind())}.c_str(), e.what());
    }

    return 0;
}
