// Fuzz target for the UTF-8 decoder and digit guard -- exercises ill-formed
// sequences, truncation, and separator placeholders.

#include "src/digit_guard.hpp"
#include "src/unicode/utf8.hpp"

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <string_view>

namespace unicode = punctuation_cpp::unicode;
namespace detail = punctuation_cpp::detail;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto text = std::string_view{reinterpret_cast<const char*>(data), size};

    // Decode every code point; well-formed ones must re-encode to the same bytes.
    std::size_t offset = 0;
    while (offset < text.size()) {
        auto r = unicode::decode(text, offset);
        if (r.bytes_read == 0 || offset + r.bytes_read > text.size()) std::abort();
        if (r.valid && unicode::encode(r.value) != text.substr(offset, r.bytes_read)) {
            std::abort();
        }
        offset += r.bytes_read;
    }

    auto trimmed = unicode::trim(text);
    if (trimmed.size() > text.size()) std::abort();

    // Placeholder code points already in the input must come back too.
    if (detail::restore_digits(detail::protect_digits(text)) != text) std::abort();

    return 0;
}
