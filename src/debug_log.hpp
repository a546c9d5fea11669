#pragma once

// Opt-in diagnostics on stderr.
//
// Enabled by setting PUNCTUATION_CPP_DEBUG in the environment. The
// variable is read once, on first use.
// Internal header, not installed.

#include <cstdlib>
#include <iostream>
#include <mutex>
#include <sstream>
#include <utility>

namespace punctuation_cpp::detail {

inline auto debug_enabled() -> bool {
    static const bool enabled = std::getenv("PUNCTUATION_CPP_DEBUG") != nullptr;
    return enabled;
}

// Shared by every debug_log() instantiation.
inline auto debug_mutex() -> std::mutex& {
    static auto mutex = std::mutex{};
    return mutex;
}

// Write one "[DEBUG] ..." line. Arguments are streamed in order.
// Lines from concurrent batches are serialized so they do not interleave.
template <typename... Args>
void debug_log(Args&&... args) {
    if (!debug_enabled()) return;

    auto line = std::ostringstream{};
    line << "[DEBUG] punctuation-cpp: ";
    (line << ... << std::forward<Args>(args));
    line << '\n';

    auto lock = std::scoped_lock{debug_mutex()};
    std::cerr << line.str();
}

}  // namespace punctuation_cpp::detail
