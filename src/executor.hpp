#pragma once

// Global work-stealing executor via Taskflow.
//
// Provides a process-global tf::Executor singleton sized to
// std::thread::hardware_concurrency(). Batch preservation submits its
// line batches through this executor.
//
// Internal header, not installed.

#include <taskflow/taskflow.hpp>

namespace punctuation_cpp::detail {

// Process-global executor. Created on first use, destroyed at exit.
inline auto global_executor() -> tf::Executor& {
    static auto executor = tf::Executor{};
    return executor;
}

}  // namespace punctuation_cpp::detail
