#pragma once

/// @file src/core/parallel.hpp
/// @brief Chunked data-parallel loop over an index range (internal).

#include <algorithm>
#include <cstddef>
#include <future>
#include <thread>
#include <vector>

namespace strp::detail {

/// 0 means "one per hardware thread"; never returns 0.
[[nodiscard]] inline std::size_t resolve_workers(std::size_t requested) noexcept {
    if (requested > 0) return requested;
    const unsigned hw = std::thread::hardware_concurrency();
    return hw == 0 ? 1 : static_cast<std::size_t>(hw);
}

/// Call `fn(begin, end)` over disjoint contiguous chunks of `[0, n)`.
///
/// Chunks run on up to `workers` threads. The first exception thrown by a
/// chunk is rethrown after every chunk has finished.
template <class Fn>
void parallel_chunks(std::size_t n, std::size_t workers, Fn&& fn) {
    if (n == 0) return;
    workers = std::clamp<std::size_t>(workers, 1, n);
    if (workers == 1) {
        fn(std::size_t{0}, n);
        return;
    }

    const std::size_t chunk = (n + workers - 1) / workers;
    std::vector<std::future<void>> tasks;
    tasks.reserve(workers);
    for (std::size_t begin = 0; begin < n; begin += chunk) {
        const std::size_t end = std::min(n, begin + chunk);
        tasks.push_back(std::async(std::launch::async, [&fn, begin, end] { fn(begin, end); }));
    }
    for (auto& t : tasks) t.wait();
    for (auto& t : tasks) t.get();
}

}  // namespace strp::detail
