#pragma once

#include <algorithm>
#include <cstddef>
#include <stdexcept>
#include <vector>

namespace PrintRelay {

/**
 * @brief Split records into consecutive chunks of at most `size` elements.
 * Order is preserved; only the last chunk may be shorter.
 * @throws std::invalid_argument if size is 0
 */
template <typename T>
std::vector<std::vector<T>> chunk(const std::vector<T>& records, size_t size) {
    if (size == 0) {
        throw std::invalid_argument("batch size must be greater than zero");
    }

    std::vector<std::vector<T>> batches;
    batches.reserve((records.size() + size - 1) / size);
    for (size_t start = 0; start < records.size(); start += size) {
        size_t end = std::min(start + size, records.size());
        batches.emplace_back(records.begin() + start, records.begin() + end);
    }
    return batches;
}

} // namespace PrintRelay
