// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * sampling.hpp
 *
 * Seeded uniform sampling without replacement.
 */

#ifndef CLOUDREPORT_ANALYSIS_SAMPLING_HPP
#define CLOUDREPORT_ANALYSIS_SAMPLING_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace cloudreport {

/// Seed from the process entropy source.
uint64_t randomSeed();

/// The given seed, or a fresh one from randomSeed().
uint64_t resolveSeed(const std::optional<uint64_t>& seed);

/**
 * @brief Draw k distinct indices from [0, n), uniformly, in ascending order.
 *
 * Floyd's algorithm: O(k) draws and memory regardless of n. Returns all of
 * [0, n) when k >= n. Identical (n, k, seed) always yields identical output.
 */
std::vector<size_t> sampleIndices(size_t n, size_t k, uint64_t seed);

}  // namespace cloudreport

#endif  // CLOUDREPORT_ANALYSIS_SAMPLING_HPP
