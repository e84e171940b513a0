// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "cloudreport/analysis/sampling.hpp"

#include <algorithm>
#include <numeric>
#include <random>
#include <unordered_set>

namespace cloudreport {

uint64_t randomSeed() {
  std::random_device rd;
  return (static_cast<uint64_t>(rd()) << 32) ^ static_cast<uint64_t>(rd());
}

uint64_t resolveSeed(const std::optional<uint64_t>& seed) {
  return seed ? *seed : randomSeed();
}

std::vector<size_t> sampleIndices(size_t n, size_t k, uint64_t seed) {
  std::vector<size_t> indices;
  if (k >= n) {
    indices.resize(n);
    std::iota(indices.begin(), indices.end(), size_t{0});
    return indices;
  }

  std::mt19937_64 gen(seed);
  std::unordered_set<size_t> chosen;
  chosen.reserve(k * 2);
  indices.reserve(k);

  for (size_t j = n - k; j < n; ++j) {
    std::uniform_int_distribution<size_t> dist(0, j);
    const size_t t = dist(gen);
    const size_t pick = chosen.insert(t).second ? t : j;
    if (pick == j) chosen.insert(j);
    indices.push_back(pick);
  }

  std::sort(indices.begin(), indices.end());
  return indices;
}

}  // namespace cloudreport
