#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "internal/nlp/embedder.hpp"

namespace entitystore::search {

// Share of the embedder's token budget one chunk may use.
inline constexpr std::size_t kChunkBudgetDivisor = 5;

/*
  Splits a query into consecutive whitespace-delimited word runs that each fit
  a fifth of the embedder's token budget. Words-per-chunk is derived from the
  query's own tokens-per-word ratio and is at least 1. A chunk the embedder
  would count as zero tokens is returned as "".
*/
std::vector<std::string> QueryChunks(const std::string& query, const nlp::Embedder& embedder);

std::vector<std::string> SplitWords(const std::string& text);

} // namespace entitystore::search
