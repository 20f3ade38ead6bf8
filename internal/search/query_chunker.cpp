#include "internal/search/query_chunker.hpp"

#include <algorithm>
#include <sstream>

namespace entitystore::search {

std::vector<std::string> SplitWords(const std::string& text) {
  std::vector<std::string> words;
  std::istringstream       in(text);
  std::string              word;
  while (in >> word) words.push_back(word);
  return words;
}

std::vector<std::string> QueryChunks(const std::string& query, const nlp::Embedder& embedder) {
  const auto words = SplitWords(query);
  if (words.empty()) {
    return {query};
  }

  const double budget          = static_cast<double>(embedder.MaxTokens() / kChunkBudgetDivisor);
  const double total_tokens    = static_cast<double>(embedder.EstimateTokenCount(query));
  const double tokens_per_word = total_tokens / static_cast<double>(words.size());

  std::size_t words_per_chunk = words.size();
  if (tokens_per_word > 0.0) {
    words_per_chunk = std::max<std::size_t>(static_cast<std::size_t>(budget / tokens_per_word), 1);
  }

  std::vector<std::string> chunks;
  for (std::size_t begin = 0; begin < words.size(); begin += words_per_chunk) {
    const std::size_t end = std::min(words.size(), begin + words_per_chunk);

    std::string chunk;
    for (std::size_t i = begin; i < end; ++i) {
      if (i != begin) chunk += ' ';
      chunk += words[i];
    }

    chunks.push_back(embedder.EstimateTokenCount(chunk) > 0 ? chunk : std::string());
  }
  return chunks;
}

} // namespace entitystore::search
