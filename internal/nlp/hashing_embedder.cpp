#include "internal/nlp/hashing_embedder.hpp"

#include <cctype>
#include <cmath>
#include <cstdint>
#include <stdexcept>

namespace entitystore::nlp {
namespace {

constexpr std::uint64_t kFnvOffset = 1469598103934665603ULL;
constexpr std::uint64_t kFnvPrime  = 1099511628211ULL;

std::uint64_t HashToken(std::string_view token) {
  std::uint64_t hash = kFnvOffset;
  for (const unsigned char ch : token) {
    hash ^= static_cast<std::uint64_t>(ch);
    hash *= kFnvPrime;
  }
  return hash;
}

void NormalizeL2(std::vector<float>& v) {
  double sum_sq = 0.0;
  for (const auto x : v) {
    sum_sq += static_cast<double>(x) * static_cast<double>(x);
  }
  if (sum_sq <= 0.0) {
    return;
  }
  const auto inv_norm = 1.0 / std::sqrt(sum_sq);
  for (auto& x : v) {
    x = static_cast<float>(static_cast<double>(x) * inv_norm);
  }
}

} // namespace

std::vector<std::string> Tokenize(std::string_view text) {
  std::vector<std::string> tokens;
  std::string              current;

  for (const unsigned char ch : text) {
    if (std::isalnum(ch) != 0) {
      current.push_back(static_cast<char>(std::tolower(ch)));
      continue;
    }
    if (!current.empty()) {
      tokens.push_back(current);
      current.clear();
    }
  }
  if (!current.empty()) {
    tokens.push_back(current);
  }
  return tokens;
}

HashingEmbedder::HashingEmbedder(std::size_t dimensions, std::size_t max_tokens)
    : dimensions_(dimensions), max_tokens_(max_tokens) {
  if (dimensions_ == 0) {
    throw std::invalid_argument("embedder dimensions must be positive");
  }
  if (max_tokens_ == 0) {
    throw std::invalid_argument("embedder max_tokens must be positive");
  }
}

std::size_t HashingEmbedder::EstimateTokenCount(const std::string& text) const {
  std::size_t count  = 0;
  bool        in_run = false;

  for (const unsigned char ch : text) {
    if (std::isalnum(ch) != 0) {
      if (!in_run) ++count;
      in_run = true;
      continue;
    }
    in_run = false;
    if (std::isspace(ch) == 0) ++count;
  }
  return count;
}

std::vector<float> HashingEmbedder::Embed(const std::string& text) const {
  std::vector<float> embedding(dimensions_, 0.0F);

  for (const auto& token : Tokenize(text)) {
    const auto  hash  = HashToken(token);
    const auto  index = static_cast<std::size_t>(hash % static_cast<std::uint64_t>(dimensions_));
    const float sign  = ((hash >> 63U) != 0U) ? -1.0F : 1.0F;
    embedding[index] += sign;
  }

  NormalizeL2(embedding);
  return embedding;
}

} // namespace entitystore::nlp
