#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "internal/nlp/embedder.hpp"

namespace entitystore::nlp {

/*
  Deterministic feature-hashing embedder.

  Lower-cased alphanumeric tokens are FNV-1a hashed into a fixed number of
  buckets with a sign bit, then L2-normalized. Texts that share words land
  close together; no model files are needed.
*/
class HashingEmbedder final : public Embedder {
 public:
  static constexpr std::size_t kDefaultDimensions = 384;
  static constexpr std::size_t kDefaultMaxTokens  = 8192;

  explicit HashingEmbedder(std::size_t dimensions = kDefaultDimensions, std::size_t max_tokens = kDefaultMaxTokens);

  std::string Name() const override {
    return "hashing";
  }

  std::size_t Dimensions() const override {
    return dimensions_;
  }

  std::size_t MaxTokens() const override {
    return max_tokens_;
  }

  // One token per alphanumeric run plus one per punctuation character.
  std::size_t EstimateTokenCount(const std::string& text) const override;

  std::vector<float> Embed(const std::string& text) const override;

 private:
  std::size_t dimensions_;
  std::size_t max_tokens_;
};

std::vector<std::string> Tokenize(std::string_view text);

} // namespace entitystore::nlp
