#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace entitystore::nlp {

/*
  Text embedding model.

  Embed() must be deterministic for a given model and safe to call from
  concurrent readers.
*/
class Embedder {
 public:
  virtual ~Embedder() = default;

  virtual std::string Name() const       = 0;
  virtual std::size_t Dimensions() const = 0;

  // Context budget of the model, in tokens.
  virtual std::size_t MaxTokens() const = 0;

  virtual std::size_t EstimateTokenCount(const std::string& text) const = 0;

  virtual std::vector<float> Embed(const std::string& text) const = 0;
};

// 1 - cosine similarity. Empty or zero vectors are at distance 1.
double CosineDistance(const std::vector<float>& a, const std::vector<float>& b);

} // namespace entitystore::nlp
