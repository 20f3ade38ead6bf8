#include "internal/nlp/embedder.hpp"

#include <cmath>

namespace entitystore::nlp {

double CosineDistance(const std::vector<float>& a, const std::vector<float>& b) {
  if (a.empty() || a.size() != b.size()) return 1.0;

  double dot = 0.0, na = 0.0, nb = 0.0;
  for (std::size_t i = 0; i < a.size(); ++i) {
    dot += static_cast<double>(a[i]) * b[i];
    na += static_cast<double>(a[i]) * a[i];
    nb += static_cast<double>(b[i]) * b[i];
  }
  if (na == 0.0 || nb == 0.0) return 1.0;

  return 1.0 - dot / (std::sqrt(na) * std::sqrt(nb));
}

} // namespace entitystore::nlp
