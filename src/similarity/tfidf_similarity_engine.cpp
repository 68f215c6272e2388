#include "catmatch/similarity/tfidf_similarity_engine.h"

#include "catmatch/core/normalization.h"
#include "catmatch/similarity/stop_words.h"

#include <algorithm>
#include <cmath>
#include <set>

namespace catmatch::similarity {

namespace {

// Dot product of two sparse vectors sorted by term_id.
double dot_sparse(const SparseVector& a, const SparseVector& b) {
  std::size_t i = 0;
  std::size_t j = 0;
  double sum = 0.0;
  while (i < a.size() && j < b.size()) {
    if (a[i].first == b[j].first) {
      sum += a[i].second * b[j].second;
      ++i;
      ++j;
    } else if (a[i].first < b[j].first) {
      ++i;
    } else {
      ++j;
    }
  }
  return sum;
}

}  // namespace

std::vector<std::string> analyze_document(const std::string& document,
                                          const TfidfOptions& options) {
  auto tokens = core::tokenize_ascii(document, options.min_token_length);

  if (options.filter_stop_words) {
    const auto& stop_words = english_stop_words();
    tokens.erase(std::remove_if(tokens.begin(), tokens.end(),
                                [&stop_words](const std::string& token) {
                                  return stop_words.find(token) != stop_words.end();
                                }),
                 tokens.end());
  }

  return tokens;
}

TfidfModel::TfidfModel(TfidfOptions options, std::map<std::string, std::uint32_t> term_to_id,
                       std::vector<std::string> terms, std::vector<double> idf)
    : options_(options),
      term_to_id_(std::move(term_to_id)),
      terms_(std::move(terms)),
      idf_(std::move(idf)) {}

TfidfModel TfidfModel::fit(const std::vector<std::string>& corpus, const TfidfOptions& options) {
  // Pass 1: document frequency per term (std::map keeps term ids sorted and stable)
  std::map<std::string, std::uint32_t> df_map;
  for (const auto& document : corpus) {
    const auto tokens = analyze_document(document, options);
    const std::set<std::string> unique_terms(tokens.begin(), tokens.end());
    for (const auto& term : unique_terms) {
      df_map[term] += 1;
    }
  }

  if (!corpus.empty() && df_map.empty()) {
    throw VectorizationError(
        "empty vocabulary: catalog descriptions contain only stop words or no words");
  }

  // Freeze vocabulary and compute smoothed IDF: ln((1 + N) / (1 + df)) + 1
  const auto n_docs = static_cast<double>(corpus.size());
  std::map<std::string, std::uint32_t> term_to_id;
  std::vector<std::string> terms;
  std::vector<double> idf;
  terms.reserve(df_map.size());
  idf.reserve(df_map.size());

  for (const auto& [term, df] : df_map) {
    term_to_id.emplace(term, static_cast<std::uint32_t>(terms.size()));
    terms.push_back(term);
    idf.push_back(std::log((1.0 + n_docs) / (1.0 + static_cast<double>(df))) + 1.0);
  }

  return TfidfModel(options, std::move(term_to_id), std::move(terms), std::move(idf));
}

SparseVector TfidfModel::transform(const std::string& document) const {
  std::map<std::uint32_t, std::uint32_t> tf;
  for (const auto& token : analyze_document(document, options_)) {
    const auto it = term_to_id_.find(token);
    if (it == term_to_id_.end()) {
      continue;  // Unknown terms are outside the catalog vocabulary
    }
    tf[it->second] += 1;
  }

  SparseVector weights;
  weights.reserve(tf.size());
  double norm2 = 0.0;
  for (const auto& [term_id, count] : tf) {
    const double w = static_cast<double>(count) * idf_[term_id];
    weights.emplace_back(term_id, w);
    norm2 += w * w;
  }

  if (norm2 == 0.0) {
    return {};
  }

  const double norm = std::sqrt(norm2);
  for (auto& entry : weights) {
    entry.second /= norm;
  }
  return weights;
}

double TfidfModel::idf(const std::string& term) const {
  const auto it = term_to_id_.find(term);
  if (it == term_to_id_.end()) {
    return 0.0;
  }
  return idf_[it->second];
}

double cosine_similarity(const SparseVector& a, const SparseVector& b) {
  if (a.empty() || b.empty()) {
    return 0.0;
  }
  // Both vectors are unit length, so the dot product is the cosine
  return std::clamp(dot_sparse(a, b), 0.0, 1.0);
}

TfidfSimilarityEngine::TfidfSimilarityEngine(TfidfOptions options) : options_(options) {}

SimilarityMatrix TfidfSimilarityEngine::compute(
    const std::vector<std::string>& catalog_docs,
    const std::vector<std::string>& unstructured_docs) const {
  SimilarityMatrix matrix(unstructured_docs.size(), catalog_docs.size());
  if (catalog_docs.empty()) {
    return matrix;
  }

  const auto model = TfidfModel::fit(catalog_docs, options_);

  std::vector<SparseVector> catalog_vectors;
  catalog_vectors.reserve(catalog_docs.size());
  for (const auto& doc : catalog_docs) {
    catalog_vectors.push_back(model.transform(doc));
  }

  for (std::size_t u = 0; u < unstructured_docs.size(); ++u) {
    const auto query = model.transform(unstructured_docs[u]);
    for (std::size_t c = 0; c < catalog_vectors.size(); ++c) {
      matrix.set(u, c, cosine_similarity(query, catalog_vectors[c]));
    }
  }

  return matrix;
}

}  // namespace catmatch::similarity
