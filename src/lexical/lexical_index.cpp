// File: src/lexical/lexical_index.cpp
#include "lexical/lexical_index.hpp"
#include <algorithm>
#include <cmath>
#include <map>
#include <sstream>
#include <stdexcept>

namespace pitchsim {

LexicalIndex::LexicalIndex()
    : LexicalIndex(Config()) {}

LexicalIndex::LexicalIndex(const Config& config)
    : config_(config) {
    if (config_.max_document_ratio <= 0.0f || config_.max_document_ratio > 1.0f) {
        throw std::invalid_argument("max_document_ratio must be in (0, 1]");
    }
    if (config_.min_similarity < 0.0f || config_.min_similarity > 1.0f) {
        throw std::invalid_argument("min_similarity must be in [0, 1]");
    }
}

// ============================================================================
// Fitting
// ============================================================================

void LexicalIndex::Fit(const std::vector<std::string>& documents) {
    terms_.clear();
    term_ids_.clear();
    idf_.clear();
    documents_.clear();

    std::vector<std::vector<std::string>> tokenized;
    tokenized.reserve(documents.size());

    // Document frequency per term; std::map keeps term ids in lexical order
    std::map<std::string, size_t> document_frequency;
    for (const auto& doc : documents) {
        tokenized.push_back(Tokenize(doc));

        std::vector<std::string> distinct = tokenized.back();
        std::sort(distinct.begin(), distinct.end());
        distinct.erase(std::unique(distinct.begin(), distinct.end()), distinct.end());
        for (const auto& term : distinct) {
            document_frequency[term]++;
        }
    }

    const float n = static_cast<float>(documents.size());
    const float max_count = config_.max_document_ratio * n;

    for (const auto& [term, df] : document_frequency) {
        if (df < config_.min_document_count || static_cast<float>(df) > max_count) {
            continue;
        }
        uint32_t id = static_cast<uint32_t>(terms_.size());
        terms_.push_back(term);
        term_ids_.emplace(term, id);
        idf_.push_back(std::log((1.0f + n) / (1.0f + static_cast<float>(df))) + 1.0f);
    }

    documents_.reserve(tokenized.size());
    for (const auto& tokens : tokenized) {
        SparseVector vector = CountTerms(tokens);
        Weight(vector);
        documents_.push_back(std::move(vector));
    }
}

// ============================================================================
// Querying
// ============================================================================

SparseVector LexicalIndex::Transform(const std::string& text) const {
    SparseVector vector = CountTerms(Tokenize(text));
    Weight(vector);
    return vector;
}

std::vector<LexicalMatch> LexicalIndex::Search(const std::string& query,
                                               size_t top_n,
                                               const DocumentFilter& filter) const {
    std::vector<LexicalMatch> matches;
    if (top_n == 0) {
        return matches;
    }

    SparseVector query_vector = Transform(query);
    if (query_vector.empty()) {
        return matches;
    }

    for (size_t doc = 0; doc < documents_.size(); ++doc) {
        if (filter && !filter(doc)) {
            continue;
        }
        float similarity = CosineSimilarity(query_vector, documents_[doc]);
        if (similarity < config_.min_similarity) {
            continue;
        }
        matches.emplace_back(doc, similarity);
    }

    std::sort(matches.begin(), matches.end(),
              [](const LexicalMatch& a, const LexicalMatch& b) {
                  if (a.similarity != b.similarity) {
                      return a.similarity > b.similarity;
                  }
                  return a.document < b.document;
              });

    if (matches.size() > top_n) {
        matches.erase(matches.begin() + top_n, matches.end());
    }
    return matches;
}

float LexicalIndex::CosineSimilarity(const SparseVector& a, const SparseVector& b) {
    // Both sides are sorted by term id and already unit length
    float dot = 0.0f;
    size_t i = 0;
    size_t j = 0;
    while (i < a.size() && j < b.size()) {
        if (a[i].first == b[j].first) {
            dot += a[i].second * b[j].second;
            ++i;
            ++j;
        } else if (a[i].first < b[j].first) {
            ++i;
        } else {
            ++j;
        }
    }
    return std::clamp(dot, 0.0f, 1.0f);
}

std::vector<std::string> LexicalIndex::Tokenize(const std::string& text) {
    std::vector<std::string> tokens;
    std::istringstream stream(text);
    std::string token;
    while (stream >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

std::optional<uint32_t> LexicalIndex::TermId(const std::string& term) const {
    auto it = term_ids_.find(term);
    if (it == term_ids_.end()) {
        return std::nullopt;
    }
    return it->second;
}

// ============================================================================
// Helpers
// ============================================================================

SparseVector LexicalIndex::CountTerms(const std::vector<std::string>& tokens) const {
    std::map<uint32_t, float> counts;
    for (const auto& token : tokens) {
        auto it = term_ids_.find(token);
        if (it != term_ids_.end()) {
            counts[it->second] += 1.0f;
        }
    }
    return SparseVector(counts.begin(), counts.end());
}

void LexicalIndex::Weight(SparseVector& vector) const {
    float norm_sq = 0.0f;
    for (auto& [term, weight] : vector) {
        weight *= idf_[term];
        norm_sq += weight * weight;
    }
    if (norm_sq <= 0.0f) {
        vector.clear();
        return;
    }
    float norm = std::sqrt(norm_sq);
    for (auto& entry : vector) {
        entry.second /= norm;
    }
}

} // namespace pitchsim
