// File: src/lexical/lexical_index.hpp
#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace pitchsim {

/// Sparse TF-IDF vector: (term id, weight) pairs sorted by term id
using SparseVector = std::vector<std::pair<uint32_t, float>>;

/// Ranked document returned by LexicalIndex::Search
struct LexicalMatch {
    size_t document;      ///< Position of the document passed to Fit()
    float similarity;     ///< Cosine similarity in [0, 1]

    LexicalMatch(size_t doc, float sim) : document(doc), similarity(sim) {}
};

/// TF-IDF vocabulary and document vectors over whitespace-separated tokens.
///
/// Weighting:
/// - term frequency is the raw count of the token in the document
/// - idf(t) = ln((1 + n) / (1 + df(t))) + 1 (smoothed)
/// - every vector is L2-normalized, so cosine similarity is a dot product
///
/// A term is kept when it occurs in at least `min_document_count` documents
/// and in at most `max_document_ratio * n` of them. A corpus too small to
/// satisfy both bounds produces an empty vocabulary; every query then scores
/// 0 and Search() returns nothing.
///
/// The vocabulary is fixed by Fit(). Transform() and Search() ignore unseen
/// tokens and never modify the index, so they are safe to call concurrently.
class LexicalIndex {
public:
    struct Config {
        /// Minimum number of documents a term must appear in
        size_t min_document_count{2};

        /// Maximum fraction of documents a term may appear in (0, 1]
        float max_document_ratio{0.95f};

        /// Results scoring below this are dropped
        float min_similarity{0.01f};
    };

    /// Document filter for Search(); return false to skip the document
    using DocumentFilter = std::function<bool(size_t)>;

    LexicalIndex();

    /// @throws std::invalid_argument if max_document_ratio is outside (0, 1]
    ///         or min_similarity is outside [0, 1]
    explicit LexicalIndex(const Config& config);

    /// Build the vocabulary and document vectors, replacing any previous fit
    void Fit(const std::vector<std::string>& documents);

    /// Vectorize text with the fitted vocabulary
    SparseVector Transform(const std::string& text) const;

    /// Rank fitted documents by cosine similarity to `query`
    /// @param query Whitespace-separated tokens
    /// @param top_n Maximum results
    /// @param filter Optional document filter
    /// @return Matches sorted by similarity (descending), ties by document
    std::vector<LexicalMatch> Search(const std::string& query,
                                     size_t top_n,
                                     const DocumentFilter& filter = nullptr) const;

    /// Cosine similarity of two normalized vectors
    static float CosineSimilarity(const SparseVector& a, const SparseVector& b);

    /// Split on whitespace
    static std::vector<std::string> Tokenize(const std::string& text);

    size_t VocabularySize() const { return terms_.size(); }
    size_t DocumentCount() const { return documents_.size(); }

    /// Id of a vocabulary term, if kept
    std::optional<uint32_t> TermId(const std::string& term) const;

    /// Inverse document frequency of a vocabulary term
    float Idf(uint32_t term_id) const { return idf_.at(term_id); }

    /// Fitted vector of document `index`
    const SparseVector& DocumentVector(size_t index) const { return documents_.at(index); }

    const Config& GetConfig() const { return config_; }

private:
    Config config_;

    std::vector<std::string> terms_;                      // term id -> term
    std::unordered_map<std::string, uint32_t> term_ids_;  // term -> term id
    std::vector<float> idf_;                              // term id -> idf
    std::vector<SparseVector> documents_;

    /// Raw-count vector of a token list, restricted to the vocabulary
    SparseVector CountTerms(const std::vector<std::string>& tokens) const;

    /// Apply idf and L2-normalize in place
    void Weight(SparseVector& vector) const;
};

} // namespace pitchsim
