#pragma once

#include <simlens/normalize.hpp>

#include <cstdint>
#include <string_view>

namespace simlens {

/**
 * Lexical similarity scores for one text pair.
 *
 * All fields are symmetric in the two texts. Ratios are in [0, 1],
 * word_overlap is a percentage in [0, 100].
 */
struct SimilarityScores {
  double cosine_similarity = 0.0;
  double jaccard_index = 0.0;
  double word_overlap = 0.0;
  double character_similarity = 0.0;
  // Absolute difference of the code-point lengths. Not an edit distance;
  // the name is kept for wire compatibility.
  uint64_t edit_distance = 0;
};

/**
 * Intersection over union of the two letter sets.
 * Returns 0.0 when either text has no letters.
 */
double CharacterSimilarity(const NormalizedText& a, const NormalizedText& b);

/**
 * Cosine similarity in a character 1..3-gram TF-IDF space fitted on
 * both texts. Returns 0.0 when the space cannot be built.
 */
double CosineSimilarity(std::string_view text1, std::string_view text2);

/**
 * Intersection over union of the word sets; 1.0 when both are empty.
 */
double JaccardIndex(const NormalizedText& a, const NormalizedText& b);

/**
 * 2 * |shared| / (|W1| + |W2|) * 100 over the word sets; 100.0 when both
 * are empty.
 */
double WordOverlap(const NormalizedText& a, const NormalizedText& b);

// |len(text1) - len(text2)| in code points.
uint64_t SizeDifference(std::string_view text1, std::string_view text2);

/**
 * Compute every score for a pair.
 *
 * @param text1, text2 The texts the scores describe (already trimmed)
 * @param norm1, norm2 Their normalized views
 */
SimilarityScores ComputeScores(std::string_view text1,
                               std::string_view text2,
                               const NormalizedText& norm1,
                               const NormalizedText& norm2);

}  // namespace simlens
