#pragma once

#include "core/shared/retrieval_result.h"

#include <vector>

namespace cr {

constexpr int kDefaultRrfK = 60;

struct LexicalVectorFusionConfig {
    double lexicalWeight = 0.5;
    double vectorWeight = 0.5;
    int rrfK = kDefaultRrfK;
    int maxResults = 10;
};

// Reciprocal Rank Fusion over ranked result lists.
//
// Results are keyed by RetrievalResult::stableKey(); records without a key are
// skipped. Output is sorted by fused score, ties kept in first-seen order, so
// identical inputs always produce identical output.
class RankFusion {
public:
    // 1 / (k + rank), rank is 1-indexed.
    static double rrfScore(int rank, int k = kDefaultRrfK);

    // Merges result lists from query variants. A single list is returned in
    // its native order with its own scores carried into finalScore.
    // A finalScore the input already carries is kept as is, so re-merging an
    // already merged list changes nothing; for such records finalScore may
    // differ from originalScore.
    static ResultList mergeResultsRrf(const std::vector<ResultList>& resultLists,
                                      int topK = 10,
                                      int k = kDefaultRrfK);

    // Weighted fusion of a lexical and a vector result list. Each rank
    // contribution is scaled by its list weight before summing.
    static ResultList mergeLexicalVectorRrf(const ResultList& lexical,
                                            const ResultList& vector,
                                            LexicalVectorFusionConfig config = {});
};

} // namespace cr
