#pragma once

#if defined(_OPENMP)
#include <omp.h>
#endif

namespace geospread {

inline int omp_max_threads() {
#if defined(_OPENMP)
    return omp_get_max_threads();
#else
    return 1;
#endif
}

// Merge rule for parallel argmax reductions: larger score wins, and on equal
// scores the earlier scan position wins, whatever thread found it.
inline bool better_pick(double score, int idx, double best_score, int best_idx) {
    if (score != best_score) {
        return score > best_score;
    }
    return best_idx < 0 || idx < best_idx;
}

// threads <= 0 keeps the OpenMP runtime default.
inline void omp_set_threads(int threads) {
#if defined(_OPENMP)
    if (threads > 0) {
        omp_set_num_threads(threads);
    }
#else
    (void)threads;
#endif
}

}  // namespace geospread
