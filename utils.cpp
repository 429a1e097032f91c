#include "utils.hpp"
#include <numeric>
#include <algorithm>

std::mt19937 rng(1);

std::vector<int> sample_distinct(int n, int k) {
    std::vector<int> idx(n > 0 ? n : 0);
    std::iota(idx.begin(), idx.end(), 0);
    if (k > n) k = n;
    for (int i = 0; i < k; ++i) {
        int r = randint(i, n - 1);
        std::swap(idx[i], idx[r]);
    }
    idx.resize(k < 0 ? 0 : k);
    return idx;
}
