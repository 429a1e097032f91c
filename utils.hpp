#ifndef UTILS_HPP
#define UTILS_HPP

#include <random>
#include <vector>

// Gerador global de números aleatórios, definido em utils.cpp.
// Toda a aleatoriedade do solver passa por ele: semear uma vez reproduz a execução.
extern std::mt19937 rng;

// Inteiro uniforme em [a, b]
inline int randint(int a, int b) {
    return std::uniform_int_distribution<int>(a, b)(rng);
}

inline double randreal() {
    return std::uniform_real_distribution<double>(0.0, 1.0)(rng);
}

/**
 * @brief Sorteia k índices distintos de [0, n) (Fisher-Yates parcial).
 * Se k > n, devolve os n índices embaralhados.
 */
std::vector<int> sample_distinct(int n, int k);

#endif // UTILS_HPP
