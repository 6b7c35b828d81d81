#ifndef UTILS_HPP
#define UTILS_HPP

#include <random>

// Gerador global de números aleatórios, declarado aqui e definido em utils.cpp
extern std::mt19937 rng;

// Funções utilitárias inline para números aleatórios
inline int randint(std::mt19937& gen, int a, int b) {
    return std::uniform_int_distribution<int>(a, b)(gen);
}

inline double randreal(std::mt19937& gen) {
    return std::uniform_real_distribution<double>(0.0, 1.0)(gen);
}

// Cria um fluxo independente (uma formiga) a partir do gerador global.
inline std::mt19937 spawn_stream() {
    return std::mt19937(rng());
}

#endif // UTILS_HPP
