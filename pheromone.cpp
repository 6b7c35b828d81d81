#include "pheromone.hpp"
#include <stdexcept>

PheromoneTrail::PheromoneTrail(int n, double initial) : n(n), tau(n > 0 ? static_cast<size_t>(n) * n : 0, initial) {
    if (n < 0) throw std::invalid_argument("PheromoneTrail: tamanho negativo");
    if (initial < 0.0) throw std::invalid_argument("PheromoneTrail: valor inicial negativo");
}

void PheromoneTrail::evaporate(double rate) {
    if (readers > 0) throw std::logic_error("evaporate durante a fase de construção");
    if (!(rate >= 0.0 && rate < 1.0)) throw std::invalid_argument("taxa de evaporação fora de [0, 1)");
    for (double& v : tau) v *= rate;
}

void PheromoneTrail::deposit(int i, int j, double amount) {
    if (readers > 0) throw std::logic_error("deposit durante a fase de construção");
    if (!(amount >= 0.0)) throw std::invalid_argument("depósito de feromônio negativo");
    tau[i * n + j] += amount;
}
