/*
 * pheromone.hpp
 * Matriz de feromônio compartilhada pelas formigas de uma iteração.
 */
#ifndef PHEROMONE_HPP
#define PHEROMONE_HPP

#include <vector>

/**
 * @class PheromoneTrail
 * @brief Matriz quadrada N x N indexada por posição, iniciada com 1.0.
 *
 * Durante a construção das rotas a matriz é apenas lida. As escritas
 * (evaporate/deposit) só são permitidas fora de uma fase de leitura,
 * ou seja, quando nenhum TrailReadPhase está ativo.
 */
class PheromoneTrail {
public:
    explicit PheromoneTrail(int n, double initial = 1.0);

    int size() const { return n; }
    double get(int i, int j) const { return tau[i * n + j]; }

    /**
     * @brief Multiplica toda a matriz por 'rate' (fator de retenção).
     * @throws std::invalid_argument se rate fora de [0, 1).
     * @throws std::logic_error se chamado durante uma fase de leitura.
     */
    void evaporate(double rate);

    /**
     * @brief Soma 'amount' (>= 0) na aresta (i, j).
     * @throws std::invalid_argument se amount < 0.
     * @throws std::logic_error se chamado durante uma fase de leitura.
     */
    void deposit(int i, int j, double amount);

    bool inReadPhase() const { return readers > 0; }

private:
    friend class TrailReadPhase;

    int n;
    std::vector<double> tau;
    int readers = 0;
};

// Guarda RAII que congela a matriz enquanto as formigas constroem rotas.
class TrailReadPhase {
public:
    explicit TrailReadPhase(PheromoneTrail& trail) : trail(trail) { ++trail.readers; }
    ~TrailReadPhase() { --trail.readers; }

    TrailReadPhase(const TrailReadPhase&) = delete;
    TrailReadPhase& operator=(const TrailReadPhase&) = delete;

private:
    PheromoneTrail& trail;
};

#endif // PHEROMONE_HPP
