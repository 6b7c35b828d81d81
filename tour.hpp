/*
 * tour.hpp
 * Construção da rota completa de uma formiga.
 */
#ifndef TOUR_HPP
#define TOUR_HPP

#include "cvrp.hpp"
#include "parameters.hpp"
#include "pheromone.hpp"
#include <random>
#include <vector>

/**
 * @struct Tour
 * @brief Sequência de posições começando e terminando na origem.
 *
 * Cada posição não-origem aparece exatamente uma vez; retornos
 * intermediários à origem separam as sub-rotas (ex: 0 -> 3 -> 5 -> 0 -> 2 -> 0).
 */
struct Tour {
    std::vector<int> path;
    double length;

    Tour() : length(0.0) {}
};

/**
 * @brief Constrói a rota de uma formiga.
 *
 * 1. Sorteia um ponto inicial (não-origem) uniformemente.
 * 2. A cada passo, escolhe o próximo ponto entre os não visitados com
 *    probabilidade proporcional a tau^alpha / d^beta (uniforme se todos
 *    os pesos forem zero). A origem nunca é candidata.
 * 3. Se o candidato estoura pallets ou peso, volta à origem, zera a carga
 *    e sorteia de novo a partir dela.
 * 4. Ao fim, fecha a rota na origem.
 *
 * @param gen Fluxo aleatório exclusivo da formiga.
 * @throws UnknownPairError se alguma distância necessária não existir.
 */
Tour construct_tour(const CVRP& cvrp,
                    const PheromoneTrail& trail,
                    const CVRP_Params& cvrp_params,
                    const ACO_Params& params,
                    std::mt19937& gen);

#endif // TOUR_HPP
