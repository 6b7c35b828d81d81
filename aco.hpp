/*
 * aco.hpp
 * Laço principal da colônia de formigas.
 */
#ifndef ACO_HPP
#define ACO_HPP

#include "cvrp.hpp"
#include "parameters.hpp"
#include "tour.hpp"
#include <functional>
#include <vector>

/**
 * @struct ACO_Callbacks
 * @brief Ganchos opcionais de acompanhamento; nenhum é obrigatório.
 */
struct ACO_Callbacks {
    // Chamado ao fim de cada iteração (após a atualização do feromônio).
    std::function<void(int iter, double iterBest, double globalBest)> onIteration;
    // Chamado quando uma formiga melhora estritamente o melhor global.
    std::function<void(int iter, int ant, double length)> onNewBest;
};

/**
 * @struct ACO_Result
 * @brief Melhor rota encontrada em todas as iterações.
 */
struct ACO_Result {
    double bestLength;
    std::vector<int> bestPath; // posições; vazio se nada foi construído

    ACO_Result();
};

/**
 * @brief Executa nIter iterações com nAnts formigas cada.
 *
 * As sementes das formigas são tiradas do gerador global 'rng' em ordem,
 * antes de cada fase de construção, então o resultado não depende de nThreads.
 * Todas as formigas depositam Q / comprimento em suas arestas (inclusive a
 * aresta do último ao primeiro ponto) depois da evaporação.
 *
 * @throws ConfigurationError se os parâmetros forem inválidos.
 * @throws UnknownPairError / InfeasiblePointError vindos da construção.
 */
ACO_Result runACO(const CVRP& cvrp,
                  const CVRP_Params& cvrp_params,
                  const ACO_Params& params,
                  const ACO_Callbacks& callbacks = ACO_Callbacks());

/**
 * @brief Fase de atualização: evapora e deposita para todas as formigas.
 */
void update_pheromone(PheromoneTrail& trail, const std::vector<Tour>& tours, const ACO_Params& params);

#endif // ACO_HPP
