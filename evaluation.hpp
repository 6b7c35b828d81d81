/*
 * evaluation.hpp
 * Agrupamento dos registros em rotas e checagem de factibilidade.
 */
#ifndef EVALUATION_HPP
#define EVALUATION_HPP

#include "cvrp.hpp"
#include "parameters.hpp"
#include "route.hpp"
#include <vector>

/**
 * @brief Agrupa os registros por número de rota, em ordem de sequência,
 * e preenche carga e custo (origem -> paradas -> origem) de cada rota.
 *
 * @throws ConfigurationError se um registro citar ponto fora da instância.
 */
std::vector<Route> build_routes(const std::vector<RouteRecord>& records, const CVRP& cvrp);

/**
 * @brief Verifica se as rotas formam uma solução válida:
 * - cada ponto não-origem aparece exatamente uma vez;
 * - a origem não aparece como parada;
 * - nenhuma rota vazia;
 * - pallets e peso de cada rota dentro dos limites.
 */
bool check_feasibility(const std::vector<Route>& routes, const CVRP& cvrp, const CVRP_Params& cvrp_params);

double calculate_total_cost(const std::vector<Route>& routes);

#endif // EVALUATION_HPP
