/*
 * route_builder.hpp
 * Quebra a melhor rota do ACO em sub-rotas nos retornos à origem.
 */
#ifndef ROUTE_BUILDER_HPP
#define ROUTE_BUILDER_HPP

#include "cvrp.hpp"
#include "route.hpp"
#include <string>
#include <vector>

/**
 * @brief Gera os registros de rota a partir da sequência de identificadores.
 *
 * 1. Remove o último identificador se for a origem.
 * 2. Cada ocorrência da origem inicia uma nova rota (numeração a partir de 1)
 *    e reinicia a sequência em 1.
 * 3. Cada ponto não-origem vira um registro; a sequência avança a cada um.
 *
 * A origem nunca aparece nos registros.
 */
std::vector<RouteRecord> decompose_routes(const std::string& solutionId,
                                          const std::vector<std::string>& pathIds,
                                          const std::string& origin,
                                          const std::string& routeNamePrefix);

// Converte posições da rota em identificadores de ponto.
std::vector<std::string> path_to_ids(const CVRP& cvrp, const std::vector<int>& path);

#endif // ROUTE_BUILDER_HPP
