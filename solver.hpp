/*
 * solver.hpp
 * Ponto de entrada: resolve uma instância e grava a solução uma única vez.
 */
#ifndef SOLVER_HPP
#define SOLVER_HPP

#include "aco.hpp"
#include "cvrp.hpp"
#include "parameters.hpp"
#include "route.hpp"
#include "store.hpp"
#include <string>
#include <vector>

enum class SolveStatus {
    Solved,
    AlreadyExists
};

struct SolveResult {
    SolveStatus status;
    double bestLength;
    std::vector<int> bestPath;
    std::vector<RouteRecord> records;

    SolveResult() : status(SolveStatus::AlreadyExists), bestLength(0.0) {}
};

/**
 * @brief Garante que cada ponto cabe sozinho em um veículo.
 * @throws InfeasiblePointError no primeiro ponto que não cabe.
 */
void check_point_capacities(const CVRP& cvrp, const CVRP_Params& cvrp_params);

/**
 * @brief Resolve a instância e grava as rotas em 'store'.
 *
 * Se 'solutionId' já existe no armazenamento, retorna AlreadyExists sem
 * calcular nem gravar nada. Caso contrário valida os parâmetros, checa a
 * capacidade de cada ponto, roda o ACO, decompõe a melhor rota e grava
 * registros + origem numa única chamada a store.save().
 *
 * @throws ConfigurationError, InfeasiblePointError, UnknownPairError.
 */
SolveResult solve_cvrp(const std::string& solutionId,
                       const CVRP& cvrp,
                       const CVRP_Params& cvrp_params,
                       const ACO_Params& aco_params,
                       RouteStore& store,
                       const ACO_Callbacks& callbacks = ACO_Callbacks());

#endif // SOLVER_HPP
