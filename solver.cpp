#include "solver.hpp"
#include "errors.hpp"
#include "evaluation.hpp"
#include "route_builder.hpp"
#include <stdexcept>

void check_point_capacities(const CVRP& cvrp, const CVRP_Params& cvrp_params) {
    for (int i = 0; i < cvrp.nPoints(); ++i) {
        if (i == cvrp.originIndex) continue; // A origem não consome capacidade
        const Point& p = cvrp.points[i];
        if (p.pallets > cvrp_params.maxPallets)
            throw InfeasiblePointError(p.id, "pallets", p.pallets, cvrp_params.maxPallets);
        if (p.weight > cvrp_params.maxWeight)
            throw InfeasiblePointError(p.id, "weight", p.weight, cvrp_params.maxWeight);
    }
}

SolveResult solve_cvrp(const std::string& solutionId,
                       const CVRP& cvrp,
                       const CVRP_Params& cvrp_params,
                       const ACO_Params& aco_params,
                       RouteStore& store,
                       const ACO_Callbacks& callbacks) {
    SolveResult result;
    if (store.exists(solutionId)) {
        result.status = SolveStatus::AlreadyExists;
        return result;
    }

    validate_parameters(cvrp_params, aco_params);
    if (cvrp.originIndex < 0 || cvrp.originId() != cvrp_params.origin)
        throw ConfigurationError("instância montada com origem diferente de '" + cvrp_params.origin + "'");
    if (cvrp.nPoints() < 2)
        throw ConfigurationError("nenhum ponto de entrega além da origem");
    check_point_capacities(cvrp, cvrp_params);

    ACO_Result aco = runACO(cvrp, cvrp_params, aco_params, callbacks);

    std::vector<RouteRecord> records = decompose_routes(solutionId,
                                                        path_to_ids(cvrp, aco.bestPath),
                                                        cvrp.originId(),
                                                        cvrp_params.routeNamePrefix);

    if (!check_feasibility(build_routes(records, cvrp), cvrp, cvrp_params))
        throw std::logic_error("decomposição da melhor rota não é factível");

    store.save(solutionId, cvrp.originId(), records);

    result.status = SolveStatus::Solved;
    result.bestLength = aco.bestLength;
    result.bestPath = aco.bestPath;
    result.records = records;
    return result;
}
