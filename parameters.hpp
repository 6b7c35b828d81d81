#ifndef PARAMETERS_HPP
#define PARAMETERS_HPP

#include <string>

// Parâmetros do problema (origem e limites do veículo)
struct CVRP_Params {
    std::string origin;
    double maxPallets = -1.0; // obrigatório, < 0 significa "não informado"
    double maxWeight = -1.0;  // obrigatório, < 0 significa "não informado"
    std::string routeNamePrefix = "Tractor_";
};

// Parâmetros do ACO
struct ACO_Params {
    int nAnts = 30;
    int nIter = 50;
    double alpha = 1.0;
    double beta = 1.0;
    double rho = 0.5;   // Fator de retenção aplicado na evaporação (tau *= rho)
    double Q = 1.0;
    int nThreads = 1;
};

void load_parameters_from_file(const std::string& filename, CVRP_Params& cvrp_params, ACO_Params& aco_params);

/**
 * @brief Valida os parâmetros antes de qualquer iteração.
 * @throws ConfigurationError na primeira violação encontrada.
 */
void validate_parameters(const CVRP_Params& cvrp_params, const ACO_Params& aco_params);

#endif // PARAMETERS_HPP
