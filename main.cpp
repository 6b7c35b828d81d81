#include "cvrp.hpp"
#include "distance_table.hpp"
#include "evaluation.hpp"
#include "parameters.hpp"
#include "solver.hpp"
#include "store.hpp"
#include "utils.hpp"
#include <iostream>
#include <string>
#include <vector>
#include <iomanip>

void print_usage(const char* prog_name) {
    std::cerr << "Uso: " << prog_name << " <solution_id> <lista_pontos> <tabela_pontos> <distancias> <arquivo_parametros> <diretorio_saida> <semente_aleatoria> [--verbose]\n\n";
    std::cerr << "Argumentos:\n";
    std::cerr << "  <solution_id>          Identificador da solução a gravar.\n";
    std::cerr << "  <lista_pontos>         Pontos a atender, um por linha (primeira coluna do CSV).\n";
    std::cerr << "  <tabela_pontos>        Atributos dos pontos: 'id pallets peso' por linha.\n";
    std::cerr << "  <distancias>           Distâncias: 'id_1 id_2 distancia' por linha.\n";
    std::cerr << "  <arquivo_parametros>   Caminho para o arquivo de configuração (.txt).\n";
    std::cerr << "  <diretorio_saida>      Diretório onde as soluções são gravadas.\n";
    std::cerr << "  <semente_aleatoria>    Um número inteiro para a semente aleatória.\n";
    std::cerr << "  --verbose              (Opcional) Ativa logs de progresso.\n";
}

static void print_routes(const std::vector<Route>& routes) {
    std::cout << std::fixed << std::setprecision(2);
    for (const Route& route : routes) {
        std::cout << "  " << route.name << ": " << route.stops.size() << " paradas, "
                  << route.pallets << " pallets, " << route.weight << " lbs, "
                  << route.cost << " m\n    ";
        for (size_t i = 0; i < route.stops.size(); ++i) {
            std::cout << route.stops[i] << (i + 1 < route.stops.size() ? " -> " : "");
        }
        std::cout << "\n";
    }
}

int main(int argc, char** argv) {
    std::ios::sync_with_stdio(false);

    if (argc < 8) {
        print_usage(argv[0]);
        return 1;
    }

    std::string solution_id = argv[1];
    std::string ids_file = argv[2];
    std::string table_file = argv[3];
    std::string dist_file = argv[4];
    std::string params_file = argv[5];
    std::string store_dir = argv[6];
    unsigned int seed;
    try {
        seed = std::stoul(argv[7]);
    } catch (const std::exception& e) {
        std::cerr << "Erro: A semente aleatória '" << argv[7] << "' é inválida.\n";
        return 1;
    }
    bool verbose_mode = (argc > 8 && std::string(argv[8]) == "--verbose");

    rng.seed(seed);

    try {
        CVRP_Params cvrp_params;
        ACO_Params aco_params;
        load_parameters_from_file(params_file, cvrp_params, aco_params);
        validate_parameters(cvrp_params, aco_params);

        FileRouteStore store(store_dir);
        if (store.exists(solution_id)) {
            std::cout << "Solução '" << solution_id << "' já existe em " << store_dir << ".\n";
            return 0;
        }

        DistanceTable distances;
        distances.readFromFile(dist_file);

        CVRP cvrp;
        cvrp.build(readPointIdsFromFile(ids_file), readPointTable(table_file), distances, cvrp_params.origin);

        std::cout << "Solução: " << solution_id << "\n";
        std::cout << "Semente aleatória: " << seed << "\n";
        std::cout << "--- Parâmetros ---\n";
        std::cout << " Origem: " << cvrp_params.origin << ", Pallets: " << cvrp_params.maxPallets
                  << ", Peso: " << cvrp_params.maxWeight << "\n";
        std::cout << " Formigas: " << aco_params.nAnts << ", Iterações: " << aco_params.nIter
                  << ", Threads: " << aco_params.nThreads << "\n"
                  << " Alpha: " << aco_params.alpha
                  << ", Beta: " << aco_params.beta << ", Rho: " << aco_params.rho
                  << ", Q: " << aco_params.Q << "\n";
        if (verbose_mode) cvrp.printData();

        ACO_Callbacks callbacks;
        if (verbose_mode) {
            callbacks.onNewBest = [](int iter, int ant, double length) {
                std::cout << "  [iter " << iter << "] formiga " << ant << " melhorou: " << length << "\n";
            };
            callbacks.onIteration = [&aco_params](int iter, double iterBest, double globalBest) {
                if (iter % 10 == 0 || iter == aco_params.nIter - 1) {
                    std::cout << "Iter " << iter << ": melhor da iteração = " << iterBest
                              << ", melhor global = " << globalBest << "\n";
                }
            };
        }

        SolveResult result = solve_cvrp(solution_id, cvrp, cvrp_params, aco_params, store, callbacks);
        if (result.status == SolveStatus::AlreadyExists) {
            std::cout << "Solução '" << solution_id << "' já existe em " << store_dir << ".\n";
            return 0;
        }

        std::vector<Route> routes = build_routes(result.records, cvrp);

        std::cout << "\n=== Resumo da solução ===\n";
        print_routes(routes);
        std::cout << "\n  Rotas: " << routes.size() << ", Pontos atendidos: " << result.records.size() << "\n";
        std::cout << "  Distância total: ......................... " << result.bestLength << " m\n";
        std::cout << "\nSolução gravada em " << store_dir << ".\n";
    } catch (const std::exception& e) {
        std::cerr << "Erro: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
