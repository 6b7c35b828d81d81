#include "aco.hpp"
#include "pheromone.hpp"
#include "utils.hpp"
#include <algorithm>
#include <exception>
#include <limits>
#include <random>
#include <thread>
#include <vector>

using std::vector;

ACO_Result::ACO_Result() : bestLength(std::numeric_limits<double>::infinity()) {}

// Constrói as rotas de todas as formigas de uma iteração.
// Formiga 'ant' usa streams[ant] e escreve em tours[ant].
static void construct_all(const CVRP& cvrp,
                          const PheromoneTrail& trail,
                          const CVRP_Params& cvrp_params,
                          const ACO_Params& params,
                          vector<std::mt19937>& streams,
                          vector<Tour>& tours) {
    const int nAnts = params.nAnts;
    const int nWorkers = std::min(params.nThreads, nAnts);

    if (nWorkers <= 1) {
        for (int ant = 0; ant < nAnts; ++ant)
            tours[ant] = construct_tour(cvrp, trail, cvrp_params, params, streams[ant]);
        return;
    }

    vector<std::exception_ptr> errors(nWorkers);
    vector<std::thread> workers;
    workers.reserve(nWorkers);
    for (int w = 0; w < nWorkers; ++w) {
        workers.emplace_back([&, w]() {
            try {
                for (int ant = w; ant < nAnts; ant += nWorkers)
                    tours[ant] = construct_tour(cvrp, trail, cvrp_params, params, streams[ant]);
            } catch (...) {
                errors[w] = std::current_exception();
            }
        });
    }
    for (std::thread& t : workers) t.join();

    // Barreira atingida; propaga o primeiro erro para abortar o solve.
    for (const std::exception_ptr& e : errors)
        if (e) std::rethrow_exception(e);
}

void update_pheromone(PheromoneTrail& trail, const vector<Tour>& tours, const ACO_Params& params) {
    trail.evaporate(params.rho);

    for (const Tour& tour : tours) {
        if (tour.path.empty()) continue;
        double deposit = tour.length > 0.0 ? params.Q / tour.length : params.Q;
        for (size_t p = 0; p + 1 < tour.path.size(); ++p) {
            trail.deposit(tour.path[p], tour.path[p + 1], deposit);
        }
        trail.deposit(tour.path.back(), tour.path.front(), deposit);
    }
}

ACO_Result runACO(const CVRP& cvrp,
                  const CVRP_Params& cvrp_params,
                  const ACO_Params& params,
                  const ACO_Callbacks& callbacks) {
    validate_parameters(cvrp_params, params);

    PheromoneTrail trail(cvrp.nPoints());
    ACO_Result best;

    vector<Tour> tours(params.nAnts);
    vector<std::mt19937> streams(params.nAnts);

    // Loop principal do ACO
    for (int iter = 0; iter < params.nIter; ++iter) {
        for (int ant = 0; ant < params.nAnts; ++ant) streams[ant] = spawn_stream();

        {
            TrailReadPhase reading(trail);
            construct_all(cvrp, trail, cvrp_params, params, streams, tours);
        }

        double iterBest = std::numeric_limits<double>::infinity();
        for (int ant = 0; ant < params.nAnts; ++ant) {
            const Tour& tour = tours[ant];
            if (tour.length < iterBest) iterBest = tour.length;
            if (tour.length < best.bestLength) {
                best.bestLength = tour.length;
                best.bestPath = tour.path;
                if (callbacks.onNewBest) callbacks.onNewBest(iter, ant, tour.length);
            }
        }

        update_pheromone(trail, tours, params);

        if (callbacks.onIteration) callbacks.onIteration(iter, iterBest, best.bestLength);
    }

    return best;
}
