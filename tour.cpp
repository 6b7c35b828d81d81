#include "tour.hpp"
#include "utils.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>

using std::vector;

// Escolhe um índice em 'candidates' por roleta; uniforme quando a soma não serve.
static size_t select_candidate(const vector<double>& weights, double sum, std::mt19937& gen) {
    if (!(sum > 0.0) || !std::isfinite(sum)) {
        return static_cast<size_t>(randint(gen, 0, static_cast<int>(weights.size()) - 1));
    }
    double r = randreal(gen) * sum;
    double acc = 0.0;
    for (size_t k = 0; k < weights.size(); ++k) {
        acc += weights[k];
        if (r < acc) return k;
    }
    // Arredondamento: r caiu no fim do intervalo, pega o último com peso.
    for (size_t k = weights.size(); k-- > 0;) {
        if (weights[k] > 0.0) return k;
    }
    return weights.size() - 1;
}

Tour construct_tour(const CVRP& cvrp,
                    const PheromoneTrail& trail,
                    const CVRP_Params& cvrp_params,
                    const ACO_Params& params,
                    std::mt19937& gen) {
    const int origin = cvrp.originIndex;
    const int N = cvrp.nPoints();

    // Visitação rastreada só sobre pontos não-origem.
    vector<int> unvisited;
    unvisited.reserve(N);
    for (int i = 0; i < N; ++i)
        if (i != origin) unvisited.push_back(i);

    Tour tour;
    if (unvisited.empty()) return tour;

    size_t startIdx = static_cast<size_t>(randint(gen, 0, static_cast<int>(unvisited.size()) - 1));
    int cur = unvisited[startIdx];
    unvisited.erase(unvisited.begin() + startIdx);

    const Point& start = cvrp.points[cur];
    if (start.pallets > cvrp_params.maxPallets)
        throw InfeasiblePointError(start.id, "pallets", start.pallets, cvrp_params.maxPallets);
    if (start.weight > cvrp_params.maxWeight)
        throw InfeasiblePointError(start.id, "weight", start.weight, cvrp_params.maxWeight);

    tour.path.push_back(origin);
    tour.path.push_back(cur);
    tour.length = cvrp.distance(origin, cur);
    double load = cvrp.points[cur].pallets;
    double weight = cvrp.points[cur].weight;

    vector<double> weights;
    while (!unvisited.empty()) {
        weights.assign(unvisited.size(), 0.0);
        double sum = 0.0;
        for (size_t k = 0; k < unvisited.size(); ++k) {
            int node = unvisited[k];
            double d = std::max(1e-9, cvrp.distance(cur, node));
            double val = std::pow(trail.get(cur, node), params.alpha) / std::pow(d, params.beta);
            weights[k] = val;
            sum += val;
        }

        size_t k = select_candidate(weights, sum, gen);
        int next = unvisited[k];
        const Point& p = cvrp.points[next];

        bool overPallets = load + p.pallets > cvrp_params.maxPallets;
        bool overWeight = weight + p.weight > cvrp_params.maxWeight;
        if (overPallets || overWeight) {
            // Veículo vazio e ainda não cabe: nenhuma rota consegue atender o ponto.
            if (cur == origin) {
                if (overPallets) throw InfeasiblePointError(p.id, "pallets", p.pallets, cvrp_params.maxPallets);
                throw InfeasiblePointError(p.id, "weight", p.weight, cvrp_params.maxWeight);
            }
            // Retorno forçado: fecha a sub-rota e recomeça da origem.
            tour.path.push_back(origin);
            tour.length += cvrp.distance(cur, origin);
            cur = origin;
            load = 0.0;
            weight = 0.0;
        } else {
            tour.path.push_back(next);
            tour.length += cvrp.distance(cur, next);
            load += p.pallets;
            weight += p.weight;
            cur = next;
            unvisited.erase(unvisited.begin() + k);
        }
    }

    tour.path.push_back(origin);
    tour.length += cvrp.distance(cur, origin);
    return tour;
}
