#include "evaluation.hpp"
#include "errors.hpp"
#include <algorithm>
#include <map>
#include <set>
#include <unordered_map>

using std::vector;

vector<Route> build_routes(const vector<RouteRecord>& records, const CVRP& cvrp) {
    std::unordered_map<std::string, int> position;
    for (int i = 0; i < cvrp.nPoints(); ++i) position[cvrp.id(i)] = i;

    std::map<int, vector<const RouteRecord*>> byRoute;
    for (const RouteRecord& r : records) byRoute[r.routeNumber].push_back(&r);

    vector<Route> routes;
    for (auto& entry : byRoute) {
        vector<const RouteRecord*>& stops = entry.second;
        std::stable_sort(stops.begin(), stops.end(), [](const RouteRecord* a, const RouteRecord* b) {
            return a->sequence < b->sequence;
        });

        Route route;
        route.number = entry.first;
        route.name = stops.front()->routeName;

        int prev = cvrp.originIndex;
        for (const RouteRecord* r : stops) {
            auto it = position.find(r->point);
            if (it == position.end())
                throw ConfigurationError("registro cita ponto fora da instância: " + r->point);
            int pos = it->second;
            route.stops.push_back(r->point);
            route.pallets += cvrp.points[pos].pallets;
            route.weight += cvrp.points[pos].weight;
            route.cost += cvrp.distance(prev, pos);
            prev = pos;
        }
        route.cost += cvrp.distance(prev, cvrp.originIndex);
        routes.push_back(route);
    }
    return routes;
}

bool check_feasibility(const vector<Route>& routes, const CVRP& cvrp, const CVRP_Params& cvrp_params) {
    std::set<std::string> required;
    for (int i = 0; i < cvrp.nPoints(); ++i)
        if (i != cvrp.originIndex) required.insert(cvrp.id(i));

    std::set<std::string> served;
    for (const Route& route : routes) {
        if (route.stops.empty()) return false;
        for (const std::string& stop : route.stops) {
            if (stop == cvrp.originId()) return false;        // Origem como parada
            if (!served.insert(stop).second) return false;    // Ponto repetido
        }
        if (route.pallets > cvrp_params.maxPallets) return false;
        if (route.weight > cvrp_params.maxWeight) return false;
    }
    return served == required;
}

double calculate_total_cost(const vector<Route>& routes) {
    double total = 0.0;
    for (const Route& route : routes) total += route.cost;
    return total;
}
