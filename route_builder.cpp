#include "route_builder.hpp"

using std::vector;

vector<RouteRecord> decompose_routes(const std::string& solutionId,
                                     const vector<std::string>& pathIds,
                                     const std::string& origin,
                                     const std::string& routeNamePrefix) {
    vector<RouteRecord> records;

    size_t end = pathIds.size();
    if (end > 0 && pathIds[end - 1] == origin) --end; // retorno final ao depósito

    int routeNumber = 0;
    int sequence = 0;
    for (size_t i = 0; i < end; ++i) {
        const std::string& item = pathIds[i];
        if (item == origin) {
            ++routeNumber;
            sequence = 1;
        } else {
            records.emplace_back(solutionId, routeNumber,
                                 routeNamePrefix + std::to_string(routeNumber),
                                 item, sequence);
            ++sequence;
        }
    }
    return records;
}

vector<std::string> path_to_ids(const CVRP& cvrp, const vector<int>& path) {
    vector<std::string> ids;
    ids.reserve(path.size());
    for (int pos : path) ids.push_back(cvrp.id(pos));
    return ids;
}
