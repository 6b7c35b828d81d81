#include "cvrp.hpp"
#include "errors.hpp"
#include <iostream>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>
using std::vector;

std::vector<Point> readPointTable(const std::string& filename) {
    std::ifstream file(filename);
    if (!file) {
        throw std::runtime_error("Unable to open file: " + filename);
    }

    vector<Point> table;
    std::string line;
    int lineNo = 0;
    while (std::getline(file, line)) {
        ++lineNo;
        size_t hash = line.find('#');
        if (hash != std::string::npos) line.erase(hash);

        std::istringstream ss(line);
        Point p;
        if (!(ss >> p.id)) continue;
        if (!(ss >> p.pallets >> p.weight))
            throw ConfigurationError(filename + ":" + std::to_string(lineNo) + ": esperado 'id pallets peso'");
        if (p.pallets < 0.0 || p.weight < 0.0)
            throw ConfigurationError("demanda negativa para o ponto " + p.id);
        table.push_back(p);
    }
    return table;
}

std::vector<std::string> readPointIdsFromFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file) {
        throw std::runtime_error("Unable to open file: " + filename);
    }

    vector<std::string> ids;
    std::string line;
    while (std::getline(file, line)) {
        std::string first = line.substr(0, line.find(','));
        std::istringstream ss(first);
        std::string id;
        if (ss >> id) ids.push_back(id);
    }
    return ids;
}

void CVRP::build(const vector<std::string>& ids,
                 const vector<Point>& table,
                 const DistanceTable& distances,
                 const std::string& origin) {
    points.clear();
    distMatrix.clear();
    originIndex = -1;

    std::unordered_map<std::string, const Point*> byId;
    for (const Point& p : table) byId[p.id] = &p;

    if (byId.find(origin) == byId.end())
        throw ConfigurationError("origem '" + origin + "' ausente da tabela de pontos");

    std::unordered_set<std::string> seen;
    for (const std::string& id : ids) {
        if (!seen.insert(id).second)
            throw ConfigurationError("ponto repetido na lista: " + id);
        auto it = byId.find(id);
        if (it == byId.end())
            throw ConfigurationError("ponto desconhecido: " + id);
        if (id == origin) originIndex = static_cast<int>(points.size());
        points.push_back(*it->second);
    }

    if (originIndex < 0) {
        points.insert(points.begin(), *byId[origin]);
        originIndex = 0;
    }

    const int N = nPoints();
    const double absent = std::numeric_limits<double>::quiet_NaN();
    distMatrix.assign(N, vector<double>(N, absent));
    for (int i = 0; i < N; ++i) {
        for (int j = 0; j < N; ++j) {
            if (i == j) distMatrix[i][j] = 0.0;
            else if (distances.contains(points[i].id, points[j].id))
                distMatrix[i][j] = distances.distance(points[i].id, points[j].id);
        }
    }
}

double CVRP::distance(int i, int j) const {
    double d = distMatrix[i][j];
    if (std::isnan(d)) throw UnknownPairError(points[i].id, points[j].id);
    return d;
}

void CVRP::printData() const {
    std::cout << "=== CVRP Instance Data ===\n";
    std::cout << "Points: " << nPoints() << " (origin: "
              << (originIndex >= 0 ? originId() : std::string("-")) << ")\n";
    double totalPallets = 0.0, totalWeight = 0.0;
    for (int i = 0; i < nPoints(); ++i) {
        if (i == originIndex) continue;
        totalPallets += points[i].pallets;
        totalWeight += points[i].weight;
    }
    std::cout << "Total demand: " << totalPallets << " pallets, " << totalWeight << " lbs\n";

    std::cout << "\n-- Points --\n";
    for (int i = 0; i < nPoints(); ++i) {
        std::cout << std::setw(4) << i << ": " << points[i].id
                  << " pallets=" << points[i].pallets
                  << " weight=" << points[i].weight
                  << (i == originIndex ? " [origin]" : "") << "\n";
    }
    std::cout << "==========================\n";
}
