#include "distance_table.hpp"
#include "errors.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>

void DistanceTable::set(const std::string& a, const std::string& b, double distance) {
    if (!(distance >= 0.0))
        throw ConfigurationError("distância negativa para o par (" + a + ", " + b + ")");
    auto& row = table[a];
    if (row.find(b) == row.end()) ++count;
    row[b] = distance;
}

const double* DistanceTable::find(const std::string& a, const std::string& b) const {
    auto it = table.find(a);
    if (it != table.end()) {
        auto jt = it->second.find(b);
        if (jt != it->second.end()) return &jt->second;
    }
    it = table.find(b);
    if (it != table.end()) {
        auto jt = it->second.find(a);
        if (jt != it->second.end()) return &jt->second;
    }
    return nullptr;
}

bool DistanceTable::contains(const std::string& a, const std::string& b) const {
    return find(a, b) != nullptr;
}

double DistanceTable::distance(const std::string& a, const std::string& b) const {
    const double* d = find(a, b);
    if (d == nullptr) throw UnknownPairError(a, b);
    return *d;
}

void DistanceTable::readFromFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file) {
        throw std::runtime_error("Unable to open file: " + filename);
    }

    std::string line;
    int lineNo = 0;
    while (std::getline(file, line)) {
        ++lineNo;
        size_t hash = line.find('#');
        if (hash != std::string::npos) line.erase(hash);

        std::istringstream ss(line);
        std::string a, b;
        double d;
        if (!(ss >> a)) continue; // linha vazia
        if (!(ss >> b >> d))
            throw ConfigurationError(filename + ":" + std::to_string(lineNo) + ": esperado 'id_1 id_2 distancia'");
        set(a, b, d);
    }
}
