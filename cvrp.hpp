#ifndef CVRP_HPP
#define CVRP_HPP

#include "distance_table.hpp"
#include <vector>
#include <string>

class Point {
public:
    std::string id;
    double pallets;
    double weight;
};

// Tabela de atributos (geo_points): "id pallets peso" por linha.
std::vector<Point> readPointTable(const std::string& filename);

// Lista de pontos a resolver: primeira coluna de cada linha (CSV).
std::vector<std::string> readPointIdsFromFile(const std::string& filename);

class CVRP {
public:
    std::vector<Point> points;  // índice = posição estável usada pelo ACO
    int originIndex = -1;

    /**
     * @brief Monta a instância a partir da lista de pontos a resolver.
     *
     * A origem é inserida na posição 0 quando não consta da lista.
     * As distâncias são copiadas para uma matriz densa por posição;
     * pares ausentes só falham quando consultados.
     *
     * @throws ConfigurationError para ids desconhecidos ou repetidos.
     */
    void build(const std::vector<std::string>& ids,
               const std::vector<Point>& table,
               const DistanceTable& distances,
               const std::string& origin);

    int nPoints() const { return static_cast<int>(points.size()); }
    const std::string& id(int pos) const { return points[pos].id; }
    const std::string& originId() const { return points[originIndex].id; }

    /**
     * @brief Distância entre duas posições.
     * @throws UnknownPairError se o par não estava na tabela.
     */
    double distance(int i, int j) const;

    void printData() const;

private:
    std::vector<std::vector<double>> distMatrix; // NaN = par ausente
};

#endif // CVRP_HPP
