/*
 * route.hpp
 * Estruturas de saída: registros persistidos e rotas agrupadas.
 */
#ifndef ROUTE_HPP
#define ROUTE_HPP

#include <string>
#include <vector>

/**
 * @struct RouteRecord
 * @brief Uma parada de uma rota, como é gravada no armazenamento
 * (solution_id, número da rota, nome, ponto, sequência).
 */
struct RouteRecord {
    std::string solutionId;
    int routeNumber;
    std::string routeName;
    std::string point;
    int sequence;

    RouteRecord() : routeNumber(0), sequence(0) {}
    RouteRecord(const std::string& solutionId, int routeNumber, const std::string& routeName,
                const std::string& point, int sequence)
        : solutionId(solutionId), routeNumber(routeNumber), routeName(routeName),
          point(point), sequence(sequence) {}

    bool operator==(const RouteRecord& other) const {
        return solutionId == other.solutionId && routeNumber == other.routeNumber &&
               routeName == other.routeName && point == other.point && sequence == other.sequence;
    }
};

/**
 * @struct Route
 * @brief Uma única rota de veículo (um "trator"): paradas em ordem,
 * carga total e distância origem -> paradas -> origem.
 */
struct Route {
    int number;
    std::string name;
    std::vector<std::string> stops;
    double pallets;
    double weight;
    double cost;

    Route() : number(0), pallets(0.0), weight(0.0), cost(0.0) {}
};

#endif // ROUTE_HPP
