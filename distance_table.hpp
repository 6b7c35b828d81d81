/*
 * distance_table.hpp
 * Tabela de distâncias por par de identificadores (geo_permutations).
 */
#ifndef DISTANCE_TABLE_HPP
#define DISTANCE_TABLE_HPP

#include <string>
#include <unordered_map>

class DistanceTable {
public:
    void set(const std::string& a, const std::string& b, double distance);

    /**
     * @brief Procura o par ordenado (a, b); se ausente, usa (b, a).
     */
    bool contains(const std::string& a, const std::string& b) const;

    /**
     * @brief Distância entre a e b.
     * @throws UnknownPairError se nenhum dos dois sentidos estiver na tabela.
     */
    double distance(const std::string& a, const std::string& b) const;

    size_t size() const { return count; }

    // Formato: "id_1 id_2 distancia" por linha, '#' inicia comentário.
    void readFromFile(const std::string& filename);

private:
    const double* find(const std::string& a, const std::string& b) const;

    std::unordered_map<std::string, std::unordered_map<std::string, double>> table;
    size_t count = 0;
};

#endif // DISTANCE_TABLE_HPP
