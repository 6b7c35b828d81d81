/*
 * errors.hpp
 * Exceções lançadas pelo solver. Todas derivam de std::runtime_error para
 * que o main possa capturá-las com um único catch (const std::exception&).
 */
#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

/**
 * @brief Parâmetro ausente ou inválido (capacidades, contagens, origem...).
 * Detectado antes de qualquer iteração do ACO.
 */
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& msg)
        : std::runtime_error("configuração inválida: " + msg) {}
};

/**
 * @brief Distância pedida para um par de pontos sem entrada na tabela.
 * Indica dados de entrada inconsistentes; aborta o solve inteiro.
 */
class UnknownPairError : public std::runtime_error {
public:
    UnknownPairError(const std::string& a, const std::string& b)
        : std::runtime_error("distância desconhecida para o par (" + a + ", " + b + ")"),
          first(a), second(b) {}

    std::string first;
    std::string second;
};

/**
 * @brief A demanda de um único ponto já excede o limite do veículo.
 */
class InfeasiblePointError : public std::runtime_error {
public:
    InfeasiblePointError(const std::string& id, const std::string& dim, double demand, double limit)
        : std::runtime_error("ponto " + id + " infactível: " + dim + " " + std::to_string(demand) +
                             " > limite " + std::to_string(limit)),
          point(id), dimension(dim) {}

    std::string point;
    std::string dimension; // "pallets" ou "weight"
};

#endif // ERRORS_HPP
