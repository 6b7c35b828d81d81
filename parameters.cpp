#include "parameters.hpp"
#include "errors.hpp"
#include <iostream>
#include <fstream>
#include <string>
#include <sstream>
#include <algorithm> // Para std::find_if
#include <cctype>    // Para std::isspace

// Função auxiliar para remover espaços em branco do início e fim de uma string
static void trim(std::string& s) {
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char ch) {
        return !std::isspace(ch);
    }));
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) {
        return !std::isspace(ch);
    }).base(), s.end());
}

// std::stoi/std::stod aceitam lixo no final ("12abc"); aqui o valor inteiro precisa ser consumido.
static int parse_int(const std::string& key, const std::string& value) {
    size_t pos = 0;
    int v = 0;
    try {
        v = std::stoi(value, &pos);
    } catch (const std::exception&) {
        throw ConfigurationError("valor '" + value + "' inválido para a chave '" + key + "'");
    }
    if (pos != value.size())
        throw ConfigurationError("valor '" + value + "' inválido para a chave '" + key + "'");
    return v;
}

static double parse_double(const std::string& key, const std::string& value) {
    size_t pos = 0;
    double v = 0.0;
    try {
        v = std::stod(value, &pos);
    } catch (const std::exception&) {
        throw ConfigurationError("valor '" + value + "' inválido para a chave '" + key + "'");
    }
    if (pos != value.size())
        throw ConfigurationError("valor '" + value + "' inválido para a chave '" + key + "'");
    return v;
}

void load_parameters_from_file(const std::string& filename, CVRP_Params& cvrp_params, ACO_Params& aco_params) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "AVISO: Não foi possível abrir o arquivo de parâmetros '" << filename << "'. Usando valores padrão." << std::endl;
        return;
    }

    std::string line;
    while (std::getline(file, line)) {
        trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }

        std::stringstream ss(line);
        std::string key, value;
        if (std::getline(ss, key, '=') && std::getline(ss, value)) {
            trim(key);
            trim(value);

            // Parâmetros do problema
            if (key == "origin") cvrp_params.origin = value;
            else if (key == "maxPallets") cvrp_params.maxPallets = parse_double(key, value);
            else if (key == "maxWeight") cvrp_params.maxWeight = parse_double(key, value);
            else if (key == "routeNamePrefix") cvrp_params.routeNamePrefix = value;
            // Parâmetros do ACO
            else if (key == "nAnts") aco_params.nAnts = parse_int(key, value);
            else if (key == "nIter") aco_params.nIter = parse_int(key, value);
            else if (key == "alpha") aco_params.alpha = parse_double(key, value);
            else if (key == "beta") aco_params.beta = parse_double(key, value);
            else if (key == "rho") aco_params.rho = parse_double(key, value);
            else if (key == "Q") aco_params.Q = parse_double(key, value);
            else if (key == "nThreads") aco_params.nThreads = parse_int(key, value);
            else std::cerr << "AVISO: Chave desconhecida '" << key << "' ignorada." << std::endl;
        } else {
            throw ConfigurationError("linha malformada '" + line + "' em " + filename);
        }
    }
}

void validate_parameters(const CVRP_Params& cvrp_params, const ACO_Params& aco_params) {
    if (cvrp_params.origin.empty())
        throw ConfigurationError("origem não informada");
    if (!(cvrp_params.maxPallets > 0.0))
        throw ConfigurationError("maxPallets deve ser positivo");
    if (!(cvrp_params.maxWeight > 0.0))
        throw ConfigurationError("maxWeight deve ser positivo");
    for (char c : cvrp_params.routeNamePrefix)
        if (std::isspace(static_cast<unsigned char>(c)))
            throw ConfigurationError("routeNamePrefix não pode conter espaços");

    if (aco_params.nAnts < 1)
        throw ConfigurationError("nAnts deve ser >= 1");
    if (aco_params.nIter < 1)
        throw ConfigurationError("nIter deve ser >= 1");
    if (aco_params.nThreads < 1)
        throw ConfigurationError("nThreads deve ser >= 1");
    if (!(aco_params.rho >= 0.0 && aco_params.rho < 1.0))
        throw ConfigurationError("rho deve estar em [0, 1)");
    if (!(aco_params.Q >= 0.0))
        throw ConfigurationError("Q não pode ser negativo");
    if (!(aco_params.alpha >= 0.0) || !(aco_params.beta >= 0.0))
        throw ConfigurationError("alpha e beta não podem ser negativos");
}
