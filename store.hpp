/*
 * store.hpp
 * Armazenamento das soluções (rotas + origem) por identificador.
 */
#ifndef STORE_HPP
#define STORE_HPP

#include "route.hpp"
#include <map>
#include <string>
#include <vector>

/**
 * @struct StoredSolution
 * @brief O que foi gravado para um solution_id.
 */
struct StoredSolution {
    std::string origin;
    std::vector<RouteRecord> records;
};

class RouteStore {
public:
    virtual ~RouteStore() {}

    virtual bool exists(const std::string& solutionId) const = 0;

    /**
     * @brief Grava registros e origem de uma vez; ou tudo, ou nada.
     */
    virtual void save(const std::string& solutionId,
                      const std::string& origin,
                      const std::vector<RouteRecord>& records) = 0;

    /**
     * @throws std::runtime_error se a solução não existir.
     */
    virtual StoredSolution load(const std::string& solutionId) const = 0;
};

// Armazenamento em memória (testes e uso embutido).
class MemoryRouteStore : public RouteStore {
public:
    bool exists(const std::string& solutionId) const override;
    void save(const std::string& solutionId,
              const std::string& origin,
              const std::vector<RouteRecord>& records) override;
    StoredSolution load(const std::string& solutionId) const override;

    int saveCount() const { return saves; }

private:
    std::map<std::string, StoredSolution> solutions;
    int saves = 0;
};

/**
 * @class FileRouteStore
 * @brief Um arquivo texto por solução: <diretorio>/<solution_id>.routes
 *
 * Formato:
 *   ORIGIN <origem>
 *   <solution_id> <rota> <nome_rota> <ponto> <sequencia>
 *   ...
 * A gravação vai para um arquivo temporário renomeado no fim.
 */
class FileRouteStore : public RouteStore {
public:
    explicit FileRouteStore(const std::string& directory);

    bool exists(const std::string& solutionId) const override;
    void save(const std::string& solutionId,
              const std::string& origin,
              const std::vector<RouteRecord>& records) override;
    StoredSolution load(const std::string& solutionId) const override;

private:
    std::string pathFor(const std::string& solutionId) const;

    std::string directory;
};

#endif // STORE_HPP
