#include "store.hpp"
#include "errors.hpp"
#include <cstdio>
#include <fstream>
#include <sstream>
#include <stdexcept>

using std::vector;

bool MemoryRouteStore::exists(const std::string& solutionId) const {
    return solutions.find(solutionId) != solutions.end();
}

void MemoryRouteStore::save(const std::string& solutionId,
                            const std::string& origin,
                            const vector<RouteRecord>& records) {
    if (exists(solutionId))
        throw std::runtime_error("solução " + solutionId + " já gravada");
    StoredSolution s;
    s.origin = origin;
    s.records = records;
    solutions[solutionId] = s;
    ++saves;
}

StoredSolution MemoryRouteStore::load(const std::string& solutionId) const {
    auto it = solutions.find(solutionId);
    if (it == solutions.end())
        throw std::runtime_error("solução " + solutionId + " não encontrada");
    return it->second;
}

// Identificadores viram nomes de arquivo e campos separados por espaço.
static void check_token(const std::string& what, const std::string& token) {
    if (token.empty())
        throw ConfigurationError(what + " vazio");
    for (char c : token) {
        if (c == '/' || c == '\\' || c == ' ' || c == '\t' || c == '\n' || c == '\r')
            throw ConfigurationError(what + " '" + token + "' contém separador inválido");
    }
}

FileRouteStore::FileRouteStore(const std::string& directory) : directory(directory) {
    if (this->directory.empty()) this->directory = ".";
}

std::string FileRouteStore::pathFor(const std::string& solutionId) const {
    check_token("solution_id", solutionId);
    return directory + "/" + solutionId + ".routes";
}

bool FileRouteStore::exists(const std::string& solutionId) const {
    std::ifstream file(pathFor(solutionId));
    return file.good();
}

void FileRouteStore::save(const std::string& solutionId,
                          const std::string& origin,
                          const vector<RouteRecord>& records) {
    const std::string path = pathFor(solutionId);
    check_token("origem", origin);
    if (exists(solutionId))
        throw std::runtime_error("solução " + solutionId + " já gravada");

    const std::string tmp = path + ".tmp";
    {
        std::ofstream out(tmp);
        if (!out.is_open())
            throw std::runtime_error("Unable to open file: " + tmp);

        out << "ORIGIN " << origin << "\n";
        for (const RouteRecord& r : records) {
            check_token("ponto", r.point);
            check_token("nome da rota", r.routeName);
            out << r.solutionId << " " << r.routeNumber << " " << r.routeName << " "
                << r.point << " " << r.sequence << "\n";
        }
        out.flush();
        if (!out) {
            out.close();
            std::remove(tmp.c_str());
            throw std::runtime_error("falha ao gravar " + tmp);
        }
    }

    if (std::rename(tmp.c_str(), path.c_str()) != 0) {
        std::remove(tmp.c_str());
        throw std::runtime_error("falha ao renomear " + tmp + " para " + path);
    }
}

StoredSolution FileRouteStore::load(const std::string& solutionId) const {
    const std::string path = pathFor(solutionId);
    std::ifstream file(path);
    if (!file)
        throw std::runtime_error("solução " + solutionId + " não encontrada em " + directory);

    StoredSolution s;
    std::string line;
    while (std::getline(file, line)) {
        if (line.empty()) continue;
        std::istringstream ss(line);
        if (line.compare(0, 7, "ORIGIN ") == 0) {
            std::string tag;
            ss >> tag >> s.origin;
            continue;
        }
        RouteRecord r;
        if (!(ss >> r.solutionId >> r.routeNumber >> r.routeName >> r.point >> r.sequence))
            throw std::runtime_error("linha malformada em " + path + ": " + line);
        s.records.push_back(r);
    }
    return s;
}
