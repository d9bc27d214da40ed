#ifndef EXPERIMENT_H
#define EXPERIMENT_H

#include <string>
#include <vector>
#include "Parser.h"
#include "Parameters.h"
#include "RunResult.h"

// Resultados de todas las corridas de un experimento
struct ExperimentReport {
    std::vector<RunResult> results;
    std::vector<RunFailure> failures;

    // Índice de la corrida con menor distancia, -1 si no hay resultados
    int bestIndex() const;
    const RunResult* find(int startCity, const std::string& algorithm) const;
};

// Ejecuta SearchDriver una vez por cada par (ciudad inicial, algoritmo),
// en secuencia. Si una corrida falla se registra en 'failures' y el bucle
// sigue con el par siguiente: las corridas no comparten estado mutable.
class ExperimentRunner {
private:
    const Parser* parserData;
    ExperimentConfig config;

    void printHeader(const AlgorithmConfig& algorithm, int startCity) const;

public:
    ExperimentRunner(const Parser* parser, const ExperimentConfig& config);

    ExperimentReport run() const;
};

#endif // EXPERIMENT_H
