#ifndef RUN_RESULT_H
#define RUN_RESULT_H

#include <string>
#include "Tour.h"

// Registro de una corrida (ciudad inicial x algoritmo). Se produce una sola
// vez al terminar la búsqueda y el reporte solo lo lee.
class RunResult {
private:
    int startCity;          // Índice base 0
    std::string algorithm;  // Nombre corto (GA, GA2, DE)
    std::string label;      // Nombre largo para el reporte
    Tour tour;
    double elapsedSeconds;
    int generations;
    long evaluations;
    unsigned int seed;

public:
    RunResult(int startCity, const std::string& algorithm, const std::string& label,
              const Tour& tour, double elapsedSeconds, int generations,
              long evaluations, unsigned int seed);

    bool isValid() const;

    // Getters
    int getStartCity() const;
    const std::string& getAlgorithm() const;
    const std::string& getLabel() const;
    const Tour& getTour() const;
    double getDistance() const;
    double getElapsedSeconds() const;
    int getGenerations() const;
    long getEvaluations() const;
    unsigned int getSeed() const;

    void print() const;

    ~RunResult();
};

// Corrida que falló dentro del experimento
struct RunFailure {
    int startCity;
    std::string algorithm;
    std::string kind;     // InvalidConfiguration, SearchFailure
    std::string message;
};

#endif // RUN_RESULT_H
