#ifndef CBC_SOLVER_H
#define CBC_SOLVER_H

#include <vector>
#include "Parser.h"
#include "Tour.h"

// Resultado del solver exacto
struct ExactResult {
    Tour tour;
    bool provenOptimal = false;
    double lowerBound = 0.0;   // Mejor cota de CBC al terminar
    double elapsedSeconds = 0.0;
    int nodes = 0;
};

// ─────────────────────────────────────────────────────────────
// CbcSolver
//
// Óptimo de referencia por Branch & Cut:
//   x_ij binarias (arco i -> j), u_i continuas para MTZ
//   grado de entrada y salida 1 en cada ciudad
//   MTZ: u_i - u_j + (n-1) x_ij <= n-2   (i, j != 0)
//   x_ij + x_ji <= 1
// más cortes DFJ (SubtourCutGenerator) y Gomory, con el tour de vecino más
// cercano (o el que se pase) como warm start.
// ─────────────────────────────────────────────────────────────
class CbcSolver {
private:
    const Parser* parserData;
    int numCities;
    int numVariables;

    int getVarIndex(int i, int j) const;
    int getUIndex(int i) const;
    // Sigue los sucesores desde startCity
    Tour convertToTour(const double* solution, int startCity) const;

public:
    explicit CbcSolver(const Parser* parser);

    // warmStart vacío: se construye con GreedyBuilder
    ExactResult solve(int startCity, double timeLimitSeconds = 120.0,
                      const std::vector<int>& warmStartOrder = std::vector<int>(),
                      bool verbose = false);
};

#endif // CBC_SOLVER_H
