#ifndef CLP_SOLVER_H
#define CLP_SOLVER_H

#include "Parser.h"
#include <coin/ClpSimplex.hpp>

// Resultado de la relajación LP
struct LowerBound {
    double value = 0.0;     // Cota inferior válida para el largo de cualquier tour
    int rounds = 0;         // Resoluciones de CLP
    int cutsAdded = 0;      // Cortes de subtour agregados
    bool connected = false; // El soporte final quedó conexo
};

// Relajación LP simétrica del TSP resuelta con CLP:
//   min  sum_e d_e x_e
//   s.a. sum_{e en delta(i)} x_e = 2     para cada ciudad i
//        0 <= x_e <= 1
// y, mientras el grafo de soporte tenga más de una componente S, se agrega
//        sum_{e en delta(S)} x_e >= 2
// y se vuelve a resolver (dual simplex). Cualquier ronda da una cota válida;
// las siguientes solo la suben.
class ClpSolver {
private:
    const Parser* parserData;
    int numCities;
    int numVariables;

    // Arista (i, j) con i != j -> índice de columna
    int getVarIndex(int i, int j) const;

    void addDegreeRows(ClpSimplex& model) const;
    // Componentes conexas de las aristas con x_e > threshold
    std::vector<std::vector<int>> supportComponents(const double* solution, double threshold) const;

public:
    explicit ClpSolver(const Parser* parser);

    LowerBound solveRelaxation(int maxRounds = 100, bool verbose = false);
};

#endif // CLP_SOLVER_H
