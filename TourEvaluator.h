#ifndef TOUR_EVALUATOR_H
#define TOUR_EVALUATOR_H

#include <vector>
#include "Parser.h"

// Funcion objetivo del TSP con ciudad de inicio fija.
//
// Recibe el orden de visita de las N-1 ciudades restantes (sin la ciudad
// inicial) y devuelve el largo del ciclo cerrado:
//   d(start, o[0]) + d(o[0], o[1]) + ... + d(o[N-2], start)
//
// No valida que el orden sea una permutacion: eso lo garantizan los
// operadores de los optimizadores.
class TourEvaluator {
private:
    const Parser* parserData;
    int startCity;

public:
    TourEvaluator(const Parser* parser, int startCity);

    double evaluate(const std::vector<int>& order) const;

    // Ciudades a visitar (todas menos la inicial), en orden de indice
    std::vector<int> citiesToVisit() const;
};

#endif // TOUR_EVALUATOR_H
