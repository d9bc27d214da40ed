#ifndef INDIVIDUAL_H
#define INDIVIDUAL_H

#include <vector>

// Candidato de la búsqueda. El GA usa solo 'order'; DE mantiene además las
// claves reales y 'order' es su decodificación.
struct Individual {
    std::vector<int> order;    // Orden de visita sin la ciudad inicial
    std::vector<double> keys;  // Solo DE: vector en [0,1]^(N-1)
    double fitness = 1e18;     // Largo del ciclo cerrado
};

// Lo que devuelve un optimizador al terminar una corrida
struct SearchOutcome {
    Individual best;
    int generations = 0;
    long evaluations = 0;
};

#endif // INDIVIDUAL_H
