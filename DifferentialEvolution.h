#ifndef DIFFERENTIAL_EVOLUTION_H
#define DIFFERENTIAL_EVOLUTION_H

#include <random>
#include <vector>
#include "Parser.h"
#include "Parameters.h"
#include "Individual.h"

// ============================================================
// DifferentialEvolution - DE/rand/1/bin sobre claves aleatorias
//
// Cada individuo es un vector real en [0,1]^(N-1). Para evaluarlo se
// decodifica a un tour ordenando las ciudades por su clave (de menor
// a mayor). Mutación y cruzamiento ocurren en el espacio continuo:
//   mutante = a + F * (b - c)          (recortado a [0,1])
//   prueba  = cruzamiento binomial(objetivo, mutante, CR)
// y la prueba reemplaza al objetivo si no es peor.
// ============================================================
class DifferentialEvolution {
public:
    DifferentialEvolution(const Parser* parser, const DEParams& params, bool verbose = false);

    SearchOutcome optimize(int startCity, int popSize, int nGen, std::mt19937& rng) const;

    // Ordenamiento estable de 'cities' según 'keys'; empates conservan el orden original
    static std::vector<int> decode(const std::vector<double>& keys, const std::vector<int>& cities);

private:
    const Parser* parserData;
    DEParams params;
    bool verbose;

    // Tres índices distintos entre sí y distintos de 'target' cuando la población alcanza
    void pickDonors(int target, int popSize, std::mt19937& rng, int& a, int& b, int& c) const;
};

#endif // DIFFERENTIAL_EVOLUTION_H
