#ifndef GENETIC_ALGORITHM_H
#define GENETIC_ALGORITHM_H

#include <random>
#include <utility>
#include <vector>
#include "Parser.h"
#include "Parameters.h"
#include "Individual.h"
#include "TourEvaluator.h"

// ============================================================
// GeneticAlgorithm - GA de permutaciones para TSP
//
// Representación: orden de visita de las N-1 ciudades que no son
// la inicial.
//
// Por generación:
//   1. Selección por torneo (tamaño tournamentK)
//   2. Order Crossover (OX) con probabilidad pCrossover
//   3. Mutación por inversión de segmento con probabilidad pMutation
//   4. Eliminación de duplicados (con reintentos acotados)
//   5. Supervivencia (mu + lambda): padres + hijos, se quedan los
//      popSize mejores
// ============================================================
class GeneticAlgorithm {
public:
    GeneticAlgorithm(const Parser* parser, const GAParams& params, bool verbose = false);

    // Método principal: corre nGen generaciones desde startCity
    SearchOutcome optimize(int startCity, int popSize, int nGen, std::mt19937& rng) const;

    // OX: cada hijo conserva un segmento de un padre y completa con el otro
    std::pair<std::vector<int>, std::vector<int>> orderCrossover(
        const std::vector<int>& a, const std::vector<int>& b, std::mt19937& rng) const;

    // Invierte un segmento aleatorio [i, j]
    void inversionMutation(std::vector<int>& order, std::mt19937& rng) const;

    // Retorna el índice del ganador del torneo
    int tournamentSelect(const std::vector<Individual>& pop, std::mt19937& rng) const;

private:
    const Parser* parserData;
    GAParams params;
    bool verbose;

    std::vector<Individual> initialPopulation(const TourEvaluator& evaluator, int popSize,
                                              std::mt19937& rng, long& evaluations) const;
};

#endif // GENETIC_ALGORITHM_H
