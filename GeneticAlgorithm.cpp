#include "GeneticAlgorithm.h"
#include "Random.h"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <set>
#include <stdexcept>

using namespace std;

GeneticAlgorithm::GeneticAlgorithm(const Parser* parser, const GAParams& params, bool verbose)
    : parserData(parser), params(params), verbose(verbose) {}

// ─────────────────────────────────────────────────────────────
// Operadores
// ─────────────────────────────────────────────────────────────

// Copia el segmento [i, j] de 'keep' en las mismas posiciones y rellena
// los huecos de izquierda a derecha con los genes de 'fill' en su orden.
static vector<int> oxChild(const vector<int>& keep, const vector<int>& fill, int i, int j) {
    int n = keep.size();
    vector<int> child(n, -1);
    set<int> inSegment;
    for (int k = i; k <= j; ++k) {
        child[k] = keep[k];
        inSegment.insert(keep[k]);
    }

    int pos = 0;
    for (int gene : fill) {
        if (inSegment.count(gene)) continue;
        while (pos < n && child[pos] != -1) ++pos;
        child[pos] = gene;
    }
    return child;
}

pair<vector<int>, vector<int>> GeneticAlgorithm::orderCrossover(
    const vector<int>& a, const vector<int>& b, mt19937& rng) const {
    int n = a.size();
    if (n < 2) return make_pair(a, b);

    int i = randint(rng, 0, n - 1);
    int j = randint(rng, 0, n - 1);
    if (i > j) swap(i, j);

    return make_pair(oxChild(a, b, i, j), oxChild(b, a, i, j));
}

void GeneticAlgorithm::inversionMutation(vector<int>& order, mt19937& rng) const {
    int n = order.size();
    if (n < 2) return;

    int i = randint(rng, 0, n - 1);
    int j = randint(rng, 0, n - 1);
    if (i > j) swap(i, j);
    reverse(order.begin() + i, order.begin() + j + 1);
}

int GeneticAlgorithm::tournamentSelect(const vector<Individual>& pop, mt19937& rng) const {
    int last = static_cast<int>(pop.size()) - 1;
    int best = randint(rng, 0, last);
    for (int k = 1; k < params.tournamentK; ++k) {
        int challenger = randint(rng, 0, last);
        if (pop[challenger].fitness < pop[best].fitness) best = challenger;
    }
    return best;
}

// ─────────────────────────────────────────────────────────────
// Población inicial: permutaciones aleatorias sin repetir
// ─────────────────────────────────────────────────────────────
vector<Individual> GeneticAlgorithm::initialPopulation(const TourEvaluator& evaluator, int popSize,
                                                       mt19937& rng, long& evaluations) const {
    vector<int> base = evaluator.citiesToVisit();
    vector<Individual> population;
    set<vector<int>> seen;
    int rejected = 0;
    int maxRejected = params.duplicateRetries * popSize;

    while (static_cast<int>(population.size()) < popSize) {
        vector<int> order = base;
        shuffle(order.begin(), order.end(), rng);

        // Si el espacio es más chico que la población, se aceptan repetidos
        if (params.eliminateDuplicates && seen.count(order) && rejected < maxRejected) {
            ++rejected;
            continue;
        }
        seen.insert(order);

        Individual ind;
        ind.order = order;
        ind.fitness = evaluator.evaluate(ind.order);
        ++evaluations;
        population.push_back(ind);
    }
    return population;
}

static bool byFitness(const Individual& a, const Individual& b) {
    return a.fitness < b.fitness;
}

// ─────────────────────────────────────────────────────────────
// Bucle principal
// ─────────────────────────────────────────────────────────────
SearchOutcome GeneticAlgorithm::optimize(int startCity, int popSize, int nGen, mt19937& rng) const {
    TourEvaluator evaluator(parserData, startCity);
    SearchOutcome outcome;

    vector<Individual> population = initialPopulation(evaluator, popSize, rng, outcome.evaluations);
    stable_sort(population.begin(), population.end(), byFitness);
    // Distancias demasiado grandes: la suma desborda a infinito
    if (!std::isfinite(population.front().fitness)) {
        throw overflow_error("la longitud de los tours no es finita");
    }
    outcome.best = population.front();

    for (int gen = 1; gen <= nGen; ++gen) {
        set<vector<int>> seen;
        for (const auto& ind : population) seen.insert(ind.order);

        vector<Individual> offspring;
        offspring.reserve(popSize);
        int rejected = 0;
        int maxRejected = params.duplicateRetries * popSize;

        while (static_cast<int>(offspring.size()) < popSize) {
            const Individual& p1 = population[tournamentSelect(population, rng)];
            const Individual& p2 = population[tournamentSelect(population, rng)];

            vector<int> c1 = p1.order;
            vector<int> c2 = p2.order;
            if (randreal(rng) < params.pCrossover) {
                auto children = orderCrossover(p1.order, p2.order, rng);
                c1 = children.first;
                c2 = children.second;
            }

            for (vector<int>* child : {&c1, &c2}) {
                if (static_cast<int>(offspring.size()) >= popSize) break;
                if (randreal(rng) < params.pMutation) inversionMutation(*child, rng);

                if (params.eliminateDuplicates && seen.count(*child) && rejected < maxRejected) {
                    ++rejected;
                    continue;
                }
                seen.insert(*child);

                Individual ind;
                ind.order = *child;
                ind.fitness = evaluator.evaluate(ind.order);
                ++outcome.evaluations;
                offspring.push_back(ind);
            }
        }

        // Supervivencia (mu + lambda)
        population.insert(population.end(), offspring.begin(), offspring.end());
        stable_sort(population.begin(), population.end(), byFitness);
        population.resize(popSize);

        if (population.front().fitness < outcome.best.fitness) {
            outcome.best = population.front();
        }
        outcome.generations = gen;

        if (verbose && (gen % 100 == 0 || gen == nGen)) {
            cout << "[GA] Generacion " << gen << " | Mejor: " << outcome.best.fitness << endl;
        }
    }

    return outcome;
}
