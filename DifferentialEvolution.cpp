#include "DifferentialEvolution.h"
#include "TourEvaluator.h"
#include "Random.h"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <numeric>
#include <stdexcept>

using namespace std;

DifferentialEvolution::DifferentialEvolution(const Parser* parser, const DEParams& params, bool verbose)
    : parserData(parser), params(params), verbose(verbose) {}

vector<int> DifferentialEvolution::decode(const vector<double>& keys, const vector<int>& cities) {
    vector<int> idx(keys.size());
    iota(idx.begin(), idx.end(), 0);
    stable_sort(idx.begin(), idx.end(), [&keys](int i, int j) {
        return keys[i] < keys[j];
    });

    vector<int> order;
    order.reserve(idx.size());
    for (int i : idx) order.push_back(cities[i]);
    return order;
}

void DifferentialEvolution::pickDonors(int target, int popSize, mt19937& rng,
                                       int& a, int& b, int& c) const {
    vector<int> pool;
    for (int i = 0; i < popSize; ++i) {
        if (i != target) pool.push_back(i);
    }

    // Poblaciones de menos de 4: se permiten donantes repetidos
    if (pool.size() < 3) {
        a = randint(rng, 0, popSize - 1);
        b = randint(rng, 0, popSize - 1);
        c = randint(rng, 0, popSize - 1);
        return;
    }

    // Fisher-Yates parcial sobre las tres primeras posiciones
    for (int k = 0; k < 3; ++k) {
        int r = randint(rng, k, static_cast<int>(pool.size()) - 1);
        swap(pool[k], pool[r]);
    }
    a = pool[0];
    b = pool[1];
    c = pool[2];
}

SearchOutcome DifferentialEvolution::optimize(int startCity, int popSize, int nGen, mt19937& rng) const {
    TourEvaluator evaluator(parserData, startCity);
    vector<int> cities = evaluator.citiesToVisit();
    int dim = cities.size();
    SearchOutcome outcome;

    // Población inicial uniforme en [0,1]^dim
    vector<Individual> population(popSize);
    for (auto& ind : population) {
        ind.keys.resize(dim);
        for (double& key : ind.keys) key = randreal(rng);
        ind.order = decode(ind.keys, cities);
        ind.fitness = evaluator.evaluate(ind.order);
        ++outcome.evaluations;
        if (!std::isfinite(ind.fitness)) {
            throw overflow_error("la longitud de los tours no es finita");
        }
        if (ind.fitness < outcome.best.fitness) outcome.best = ind;
    }

    for (int gen = 1; gen <= nGen; ++gen) {
        double F = params.F;
        if (params.dither) F = 0.5 + 0.5 * randreal(rng);

        for (int i = 0; i < popSize; ++i) {
            int a, b, c;
            pickDonors(i, popSize, rng, a, b, c);

            Individual trial;
            trial.keys = population[i].keys;
            int forced = dim > 0 ? randint(rng, 0, dim - 1) : 0;

            for (int j = 0; j < dim; ++j) {
                if (randreal(rng) < params.CR || j == forced) {
                    double v = population[a].keys[j] +
                               F * (population[b].keys[j] - population[c].keys[j]);
                    trial.keys[j] = min(1.0, max(0.0, v));
                }
            }

            trial.order = decode(trial.keys, cities);
            trial.fitness = evaluator.evaluate(trial.order);
            ++outcome.evaluations;

            // Selección uno a uno
            if (trial.fitness <= population[i].fitness) {
                population[i] = trial;
                if (trial.fitness < outcome.best.fitness) outcome.best = trial;
            }
        }
        outcome.generations = gen;

        if (verbose && (gen % 100 == 0 || gen == nGen)) {
            cout << "[DE] Generacion " << gen << " | Mejor: " << outcome.best.fitness << endl;
        }
    }

    return outcome;
}
