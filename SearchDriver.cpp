#include "SearchDriver.h"
#include "Errors.h"
#include "GeneticAlgorithm.h"
#include "DifferentialEvolution.h"
#include <chrono>
#include <iostream>
#include <random>

using namespace std;
using chrono::steady_clock;
using chrono::duration;

SearchDriver::SearchDriver(const Parser* parser, bool verbose)
    : parserData(parser), verbose(verbose) {}

static string context(const AlgorithmConfig& config, int startCity) {
    return "[" + config.key + " | ciudad inicial " + to_string(startCity + 1) + "] ";
}

void SearchDriver::validate(const AlgorithmConfig& config, int startCity, int popSize, int nGen) const {
    string where = context(config, startCity);
    int n = parserData->getDimension();

    if (popSize <= 0) {
        throw InvalidConfiguration(where + "popSize debe ser positivo (" + to_string(popSize) + ")");
    }
    if (nGen <= 0) {
        throw InvalidConfiguration(where + "nGen debe ser positivo (" + to_string(nGen) + ")");
    }
    if (n < 2) {
        throw InvalidConfiguration(where + "se necesitan al menos 2 ciudades");
    }
    if (startCity < 0 || startCity >= n) {
        throw InvalidConfiguration(where + "ciudad inicial fuera de rango (1.." + to_string(n) + ")");
    }

    if (config.variant == AlgorithmVariant::Genetic) {
        const GAParams& ga = config.ga;
        if (ga.pCrossover < 0.0 || ga.pCrossover > 1.0) {
            throw InvalidConfiguration(where + "pCrossover fuera de [0,1]");
        }
        if (ga.pMutation < 0.0 || ga.pMutation > 1.0) {
            throw InvalidConfiguration(where + "pMutation fuera de [0,1]");
        }
        if (ga.tournamentK < 1) {
            throw InvalidConfiguration(where + "tournamentK debe ser >= 1");
        }
        if (ga.duplicateRetries < 0) {
            throw InvalidConfiguration(where + "duplicateRetries no puede ser negativo");
        }
    } else {
        const DEParams& de = config.de;
        if (de.F <= 0.0 || de.F > 2.0) {
            throw InvalidConfiguration(where + "F fuera de (0,2]");
        }
        if (de.CR < 0.0 || de.CR > 1.0) {
            throw InvalidConfiguration(where + "CR fuera de [0,1]");
        }
    }
}

RunResult SearchDriver::run(const AlgorithmConfig& config, int startCity, int popSize, int nGen) const {
    validate(config, startCity, popSize, nGen);

    if (verbose) {
        cout << "\n>> " << config.label << " | Ciudad inicial " << startCity + 1
             << " | Poblacion " << popSize << " | Generaciones " << nGen << endl;
    }

    // Flujo propio por (semilla, ciudad inicial)
    seed_seq seq{config.seed, static_cast<unsigned int>(startCity)};
    mt19937 rng(seq);

    auto inicio = steady_clock::now();
    SearchOutcome outcome;
    try {
        if (config.variant == AlgorithmVariant::Genetic) {
            GeneticAlgorithm ga(parserData, config.ga, verbose);
            outcome = ga.optimize(startCity, popSize, nGen, rng);
        } else {
            DifferentialEvolution de(parserData, config.de, verbose);
            outcome = de.optimize(startCity, popSize, nGen, rng);
        }
    } catch (const TspError&) {
        throw;
    } catch (const exception& e) {
        throw SearchFailure(context(config, startCity) + e.what());
    }
    double elapsed = duration<double>(steady_clock::now() - inicio).count();

    Tour tour(startCity, outcome.best.order, parserData);
    if (!tour.isValid()) {
        throw SearchFailure(context(config, startCity) + "el optimizador devolvio un tour invalido");
    }

    return RunResult(startCity, config.key, config.label, tour, elapsed,
                     outcome.generations, outcome.evaluations, config.seed);
}
