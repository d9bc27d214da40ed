// test_GA.cpp
// Prueba del algoritmo genético: operadores, determinismo por semilla,
// óptimo en una instancia chica y validación de parámetros.

#include <iostream>
#include <string>
#include <vector>
#include <random>
#include <algorithm>
#include <cassert>
#include <cmath>
#include "Parser.h"
#include "Parameters.h"
#include "GeneticAlgorithm.h"
#include "SearchDriver.h"
#include "TourEvaluator.h"
#include "Errors.h"

using namespace std;

// Óptimo por enumeración completa desde startCity
double bruteForce(const Parser& parser, int startCity) {
    TourEvaluator evaluator(&parser, startCity);
    vector<int> order = evaluator.citiesToVisit();
    double best = evaluator.evaluate(order);
    while (next_permutation(order.begin(), order.end())) {
        best = min(best, evaluator.evaluate(order));
    }
    return best;
}

bool isPermutationOf(vector<int> a, vector<int> b) {
    sort(a.begin(), a.end());
    sort(b.begin(), b.end());
    return a == b;
}

// ─────────────────────────────────────────────────────────────
// Test 1: OX e inversión conservan la permutación
// ─────────────────────────────────────────────────────────────
void testOperators(const Parser& parser) {
    cout << "\nTEST 1: operadores OX e inversion" << endl;
    GeneticAlgorithm ga(&parser, standardGA().ga);
    mt19937 rng(2024);

    vector<int> a = {1, 2, 3, 4, 5, 6, 7};
    vector<int> b = {7, 5, 3, 1, 2, 4, 6};

    for (int rep = 0; rep < 200; ++rep) {
        auto children = ga.orderCrossover(a, b, rng);
        assert(isPermutationOf(children.first, a) && "ERROR: OX genero un hijo invalido.");
        assert(isPermutationOf(children.second, a) && "ERROR: OX genero un hijo invalido.");

        vector<int> mutated = a;
        ga.inversionMutation(mutated, rng);
        assert(isPermutationOf(mutated, a) && "ERROR: la inversion perdio o repitio genes.");
    }

    // Padres iguales -> hijos iguales a los padres
    auto same = ga.orderCrossover(a, a, rng);
    assert(same.first == a && same.second == a);

    cout << "PASS: OX e inversion producen permutaciones validas." << endl;
}

// ─────────────────────────────────────────────────────────────
// Test 2: misma semilla, mismo resultado
// ─────────────────────────────────────────────────────────────
void testDeterminism(const Parser& parser) {
    cout << "\nTEST 2: determinismo con semilla fija" << endl;
    SearchDriver driver(&parser);

    for (const AlgorithmConfig& config : {standardGA(), modifiedGA()}) {
        RunResult r1 = driver.run(config, 2, 30, 40);
        RunResult r2 = driver.run(config, 2, 30, 40);
        assert(r1.getTour().getPath() == r2.getTour().getPath() &&
               "ERROR: dos corridas con la misma semilla dieron tours distintos.");
        assert(r1.getDistance() == r2.getDistance());
        assert(r1.getGenerations() == 40);
        assert(r1.getEvaluations() == r2.getEvaluations());
        cout << "  " << config.key << ": " << r1.getDistance() << endl;
    }
    cout << "PASS: resultados identicos con la misma semilla." << endl;
}

// ─────────────────────────────────────────────────────────────
// Test 3: toy4, GA y GA2 encuentran el óptimo enumerado
// ─────────────────────────────────────────────────────────────
void testToyOptimum(const Parser& parser) {
    cout << "\nTEST 3: optimo en toy4" << endl;
    SearchDriver driver(&parser);

    for (int start = 0; start < parser.getDimension(); ++start) {
        double optimum = bruteForce(parser, start);
        for (const AlgorithmConfig& config : {standardGA(), modifiedGA()}) {
            RunResult r = driver.run(config, start, 20, 30);
            assert(r.isValid() && "ERROR: tour invalido.");
            assert(r.getTour().getStartCity() == start);
            assert(fabs(r.getDistance() - optimum) < 1e-9 &&
                   "ERROR: el GA no encontro el optimo de toy4.");
        }
    }
    cout << "PASS: GA y GA2 encuentran el optimo (18) desde todas las ciudades." << endl;
}

// ─────────────────────────────────────────────────────────────
// Test 4: configuraciones inválidas
// ─────────────────────────────────────────────────────────────
bool rejected(const SearchDriver& driver, const AlgorithmConfig& config,
              int start, int pop, int gens) {
    try {
        driver.run(config, start, pop, gens);
    } catch (const InvalidConfiguration& e) {
        cout << "  rechazado: " << e.what() << endl;
        return true;
    }
    return false;
}

void testInvalidConfiguration(const Parser& parser) {
    cout << "\nTEST 4: configuraciones invalidas" << endl;
    SearchDriver driver(&parser);
    AlgorithmConfig config = standardGA();

    assert(rejected(driver, config, 0, 0, 10) && "ERROR: se acepto popSize = 0.");
    assert(rejected(driver, config, 0, -5, 10));
    assert(rejected(driver, config, 0, 10, 0) && "ERROR: se acepto nGen = 0.");
    assert(rejected(driver, config, 4, 10, 10) && "ERROR: se acepto una ciudad fuera de rango.");
    assert(rejected(driver, config, -1, 10, 10));

    AlgorithmConfig badProb = standardGA();
    badProb.ga.pMutation = 1.5;
    assert(rejected(driver, badProb, 0, 10, 10) && "ERROR: se acepto pMutation > 1.");

    cout << "PASS: configuraciones invalidas rechazadas." << endl;
}

int main(int argc, char* argv[]) {
    string dir = (argc > 1) ? argv[1] : "tests/data";

    cout << "========================================" << endl;
    cout << "  TEST GA" << endl;
    cout << "========================================" << endl;

    Parser toy(dir + "/toy4_cities.txt", dir + "/toy4_distances.txt");
    Parser small(dir + "/small8_cities.txt", dir + "/small8_distances.txt");

    testOperators(small);
    testDeterminism(small);
    testToyOptimum(toy);
    testInvalidConfiguration(toy);

    cout << "\nTODOS LOS TESTS PASARON" << endl;
    return 0;
}
