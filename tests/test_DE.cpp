// test_DE.cpp
// Prueba de Differential Evolution sobre claves aleatorias: decodificación,
// determinismo y óptimo en una instancia chica.

#include <iostream>
#include <string>
#include <vector>
#include <algorithm>
#include <cassert>
#include <cmath>
#include "Parser.h"
#include "Parameters.h"
#include "DifferentialEvolution.h"
#include "SearchDriver.h"
#include "TourEvaluator.h"
#include "Errors.h"

using namespace std;

double bruteForce(const Parser& parser, int startCity) {
    TourEvaluator evaluator(&parser, startCity);
    vector<int> order = evaluator.citiesToVisit();
    double best = evaluator.evaluate(order);
    while (next_permutation(order.begin(), order.end())) {
        best = min(best, evaluator.evaluate(order));
    }
    return best;
}

// ─────────────────────────────────────────────────────────────
// Test 1: decodificación por ordenamiento estable
// ─────────────────────────────────────────────────────────────
void testDecode() {
    cout << "\nTEST 1: decodificacion de claves" << endl;
    vector<int> cities = {10, 20, 30, 40};

    vector<double> keys = {0.7, 0.1, 0.9, 0.3};
    vector<int> expected = {20, 40, 10, 30};
    assert(DifferentialEvolution::decode(keys, cities) == expected);

    // Transformación monótona creciente: mismo orden
    vector<double> scaled;
    for (double k : keys) scaled.push_back(3.0 * k + 5.0);
    assert(DifferentialEvolution::decode(scaled, cities) == expected &&
           "ERROR: la decodificacion cambio con un reescalado monotono.");

    vector<double> cubed;
    for (double k : keys) cubed.push_back(k * k * k);
    assert(DifferentialEvolution::decode(cubed, cities) == expected);

    // Empates: se conserva el orden de índice
    vector<double> ties = {0.5, 0.2, 0.5, 0.2};
    vector<int> tieOrder = {20, 40, 10, 30};
    assert(DifferentialEvolution::decode(ties, cities) == tieOrder &&
           "ERROR: los empates no conservaron el orden de indice.");

    vector<double> allEqual(4, 0.0);
    assert(DifferentialEvolution::decode(allEqual, cities) == cities);

    cout << "PASS: decodificacion estable." << endl;
}

// ─────────────────────────────────────────────────────────────
// Test 2: misma semilla, mismo resultado
// ─────────────────────────────────────────────────────────────
void testDeterminism(const Parser& parser) {
    cout << "\nTEST 2: determinismo con semilla fija" << endl;
    SearchDriver driver(&parser);
    AlgorithmConfig config = differentialEvolution();

    RunResult r1 = driver.run(config, 5, 25, 40);
    RunResult r2 = driver.run(config, 5, 25, 40);
    assert(r1.getTour().getPath() == r2.getTour().getPath() &&
           "ERROR: dos corridas con la misma semilla dieron tours distintos.");
    assert(r1.getDistance() == r2.getDistance());
    assert(r1.isValid());

    // Otra semilla sigue siendo válida
    config.seed = 99;
    RunResult r3 = driver.run(config, 5, 25, 40);
    assert(r3.isValid());

    cout << "PASS: DE determinista (" << r1.getDistance() << ")." << endl;
}

// ─────────────────────────────────────────────────────────────
// Test 3: toy4, DE encuentra el óptimo; también con dither
// ─────────────────────────────────────────────────────────────
void testToyOptimum(const Parser& parser) {
    cout << "\nTEST 3: optimo en toy4" << endl;
    SearchDriver driver(&parser);

    AlgorithmConfig dithered = differentialEvolution();
    dithered.key = "DE-dither";
    dithered.de.dither = true;

    for (int start = 0; start < parser.getDimension(); ++start) {
        double optimum = bruteForce(parser, start);
        for (const AlgorithmConfig& config : {differentialEvolution(), dithered}) {
            RunResult r = driver.run(config, start, 20, 30);
            assert(r.isValid());
            assert(fabs(r.getDistance() - optimum) < 1e-9 &&
                   "ERROR: DE no encontro el optimo de toy4.");
        }
    }
    cout << "PASS: DE encuentra el optimo desde todas las ciudades." << endl;
}

// ─────────────────────────────────────────────────────────────
// Test 4: parámetros DE inválidos
// ─────────────────────────────────────────────────────────────
void testInvalidParameters(const Parser& parser) {
    cout << "\nTEST 4: parametros invalidos" << endl;
    SearchDriver driver(&parser);

    AlgorithmConfig badCR = differentialEvolution();
    badCR.de.CR = 1.2;
    bool thrown = false;
    try {
        driver.validate(badCR, 0, 10, 10);
    } catch (const InvalidConfiguration& e) {
        thrown = true;
        cout << "  rechazado: " << e.what() << endl;
    }
    assert(thrown && "ERROR: se acepto CR > 1.");

    AlgorithmConfig badF = differentialEvolution();
    badF.de.F = 0.0;
    thrown = false;
    try {
        driver.validate(badF, 0, 10, 10);
    } catch (const InvalidConfiguration&) {
        thrown = true;
    }
    assert(thrown && "ERROR: se acepto F = 0.");

    cout << "PASS: parametros DE invalidos rechazados." << endl;
}

int main(int argc, char* argv[]) {
    string dir = (argc > 1) ? argv[1] : "tests/data";

    cout << "========================================" << endl;
    cout << "  TEST DE" << endl;
    cout << "========================================" << endl;

    Parser toy(dir + "/toy4_cities.txt", dir + "/toy4_distances.txt");
    Parser small(dir + "/small8_cities.txt", dir + "/small8_distances.txt");

    testDecode();
    testDeterminism(small);
    testToyOptimum(toy);
    testInvalidParameters(toy);

    cout << "\nTODOS LOS TESTS PASARON" << endl;
    return 0;
}
