// test_cbc.cpp
// Prueba de CbcSolver: en instancias chicas el óptimo de CBC debe coincidir
// con la enumeración completa y nunca empeorar su warm start.

#include <iostream>
#include <string>
#include <vector>
#include <algorithm>
#include <cassert>
#include <cmath>
#include "Parser.h"
#include "TourEvaluator.h"
#include "GreedyBuilder.h"
#include "CbcSolver.h"
#include "Errors.h"

using namespace std;

const double TIME_LIMIT_SECONDS = 60.0;

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
// Test 1: CBC == enumeración
// ─────────────────────────────────────────────────────────────
void testOptimum(const Parser& parser, const string& name, int startCity) {
    cout << "\n========================================" << endl;
    cout << "TEST: optimo CBC en " << name << " desde " << startCity + 1 << endl;
    cout << "========================================" << endl;

    double optimum = bruteForce(parser, startCity);
    CbcSolver cbc(&parser);
    ExactResult exact = cbc.solve(startCity, TIME_LIMIT_SECONDS);

    cout << "Optimo enumerado : " << optimum << endl;
    cout << "Optimo CBC       : " << exact.tour.getTotalCost()
         << (exact.provenOptimal ? " (probado)" : " (limite de tiempo)") << endl;
    cout << "Tour             : " << exact.tour.toIdString() << endl;

    assert(exact.tour.isValid() && "ERROR: CBC produjo un tour invalido.");
    assert(exact.tour.getStartCity() == startCity);
    assert(exact.provenOptimal && "ERROR: CBC no probo optimalidad en una instancia chica.");
    assert(fabs(exact.tour.getTotalCost() - optimum) < 1e-6 &&
           "ERROR: el optimo de CBC no coincide con la enumeracion.");
    cout << "PASS: CBC coincide con la enumeracion." << endl;
}

// ─────────────────────────────────────────────────────────────
// Test 2: CBC no empeora un warm start malo
// ─────────────────────────────────────────────────────────────
void testWarmStart(const Parser& parser) {
    cout << "\nTEST: warm start explicito" << endl;
    // Orden por índice: en general lejos del óptimo
    vector<int> order = {1, 2, 3, 4, 5, 6, 7};
    TourEvaluator evaluator(&parser, 0);
    double warmCost = evaluator.evaluate(order);

    CbcSolver cbc(&parser);
    ExactResult exact = cbc.solve(0, TIME_LIMIT_SECONDS, order);
    assert(exact.tour.isValid());
    assert(exact.tour.getTotalCost() <= warmCost + 1e-6 &&
           "ERROR: CBC devolvio un costo peor que su warm start.");
    cout << "PASS: " << exact.tour.getTotalCost() << " <= " << warmCost << endl;
}

void testInvalidStart(const Parser& parser) {
    cout << "\nTEST: ciudad inicial fuera de rango" << endl;
    CbcSolver cbc(&parser);
    bool thrown = false;
    try {
        cbc.solve(parser.getDimension(), TIME_LIMIT_SECONDS);
    } catch (const InvalidConfiguration&) {
        thrown = true;
    }
    assert(thrown && "ERROR: se acepto una ciudad inicial fuera de rango.");
    cout << "PASS: rechazada." << endl;
}

int main(int argc, char* argv[]) {
    string dir = (argc > 1) ? argv[1] : "tests/data";

    Parser small6(dir + "/small6_cities.txt", dir + "/small6_distances.txt");
    Parser small8(dir + "/small8_cities.txt", dir + "/small8_distances.txt");

    testOptimum(small6, "small6", 0);
    testOptimum(small8, "small8", 3);
    testWarmStart(small8);
    testInvalidStart(small6);

    cout << "\nTODOS LOS TESTS PASARON" << endl;
    return 0;
}
