// test_TourEvaluator.cpp
// Verifica la función objetivo contra sumas calculadas a mano y su
// invariancia frente a invertir o rotar el ciclo.

#include <iostream>
#include <string>
#include <vector>
#include <cassert>
#include <cmath>
#include <algorithm>
#include "Parser.h"
#include "Tour.h"
#include "TourEvaluator.h"

using namespace std;

bool near(double a, double b) { return fabs(a - b) < 1e-9; }

// Largo del ciclo cerrado recorrido en el orden dado (todas las ciudades)
double cycleLength(const Parser& parser, const vector<int>& cycle) {
    double total = 0.0;
    for (size_t i = 0; i < cycle.size(); ++i) {
        total += parser.getDistance(cycle[i], cycle[(i + 1) % cycle.size()]);
    }
    return total;
}

// ─────────────────────────────────────────────────────────────
// Test 1: sumas a mano sobre toy4
// ─────────────────────────────────────────────────────────────
void testHandComputed(const Parser& parser) {
    cout << "\nTEST 1: sumas calculadas a mano" << endl;
    TourEvaluator evaluator(&parser, 0);

    // 1 -> 2 -> 3 -> 4 -> 1 : 2 + 6 + 3 + 10
    assert(near(evaluator.evaluate({1, 2, 3}), 21.0) && "ERROR: 1-2-3-4-1 debe medir 21.");
    // 1 -> 2 -> 4 -> 3 -> 1 : 2 + 4 + 3 + 9
    assert(near(evaluator.evaluate({1, 3, 2}), 18.0) && "ERROR: 1-2-4-3-1 debe medir 18.");
    // 1 -> 3 -> 2 -> 4 -> 1 : 9 + 6 + 4 + 10
    assert(near(evaluator.evaluate({2, 1, 3}), 29.0));

    // Orden vacío
    assert(near(evaluator.evaluate({}), 0.0));

    // Tour construye el mismo costo que el evaluador
    Tour tour(0, {1, 3, 2}, &parser);
    assert(tour.isValid());
    assert(near(tour.getTotalCost(), 18.0));
    assert(tour.toIdString() == "1 -> 2 -> 4 -> 3 -> 1");

    cout << "PASS: el evaluador coincide con las sumas a mano." << endl;
}

// ─────────────────────────────────────────────────────────────
// Test 2: invariancia (inversión y rotación) sobre small8
// ─────────────────────────────────────────────────────────────
void testInvariance(const Parser& parser) {
    cout << "\nTEST 2: invariancia frente a inversion y rotacion" << endl;
    int n = parser.getDimension();

    vector<int> cycle = {0, 3, 5, 1, 7, 2, 6, 4};
    assert(static_cast<int>(cycle.size()) == n);
    double reference = cycleLength(parser, cycle);

    for (int shift = 0; shift < n; ++shift) {
        vector<int> rotated = cycle;
        rotate(rotated.begin(), rotated.begin() + shift, rotated.end());

        // La primera ciudad del ciclo rotado hace de ciudad inicial
        TourEvaluator evaluator(&parser, rotated.front());
        vector<int> order(rotated.begin() + 1, rotated.end());
        assert(near(evaluator.evaluate(order), reference) &&
               "ERROR: la rotacion cambio el largo del ciclo.");

        // Ciclo invertido: mismo inicio, resto al revés
        vector<int> reversed(order.rbegin(), order.rend());
        assert(near(evaluator.evaluate(reversed), reference) &&
               "ERROR: la inversion cambio el largo del ciclo (matriz simetrica).");
    }
    cout << "PASS: largo invariante (" << reference << ")." << endl;
}

// ─────────────────────────────────────────────────────────────
// Test 3: validación de Tour
// ─────────────────────────────────────────────────────────────
void testTourValidity(const Parser& parser) {
    cout << "\nTEST 3: validacion de Tour" << endl;
    assert(Tour(0, {1, 2, 3}, &parser).isValid());
    assert(!Tour(0, {1, 2}, &parser).isValid() && "ERROR: falta una ciudad.");
    assert(!Tour(0, {1, 1, 3}, &parser).isValid() && "ERROR: ciudad repetida.");
    assert(!Tour(0, {1, 0, 3}, &parser).isValid() && "ERROR: la inicial aparece en el medio.");
    assert(!Tour().isValid());

    Tour truncated(0, {1, 2, 3}, &parser);
    assert(truncated.toIdString(2) == "1 -> 2...");
    cout << "PASS: Tour::isValid detecta ordenes incompletos o repetidos." << endl;
}

int main(int argc, char* argv[]) {
    string dir = (argc > 1) ? argv[1] : "tests/data";

    Parser toy(dir + "/toy4_cities.txt", dir + "/toy4_distances.txt");
    Parser small(dir + "/small8_cities.txt", dir + "/small8_distances.txt");

    testHandComputed(toy);
    testInvariance(small);
    testTourValidity(toy);

    cout << "\nTODOS LOS TESTS PASARON" << endl;
    return 0;
}
