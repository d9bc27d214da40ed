// test_clp.cpp
// Prueba de la relajación LP (CLP) y del separador de subtours.
// La cota debe ser válida: nunca mayor que el óptimo por enumeración.

#include <iostream>
#include <string>
#include <vector>
#include <algorithm>
#include <cassert>
#include "Parser.h"
#include "TourEvaluator.h"
#include "GreedyBuilder.h"
#include "ClpSolver.h"
#include "SubtourCut.h"
#include "Errors.h"

using namespace std;

double bruteForce(const Parser& parser) {
    TourEvaluator evaluator(&parser, 0);
    vector<int> order = evaluator.citiesToVisit();
    double best = evaluator.evaluate(order);
    while (next_permutation(order.begin(), order.end())) {
        best = min(best, evaluator.evaluate(order));
    }
    return best;
}

// ─────────────────────────────────────────────────────────────
// Test 1: cota LP <= óptimo <= vecino más cercano
// ─────────────────────────────────────────────────────────────
void testLowerBound(const Parser& parser, const string& name) {
    cout << "\n========================================" << endl;
    cout << "TEST: cota CLP en " << name << endl;
    cout << "========================================" << endl;

    double optimum = bruteForce(parser);
    GreedyBuilder builder(&parser);
    Tour greedy = builder.buildTour(0);
    assert(greedy.isValid() && "ERROR: vecino mas cercano produjo un tour invalido.");

    ClpSolver clp(&parser);
    LowerBound lb = clp.solveRelaxation();

    cout << "Cota LP        : " << lb.value << " (" << lb.rounds << " rondas, "
         << lb.cutsAdded << " cortes)" << endl;
    cout << "Optimo exacto  : " << optimum << endl;
    cout << "Vecino cercano : " << greedy.getTotalCost() << endl;

    assert(lb.value > 0.0);
    assert(lb.value <= optimum + 1e-6 && "ERROR: la cota LP supera al optimo.");
    assert(optimum <= greedy.getTotalCost() + 1e-9);
    assert(lb.rounds >= 1);
    assert(lb.connected && "ERROR: el soporte final deberia quedar conexo.");
    cout << "PASS: cota valida." << endl;
}

// ─────────────────────────────────────────────────────────────
// Test 2: detección de subtours en una solución con dos ciclos
// ─────────────────────────────────────────────────────────────
void testFindSubtours() {
    cout << "\nTEST: deteccion de subtours" << endl;
    const int n = 6;
    SubtourCutGenerator generator(n);

    // 0 -> 1 -> 2 -> 0  y  3 -> 4 -> 5 -> 3
    vector<double> sol(n * n, 0.0);
    sol[0 * n + 1] = sol[1 * n + 2] = sol[2 * n + 0] = 1.0;
    sol[3 * n + 4] = sol[4 * n + 5] = sol[5 * n + 3] = 1.0;

    vector<vector<int>> subtours = generator.findSubtours(sol.data(), 0.5);
    assert(subtours.size() == 2 && "ERROR: se esperaban dos componentes.");
    for (auto& S : subtours) sort(S.begin(), S.end());
    assert((subtours[0] == vector<int>{0, 1, 2}));
    assert((subtours[1] == vector<int>{3, 4, 5}));

    // Se une el ciclo: 2 -> 3 y 5 -> 0 en lugar de 2 -> 0 y 5 -> 3
    sol[2 * n + 0] = sol[5 * n + 3] = 0.0;
    sol[2 * n + 3] = sol[5 * n + 0] = 1.0;
    assert(generator.findSubtours(sol.data(), 0.5).empty() &&
           "ERROR: un tour completo no tiene subtours.");
    cout << "PASS: subtours detectados correctamente." << endl;
}

void testToy(const string& dir) {
    cout << "\nTEST: cota en toy4" << endl;
    Parser parser(dir + "/toy4_cities.txt", dir + "/toy4_distances.txt");
    ClpSolver clp(&parser);
    bool thrown = false;
    try {
        LowerBound lb = clp.solveRelaxation();
        assert(lb.value <= 18.0 + 1e-6);
        assert(lb.connected);
    } catch (const TspError& e) {
        thrown = true;
        cout << "  error inesperado: " << e.what() << endl;
    }
    assert(!thrown);
    cout << "PASS: toy4 resuelto (cota <= 18)." << endl;
}

int main(int argc, char* argv[]) {
    string dir = (argc > 1) ? argv[1] : "tests/data";

    Parser small6(dir + "/small6_cities.txt", dir + "/small6_distances.txt");
    Parser small8(dir + "/small8_cities.txt", dir + "/small8_distances.txt");

    testLowerBound(small6, "small6");
    testLowerBound(small8, "small8");
    testFindSubtours();
    testToy(dir);

    cout << "\nTODOS LOS TESTS PASARON" << endl;
    return 0;
}
