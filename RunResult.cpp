#include "RunResult.h"
#include <iostream>
#include <iomanip>

using namespace std;

RunResult::RunResult(int startCity, const string& algorithm, const string& label,
                     const Tour& tour, double elapsedSeconds, int generations,
                     long evaluations, unsigned int seed)
    : startCity(startCity), algorithm(algorithm), label(label), tour(tour),
      elapsedSeconds(elapsedSeconds), generations(generations),
      evaluations(evaluations), seed(seed) {}

bool RunResult::isValid() const {
    return tour.isValid() && tour.getStartCity() == startCity && getDistance() >= 0.0;
}

// Getters
int RunResult::getStartCity() const { return startCity; }
const string& RunResult::getAlgorithm() const { return algorithm; }
const string& RunResult::getLabel() const { return label; }
const Tour& RunResult::getTour() const { return tour; }
double RunResult::getDistance() const { return tour.getTotalCost(); }
double RunResult::getElapsedSeconds() const { return elapsedSeconds; }
int RunResult::getGenerations() const { return generations; }
long RunResult::getEvaluations() const { return evaluations; }
unsigned int RunResult::getSeed() const { return seed; }

void RunResult::print() const {
    cout << fixed << setprecision(2);
    cout << "=== " << label << " | Ciudad inicial " << startCity + 1 << " ===" << endl;
    cout << "Mejor distancia: " << getDistance() << endl;
    cout << "Tiempo de ejecucion: " << elapsedSeconds << " segundos" << endl;
    cout << "Generaciones: " << generations << " | Evaluaciones: " << evaluations
         << " | Semilla: " << seed << endl;
    cout << "Tour (ids): " << tour.toIdString() << endl;
}

RunResult::~RunResult() {}
