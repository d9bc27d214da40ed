#include "Report.h"
#include <iostream>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <cerrno>
#include <sys/stat.h>
#include <sys/types.h>

using namespace std;

double gapPercent(double value, double reference) {
    if (reference <= 0.0) return 0.0;
    return 100.0 * (value - reference) / reference;
}

bool ensureDirectory(const string& path) {
    if (path.empty()) return true;
    string partial;
    stringstream ss(path);
    string piece;
    if (path[0] == '/') partial = "/";
    while (getline(ss, piece, '/')) {
        if (piece.empty()) continue;
        partial += piece;
        if (mkdir(partial.c_str(), 0755) != 0 && errno != EEXIST) {
            cerr << "Error: no se pudo crear el directorio '" << partial << "'" << endl;
            return false;
        }
        partial += "/";
    }
    return true;
}

void printResultsTable(const ExperimentReport& report) {
    cout << "\n" << string(80, '=') << endl;
    cout << "TABLA DE RESULTADOS" << endl;
    cout << string(80, '=') << "\n" << endl;

    cout << left << setw(14) << "Ciudad ini." << setw(8) << "Algor."
         << setw(12) << "Distancia" << setw(12) << "Tiempo (s)" << "Mejor tour" << endl;
    cout << string(80, '-') << endl;

    cout << fixed << setprecision(2);
    for (const auto& r : report.results) {
        cout << left << setw(14) << r.getStartCity() + 1 << setw(8) << r.getAlgorithm()
             << setw(12) << r.getDistance() << setw(12) << r.getElapsedSeconds()
             << r.getTour().toIdString(6) << endl;
    }
    for (const auto& f : report.failures) {
        cout << left << setw(14) << f.startCity + 1 << setw(8) << f.algorithm
             << "FALLO (" << f.kind << ")" << endl;
    }
    cout << right << string(80, '=') << endl;

    int best = report.bestIndex();
    if (best >= 0) {
        const RunResult& r = report.results[best];
        cout << "\n>> MEJOR RESULTADO:" << endl;
        cout << "   Algoritmo: " << r.getAlgorithm() << endl;
        cout << "   Ciudad inicial: " << r.getStartCity() + 1 << endl;
        cout << "   Distancia: " << r.getDistance() << endl;
        cout << "   Tiempo de ejecucion: " << r.getElapsedSeconds() << "s" << endl;
        cout << "   Tour completo: " << r.getTour().toIdString() << endl;
        cout << "\n" << string(80, '=') << "\n" << endl;
    }
}

bool writeTextReport(const string& path, const ExperimentConfig& config,
                     const ExperimentReport& report, const ReferenceData& references) {
    ofstream f(path);
    if (!f.is_open()) {
        cerr << "Error: no se pudo escribir el reporte '" << path << "'" << endl;
        return false;
    }
    f << fixed << setprecision(2);

    f << string(80, '=') << "\n";
    f << "TRAVELING SALESMAN PROBLEM - RESULTS REPORT\n";
    f << string(80, '=') << "\n\n";

    f << "CONFIGURATION:\n";
    f << "  Population Size: " << config.popSize << "\n";
    f << "  Number of Generations: " << config.nGen << "\n";
    f << "  Starting Cities: [";
    for (size_t i = 0; i < config.startCities.size(); ++i) {
        f << (i ? ", " : "") << config.startCities[i] + 1;
    }
    f << "]\n";
    f << "  Algorithms:\n";
    for (const auto& a : config.algorithms) {
        f << "    " << a.key << " (" << a.label << "), variant " << variantName(a.variant)
          << ", seed " << a.seed;
        if (a.variant == AlgorithmVariant::Genetic) {
            f << ", pCrossover " << a.ga.pCrossover << ", pMutation " << a.ga.pMutation
              << ", tournament " << a.ga.tournamentK;
        } else {
            f << ", F " << a.de.F << ", CR " << a.de.CR << (a.de.dither ? ", dither" : "");
        }
        f << "\n";
    }
    f << "\n";

    f << string(80, '=') << "\n";
    f << "DETAILED RESULTS\n";
    f << string(80, '=') << "\n\n";

    for (int startCity : config.startCities) {
        f << "\n" << string(60, '=') << "\n";
        f << "Starting City: " << startCity + 1 << "\n";
        f << string(60, '=') << "\n\n";

        for (const auto& a : config.algorithms) {
            const RunResult* r = report.find(startCity, a.key);
            if (!r) continue;
            f << r->getLabel() << ":\n";
            f << "  Total Distance: " << r->getDistance() << " units\n";
            f << "  Execution Time: " << r->getElapsedSeconds() << " seconds\n";
            f << "  Number of Generations: " << r->getGenerations() << "\n";
            f << "  Evaluations: " << r->getEvaluations() << "\n";
            f << "  Seed: " << r->getSeed() << "\n";
            f << "  Tour (City IDs): " << r->getTour().toIdString() << "\n\n";
        }
    }

    if (!report.failures.empty()) {
        f << "\n" << string(80, '=') << "\n";
        f << "FAILED RUNS\n";
        f << string(80, '=') << "\n\n";
        for (const auto& fail : report.failures) {
            f << "Starting City " << fail.startCity + 1 << ", " << fail.algorithm
              << ": " << fail.kind << " - " << fail.message << "\n";
        }
    }

    int best = report.bestIndex();

    if (!references.baselines.empty() || references.hasLowerBound || references.hasExact) {
        f << "\n" << string(80, '=') << "\n";
        f << "REFERENCE SOLUTIONS\n";
        f << string(80, '=') << "\n\n";
        for (const auto& tour : references.baselines) {
            f << "Nearest Neighbour from City " << tour.getStartCity() + 1 << ": "
              << tour.getTotalCost() << " units\n";
        }
        if (references.hasLowerBound) {
            f << "LP Lower Bound (CLP, " << references.lowerBound.cutsAdded << " subtour cuts): "
              << references.lowerBound.value << " units\n";
            if (best >= 0) {
                f << "  Gap of best solution: "
                  << gapPercent(report.results[best].getDistance(), references.lowerBound.value)
                  << "%\n";
            }
        }
        if (references.hasExact) {
            f << (references.exact.provenOptimal ? "Exact Optimum (CBC): " : "Best CBC Tour (time limit): ")
              << references.exact.tour.getTotalCost() << " units, "
              << references.exact.elapsedSeconds << " seconds\n";
            f << "  Tour: " << references.exact.tour.toIdString() << "\n";
            if (best >= 0) {
                f << "  Gap of best solution: "
                  << gapPercent(report.results[best].getDistance(), references.exact.tour.getTotalCost())
                  << "%\n";
            }
        }
    }

    if (best >= 0) {
        const RunResult& r = report.results[best];
        f << "\n" << string(80, '=') << "\n";
        f << "BEST OVERALL SOLUTION\n";
        f << string(80, '=') << "\n\n";
        f << "Algorithm: " << r.getAlgorithm() << "\n";
        f << "Starting City: " << r.getStartCity() + 1 << "\n";
        f << "Total Distance: " << r.getDistance() << " units\n";
        f << "Execution Time: " << r.getElapsedSeconds() << " seconds\n";
        f << "Complete Tour: " << r.getTour().toIdString() << "\n";
    }

    cout << ">> Reporte de texto guardado en '" << path << "'" << endl;
    return true;
}
