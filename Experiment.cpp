#include "Experiment.h"
#include "Errors.h"
#include "SearchDriver.h"
#include <iostream>

using namespace std;

int ExperimentReport::bestIndex() const {
    int best = -1;
    for (size_t i = 0; i < results.size(); ++i) {
        if (best == -1 || results[i].getDistance() < results[best].getDistance()) {
            best = static_cast<int>(i);
        }
    }
    return best;
}

const RunResult* ExperimentReport::find(int startCity, const string& algorithm) const {
    for (const auto& r : results) {
        if (r.getStartCity() == startCity && r.getAlgorithm() == algorithm) return &r;
    }
    return nullptr;
}

ExperimentRunner::ExperimentRunner(const Parser* parser, const ExperimentConfig& config)
    : parserData(parser), config(config) {}

void ExperimentRunner::printHeader(const AlgorithmConfig& algorithm, int startCity) const {
    cout << "\n" << string(60, '=') << endl;
    cout << "Resolviendo TSP con " << algorithm.label << endl;
    cout << "Ciudad inicial: " << startCity + 1 << " (ID en archivo)" << endl;
    cout << "Poblacion: " << config.popSize << ", Generaciones: " << config.nGen << endl;
    cout << string(60, '=') << endl;
}

ExperimentReport ExperimentRunner::run() const {
    ExperimentReport report;
    SearchDriver driver(parserData, config.verbose);

    for (int startCity : config.startCities) {
        for (const auto& algorithm : config.algorithms) {
            printHeader(algorithm, startCity);
            try {
                RunResult result = driver.run(algorithm, startCity, config.popSize, config.nGen);
                result.print();
                report.results.push_back(result);
            } catch (const InvalidConfiguration& e) {
                cerr << ">> [ERROR] Configuracion invalida: " << e.what() << endl;
                report.failures.push_back({startCity, algorithm.key, "InvalidConfiguration", e.what()});
            } catch (const SearchFailure& e) {
                cerr << ">> [ERROR] Fallo de busqueda: " << e.what() << endl;
                report.failures.push_back({startCity, algorithm.key, "SearchFailure", e.what()});
            }
        }
    }

    cout << "\n>> Corridas completadas: " << report.results.size()
         << " | Fallidas: " << report.failures.size() << endl;
    return report;
}
