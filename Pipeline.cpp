#include "Pipeline.h"
#include "Errors.h"
#include "GreedyBuilder.h"
#include "SvgPlotter.h"
#include <iostream>
#include <iomanip>

using namespace std;

static void step(const string& title) {
    cout << "\n" << string(80, '=') << endl;
    cout << title << endl;
    cout << string(80, '=') << endl;
}

ReferenceData computeReferences(const Parser& parser, const ExperimentConfig& config,
                                const ExperimentReport& report) {
    ReferenceData references;
    GreedyBuilder builder(&parser);
    for (int startCity : config.startCities) {
        if (startCity < 0 || startCity >= parser.getDimension()) continue;
        references.baselines.push_back(builder.buildTour(startCity));
    }

    cout << fixed << setprecision(2);
    if (config.computeLowerBound) {
        try {
            ClpSolver clp(&parser);
            references.lowerBound = clp.solveRelaxation(100, config.verbose);
            references.hasLowerBound = true;
            cout << ">> Cota inferior LP (CLP): " << references.lowerBound.value
                 << " (" << references.lowerBound.cutsAdded << " cortes de subtour)" << endl;
            if (!references.lowerBound.connected) {
                cout << ">> [AVISO] Limite de rondas alcanzado: el soporte LP sigue desconexo." << endl;
            }
        } catch (const TspError& e) {
            cerr << ">> [AVISO] No se calculo la cota inferior: " << e.what() << endl;
        }
    }

    if (config.computeExact) {
        try {
            int best = report.bestIndex();
            int startCity = best >= 0 ? report.results[best].getStartCity()
                                      : (config.startCities.empty() ? 0 : config.startCities.front());
            vector<int> warm;
            if (best >= 0) warm = report.results[best].getTour().getOrder();

            CbcSolver cbc(&parser);
            references.exact = cbc.solve(startCity, config.exactTimeLimit, warm, config.verbose);
            references.hasExact = true;
            cout << ">> " << (references.exact.provenOptimal ? "Optimo exacto (CBC): "
                                                             : "Mejor tour CBC (limite de tiempo): ")
                 << references.exact.tour.getTotalCost() << endl;
        } catch (const TspError& e) {
            cerr << ">> [AVISO] CBC no termino: " << e.what() << endl;
        }
    }
    return references;
}

ExperimentReport runExperimentPipeline(const Parser& parser, const ExperimentConfig& config) {
    step("PASO 1: Optimizacion TSP");
    ExperimentRunner runner(&parser, config);
    ExperimentReport report = runner.run();

    step("PASO 2: Resumen de resultados");
    printResultsTable(report);

    step("PASO 3: Soluciones de referencia");
    ReferenceData references = computeReferences(parser, config, report);

    step("PASO 4: Reporte e imagenes");
    if (!ensureDirectory(config.outputDir)) {
        cerr << ">> [AVISO] Sin directorio de salida: no se guardan imagenes ni reporte." << endl;
        return report;
    }
    if (config.writePlots) {
        SvgPlotter plotter(&parser);
        plotter.writeAll(report, config, config.outputDir);
    }
    if (!writeTextReport(config.outputDir + "/results_report.txt", config, report, references)) {
        cerr << ">> [AVISO] El experimento termino sin reporte de texto." << endl;
    }

    return report;
}
