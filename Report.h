#ifndef REPORT_H
#define REPORT_H

#include <string>
#include <vector>
#include "Parameters.h"
#include "Experiment.h"
#include "ClpSolver.h"
#include "CbcSolver.h"

// Soluciones de referencia opcionales para comparar contra los evolutivos
struct ReferenceData {
    std::vector<Tour> baselines;  // Vecino más cercano, uno por ciudad inicial
    bool hasLowerBound = false;
    LowerBound lowerBound;
    bool hasExact = false;
    ExactResult exact;
};

// Tabla de resultados por consola + mejor corrida global
void printResultsTable(const ExperimentReport& report);

// Reporte de texto completo. Retorna false si no se pudo escribir.
bool writeTextReport(const std::string& path, const ExperimentConfig& config,
                     const ExperimentReport& report, const ReferenceData& references);

// Brecha porcentual de 'value' sobre 'reference'
double gapPercent(double value, double reference);

// Crea el directorio (y sus padres) si no existe
bool ensureDirectory(const std::string& path);

#endif // REPORT_H
