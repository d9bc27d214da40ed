#ifndef PIPELINE_H
#define PIPELINE_H

#include "Parser.h"
#include "Parameters.h"
#include "Experiment.h"
#include "Report.h"

// Corrida completa como la pide la entrega:
//   1. experimento (todas las ciudades iniciales x algoritmos)
//   2. tabla de resultados
//   3. soluciones de referencia (vecino más cercano, cota CLP, óptimo CBC)
//   4. imágenes SVG y reporte de texto en config.outputDir
// Los errores de las soluciones de referencia se avisan y no cortan la corrida.
ExperimentReport runExperimentPipeline(const Parser& parser, const ExperimentConfig& config);

// Paso 3 por separado (lo usa también el menú)
ReferenceData computeReferences(const Parser& parser, const ExperimentConfig& config,
                                const ExperimentReport& report);

#endif // PIPELINE_H
