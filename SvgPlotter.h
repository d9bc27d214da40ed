#ifndef SVG_PLOTTER_H
#define SVG_PLOTTER_H

#include <ostream>
#include <string>
#include "Parser.h"
#include "Parameters.h"
#include "Experiment.h"

// Dibuja los resultados como archivos SVG:
//   tour_<KEY>_start<ID>.svg     un tour por corrida
//   comparison_all.svg           grilla ciudades iniciales x algoritmos
//   performance_comparison.svg   barras de distancia y tiempo
class SvgPlotter {
private:
    const Parser* parserData;

    // Dibuja el tour dentro del rectángulo (x0, y0, w, h)
    void drawTour(std::ostream& out, const Tour& tour, double x0, double y0,
                  double w, double h, bool labels) const;

public:
    explicit SvgPlotter(const Parser* parser);

    bool plotTour(const Tour& tour, const std::string& title, const std::string& path) const;
    bool plotComparison(const ExperimentReport& report, const ExperimentConfig& config,
                        const std::string& path) const;
    bool plotPerformance(const ExperimentReport& report, const ExperimentConfig& config,
                         const std::string& path) const;

    // Genera todas las imágenes en outputDir; retorna cuántas se escribieron
    int writeAll(const ExperimentReport& report, const ExperimentConfig& config,
                 const std::string& outputDir) const;
};

#endif // SVG_PLOTTER_H
