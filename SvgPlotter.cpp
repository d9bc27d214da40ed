#include "SvgPlotter.h"
#include <algorithm>
#include <fstream>
#include <iostream>
#include <iomanip>
#include <limits>
#include <sstream>

using namespace std;

static const char* PALETTE[] = {"#1f77b4", "#ff7f0e", "#2ca02c", "#d62728", "#9467bd", "#8c564b"};
static const int PALETTE_SIZE = 6;

static void openSvg(ostream& out, int W, int H) {
    out << "<svg xmlns='http://www.w3.org/2000/svg' width='" << W << "' height='" << H << "'>\n";
    out << "<defs><marker id='arrow' markerWidth='8' markerHeight='8' refX='8' refY='4' orient='auto'>"
        << "<path d='M0,0 L8,4 L0,8 z' fill='darkblue'/></marker></defs>\n";
    out << "<rect x='0' y='0' width='100%' height='100%' fill='white'/>\n";
}

static string fmt(double value, int precision = 2) {
    ostringstream s;
    s << fixed << setprecision(precision) << value;
    return s.str();
}

// Los títulos vienen de la configuración: escapar &, < y >
static string escapeXml(const string& text) {
    string out;
    for (char ch : text) {
        if (ch == '&') out += "&amp;";
        else if (ch == '<') out += "&lt;";
        else if (ch == '>') out += "&gt;";
        else out += ch;
    }
    return out;
}

SvgPlotter::SvgPlotter(const Parser* parser) : parserData(parser) {}

void SvgPlotter::drawTour(ostream& out, const Tour& tour, double x0, double y0,
                          double w, double h, bool labels) const {
    const auto& cities = parserData->getCities();
    double minx = numeric_limits<double>::max(), maxx = numeric_limits<double>::lowest();
    double miny = numeric_limits<double>::max(), maxy = numeric_limits<double>::lowest();
    for (const auto& c : cities) {
        minx = min(minx, c.getX()); maxx = max(maxx, c.getX());
        miny = min(miny, c.getY()); maxy = max(maxy, c.getY());
    }
    double margin = 20.0;
    double sx = (maxx == minx) ? 1.0 : (w - 2 * margin) / (maxx - minx);
    double sy = (maxy == miny) ? 1.0 : (h - 2 * margin) / (maxy - miny);

    // El eje y del SVG crece hacia abajo
    auto X = [&](double x) { return x0 + margin + (x - minx) * sx; };
    auto Y = [&](double y) { return y0 + h - margin - (y - miny) * sy; };

    // Todas las ciudades
    out << "<g fill='lightgray'>\n";
    for (const auto& c : cities) {
        out << "<circle cx='" << X(c.getX()) << "' cy='" << Y(c.getY()) << "' r='4'/>\n";
    }
    out << "</g>\n";

    // Aristas del tour con flecha de dirección
    const auto& path = tour.getPath();
    out << "<g stroke='blue' stroke-opacity='0.6' stroke-width='2' fill='none'>\n";
    for (size_t i = 0; i + 1 < path.size(); ++i) {
        const City& a = parserData->getCity(path[i]);
        const City& b = parserData->getCity(path[i + 1]);
        out << "<line x1='" << X(a.getX()) << "' y1='" << Y(a.getY())
            << "' x2='" << X(b.getX()) << "' y2='" << Y(b.getY()) << "'"
            << (labels ? " marker-end='url(#arrow)'" : "") << "/>\n";
    }
    out << "</g>\n";

    // Ciudades visitadas y ciudad inicial destacada
    out << "<g>\n";
    for (size_t i = 1; i + 1 < path.size(); ++i) {
        const City& c = parserData->getCity(path[i]);
        out << "<circle cx='" << X(c.getX()) << "' cy='" << Y(c.getY())
            << "' r='5' fill='blue' stroke='black' stroke-width='1'/>\n";
        if (labels) {
            out << "<text x='" << X(c.getX()) + 6 << "' y='" << Y(c.getY()) - 6
                << "' font-size='10' fill='black'>" << c.getId() << "</text>\n";
        }
    }
    if (!path.empty()) {
        const City& s = parserData->getCity(path.front());
        out << "<circle cx='" << X(s.getX()) << "' cy='" << Y(s.getY())
            << "' r='9' fill='red' stroke='black' stroke-width='2'/>\n";
        out << "<text x='" << X(s.getX()) + 10 << "' y='" << Y(s.getY()) - 10
            << "' font-size='12' font-weight='bold' fill='red'>" << s.getId() << "</text>\n";
    }
    out << "</g>\n";
}

bool SvgPlotter::plotTour(const Tour& tour, const string& title, const string& path) const {
    ofstream out(path);
    if (!out.is_open()) {
        cerr << "Error: no se pudo escribir '" << path << "'" << endl;
        return false;
    }
    int W = 1000, H = 800;
    openSvg(out, W, H);
    out << "<text x='" << W / 2 << "' y='30' font-size='18' font-weight='bold' text-anchor='middle'>"
        << escapeXml(title) << "</text>\n";
    drawTour(out, tour, 0, 50, W, H - 50, true);
    out << "</svg>\n";
    return true;
}

bool SvgPlotter::plotComparison(const ExperimentReport& report, const ExperimentConfig& config,
                                const string& path) const {
    ofstream out(path);
    if (!out.is_open()) {
        cerr << "Error: no se pudo escribir '" << path << "'" << endl;
        return false;
    }
    int rows = max<int>(1, config.startCities.size());
    int cols = max<int>(1, config.algorithms.size());
    int cellW = 400, cellH = 340, titleH = 40;
    openSvg(out, cols * cellW, rows * cellH);

    for (int r = 0; r < (int)config.startCities.size(); ++r) {
        for (int c = 0; c < (int)config.algorithms.size(); ++c) {
            double x0 = c * cellW, y0 = r * cellH;
            out << "<rect x='" << x0 + 2 << "' y='" << y0 + 2 << "' width='" << cellW - 4
                << "' height='" << cellH - 4 << "' fill='none' stroke='#cccccc'/>\n";

            const string& key = config.algorithms[c].key;
            const RunResult* result = report.find(config.startCities[r], key);
            string title = key + " - Ciudad " + to_string(config.startCities[r] + 1);
            if (result) {
                title += " | Dist: " + fmt(result->getDistance()) +
                         " | t: " + fmt(result->getElapsedSeconds()) + "s";
            } else {
                title += " | sin resultado";
            }
            out << "<text x='" << x0 + cellW / 2 << "' y='" << y0 + 24
                << "' font-size='12' font-weight='bold' text-anchor='middle'>" << escapeXml(title) << "</text>\n";
            if (result) {
                drawTour(out, result->getTour(), x0, y0 + titleH, cellW, cellH - titleH, false);
            }
        }
    }
    out << "</svg>\n";
    return true;
}

bool SvgPlotter::plotPerformance(const ExperimentReport& report, const ExperimentConfig& config,
                                 const string& path) const {
    ofstream out(path);
    if (!out.is_open()) {
        cerr << "Error: no se pudo escribir '" << path << "'" << endl;
        return false;
    }
    int panelW = 600, H = 420, top = 50, bottom = 60, left = 70;
    openSvg(out, 2 * panelW, H);

    int nCities = config.startCities.size();
    int nAlgos = config.algorithms.size();

    for (int panel = 0; panel < 2; ++panel) {
        bool distance = (panel == 0);
        double px = panel * panelW;
        double plotW = panelW - left - 20;
        double plotH = H - top - bottom;

        double maxValue = 0.0;
        for (const auto& r : report.results) {
            maxValue = max(maxValue, distance ? r.getDistance() : r.getElapsedSeconds());
        }
        if (maxValue <= 0.0) maxValue = 1.0;

        out << "<text x='" << px + panelW / 2 << "' y='28' font-size='15' font-weight='bold' text-anchor='middle'>"
            << (distance ? "Distancia por algoritmo" : "Tiempo de ejecucion (s)") << "</text>\n";
        // Ejes
        out << "<line x1='" << px + left << "' y1='" << top << "' x2='" << px + left << "' y2='" << top + plotH
            << "' stroke='black'/>\n";
        out << "<line x1='" << px + left << "' y1='" << top + plotH << "' x2='" << px + left + plotW
            << "' y2='" << top + plotH << "' stroke='black'/>\n";
        out << "<text x='" << px + 5 << "' y='" << top + 10 << "' font-size='10'>" << fmt(maxValue) << "</text>\n";

        if (nCities == 0 || nAlgos == 0) continue;
        double groupW = plotW / nCities;
        double barW = groupW * 0.8 / nAlgos;

        for (int ci = 0; ci < nCities; ++ci) {
            double gx = px + left + ci * groupW + groupW * 0.1;
            for (int ai = 0; ai < nAlgos; ++ai) {
                const RunResult* r = report.find(config.startCities[ci], config.algorithms[ai].key);
                if (!r) continue;
                double value = distance ? r->getDistance() : r->getElapsedSeconds();
                double bh = plotH * value / maxValue;
                out << "<rect x='" << gx + ai * barW << "' y='" << top + plotH - bh
                    << "' width='" << barW * 0.95 << "' height='" << bh
                    << "' fill='" << PALETTE[ai % PALETTE_SIZE] << "' fill-opacity='0.8'/>\n";
            }
            out << "<text x='" << gx + groupW * 0.4 << "' y='" << top + plotH + 16
                << "' font-size='11' text-anchor='middle'>Ciudad " << config.startCities[ci] + 1 << "</text>\n";
        }

        // Leyenda
        for (int ai = 0; ai < nAlgos; ++ai) {
            double lx = px + left + ai * 90;
            out << "<rect x='" << lx << "' y='" << H - 25 << "' width='12' height='12' fill='"
                << PALETTE[ai % PALETTE_SIZE] << "'/>\n";
            out << "<text x='" << lx + 16 << "' y='" << H - 15 << "' font-size='11'>"
                << escapeXml(config.algorithms[ai].key) << "</text>\n";
        }
    }
    out << "</svg>\n";
    return true;
}

int SvgPlotter::writeAll(const ExperimentReport& report, const ExperimentConfig& config,
                         const string& outputDir) const {
    int written = 0;
    for (const auto& r : report.results) {
        string title = r.getLabel() + " - Ciudad inicial " + to_string(r.getStartCity() + 1) +
                       " | Distancia: " + fmt(r.getDistance()) +
                       " | Tiempo: " + fmt(r.getElapsedSeconds()) + "s";
        string file = outputDir + "/tour_" + r.getAlgorithm() + "_start" +
                      to_string(r.getStartCity() + 1) + ".svg";
        if (plotTour(r.getTour(), title, file)) ++written;
    }
    if (plotComparison(report, config, outputDir + "/comparison_all.svg")) ++written;
    if (plotPerformance(report, config, outputDir + "/performance_comparison.svg")) ++written;

    cout << ">> " << written << " imagenes SVG guardadas en '" << outputDir << "/'" << endl;
    return written;
}
