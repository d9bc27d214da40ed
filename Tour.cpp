#include "Tour.h"
#include <sstream>

using namespace std;

Tour::Tour() : totalCost(0.0), startCity(0), parserData(nullptr) {}

// Toda ruta debe iniciar y terminar en la ciudad inicial
Tour::Tour(int startCity, const Parser* parser)
    : totalCost(0.0), startCity(startCity), parserData(parser) {
    path.push_back(startCity); // Inicio
    path.push_back(startCity); // Fin
}

Tour::Tour(int startCity, const vector<int>& order, const Parser* parser)
    : totalCost(0.0), startCity(startCity), parserData(parser) {
    path.reserve(order.size() + 2);
    path.push_back(startCity);
    path.insert(path.end(), order.begin(), order.end());
    path.push_back(startCity);
    updateMetrics();
}

void Tour::updateMetrics() {
    totalCost = 0.0;
    // Sumamos la distancia de cada segmento: (i) -> (i+1)
    for (size_t i = 0; i + 1 < path.size(); ++i) {
        totalCost += parserData->getDistance(path[i], path[i + 1]);
    }
}

// Agrega una ciudad al FINAL del recorrido (justo antes del regreso al inicio)
void Tour::addCity(int index) {
    path.insert(path.end() - 1, index);
    updateMetrics();
}

bool Tour::isValid() const {
    if (!parserData) return false;
    int n = parserData->getDimension();
    if (static_cast<int>(path.size()) != n + 1) return false;
    if (path.front() != startCity || path.back() != startCity) return false;

    vector<int> visitCount(n, 0);
    for (size_t i = 0; i + 1 < path.size(); ++i) {
        int city = path[i];
        if (city < 0 || city >= n) return false;
        if (++visitCount[city] > 1) return false;
    }
    return true;
}

double Tour::getTotalCost() const { return totalCost; }
int Tour::getStartCity() const { return startCity; }
const vector<int>& Tour::getPath() const { return path; }

vector<int> Tour::getOrder() const {
    if (path.size() < 2) return vector<int>();
    return vector<int>(path.begin() + 1, path.end() - 1);
}

string Tour::toIdString(size_t maxCities) const {
    ostringstream out;
    size_t shown = (maxCities == 0 || maxCities > path.size()) ? path.size() : maxCities;
    for (size_t i = 0; i < shown; ++i) {
        if (i > 0) out << " -> ";
        out << path[i] + 1;
    }
    if (shown < path.size()) out << "...";
    return out.str();
}

Tour::~Tour() {}
