#include "TourEvaluator.h"

using namespace std;

TourEvaluator::TourEvaluator(const Parser* parser, int startCity)
    : parserData(parser), startCity(startCity) {}

double TourEvaluator::evaluate(const vector<int>& order) const {
    if (order.empty()) return 0.0;

    double total = parserData->getDistance(startCity, order.front());
    for (size_t i = 0; i + 1 < order.size(); ++i) {
        total += parserData->getDistance(order[i], order[i + 1]);
    }
    // Regreso a la ciudad inicial: cierra el ciclo
    total += parserData->getDistance(order.back(), startCity);
    return total;
}

vector<int> TourEvaluator::citiesToVisit() const {
    vector<int> cities;
    for (int i = 0; i < parserData->getDimension(); ++i) {
        if (i != startCity) cities.push_back(i);
    }
    return cities;
}
