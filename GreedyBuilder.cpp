#include "GreedyBuilder.h"
#include <vector>

using namespace std;

// Constructor
GreedyBuilder::GreedyBuilder(const Parser* parser) : parserData(parser) {}

// Método principal: siempre salta al vecino no visitado más cercano
Tour GreedyBuilder::buildTour(int startCity) {
    int n = parserData->getDimension();
    Tour tour(startCity, parserData);
    vector<bool> visited(n, false);
    visited[startCity] = true;

    int current = startCity;
    for (int step = 1; step < n; ++step) {
        // La lista ya viene ordenada de menor a mayor distancia
        for (const Neighbor& nb : parserData->getSortedNeighbors(current)) {
            if (!visited[nb.index]) {
                visited[nb.index] = true;
                tour.addCity(nb.index);
                current = nb.index;
                break;
            }
        }
    }

    return tour;
}

// Destructor
GreedyBuilder::~GreedyBuilder() {}
