#ifndef TOUR_H
#define TOUR_H

#include <string>
#include <vector>
#include "Parser.h"

class Tour {
private:
    std::vector<int> path; // Índices base 0, cerrado (ej: 0 -> 4 -> 2 -> 0)
    double totalCost;
    int startCity;

    // Referencia al parser para no duplicar la matriz
    const Parser* parserData;

    // Recalcula el costo iterando sobre el path actual
    void updateMetrics();

public:
    Tour();
    Tour(int startCity, const Parser* parser);
    // Construye el tour cerrado a partir del orden de visita (sin la ciudad inicial)
    Tour(int startCity, const std::vector<int>& order, const Parser* parser);

    void addCity(int index);

    // Verifica que empiece/termine en la ciudad inicial y visite todas exactamente una vez
    bool isValid() const;
    double getTotalCost() const;
    int getStartCity() const;
    const std::vector<int>& getPath() const;
    // Orden de visita sin la ciudad inicial (forma que usa TourEvaluator)
    std::vector<int> getOrder() const;

    // "1 -> 10 -> ... -> 1" usando los ids del archivo
    std::string toIdString(size_t maxCities = 0) const;

    ~Tour();
};

#endif // TOUR_H
