#ifndef GREEDY_BUILDER_H
#define GREEDY_BUILDER_H

#include "Parser.h"
#include "Tour.h"

class GreedyBuilder {
private:
    const Parser* parserData;

public:
    // Constructor: Solo requiere el parser para acceder a los datos
    explicit GreedyBuilder(const Parser* parser);

    // Vecino más cercano desde startCity. Sirve como línea base del
    // reporte y como warm start de CBC.
    Tour buildTour(int startCity);

    // Destructor
    ~GreedyBuilder();
};

#endif // GREEDY_BUILDER_H
