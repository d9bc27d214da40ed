#include "City.h"

// Constructor por defecto
City::City() : id(0), x(0.0), y(0.0) {}

// Constructor parametrizado
City::City(int id, double x, double y) 
    : id(id), x(x), y(y) {}

// Getters
int City::getId() const { return id; }
double City::getX() const { return x; }
double City::getY() const { return y; }

// Destructor
City::~City() {}
