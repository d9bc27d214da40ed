#ifndef PARSER_H
#define PARSER_H

#include <string>
#include <vector>
#include "City.h"

// Estructura auxiliar para la lista de adyacencia ordenada
struct Neighbor {
    int index;
    double distance;

    // Sobrecarga del operador < para que std::sort sepa cómo ordenarlos de menor a mayor
    bool operator<(const Neighbor& other) const {
        return distance < other.distance;
    }
};

// Carga la instancia TSP desde dos archivos planos:
//   - coordenadas: una ciudad por linea "id x y" (ids de 1 a N)
//   - distancias:  N filas con N valores numericos
// Se aceptan espacios o comas como separadores; las lineas vacias y las que
// empiezan con '#' se ignoran. Cualquier inconsistencia lanza DataFormatError.
//
// Internamente las ciudades se indexan en base 0 (indice = id - 1).
class Parser {
private:
    std::string cityFile;
    std::string distanceFile;
    int dimension; // Número total de ciudades

    std::vector<City> cities;
    std::vector<std::vector<double>> distanceMatrix;

    // Lista de adyacencia donde la posición 'u' contiene a todos los vecinos ordenados
    std::vector<std::vector<Neighbor>> sortedAdjacencyList;

    // Métodos privados auxiliares
    void loadCities();
    void loadDistanceMatrix();
    void checkConsistency();
    void buildSortedAdjacencyList();

public:
    // Constructor: lee ambos archivos o lanza DataFormatError
    Parser(const std::string& cityFile, const std::string& distanceFile);

    // Getters de datos globales
    int getDimension() const;
    const std::string& getCityFile() const;
    const std::string& getDistanceFile() const;

    // Getters de estructuras
    const std::vector<City>& getCities() const;
    const City& getCity(int index) const;
    bool isSymmetric() const;

    // Vecinos de un nodo ordenados de más cercano a más lejano
    const std::vector<Neighbor>& getSortedNeighbors(int index) const;

    // Distancia entre dos ciudades (índices base 0) en O(1)
    double getDistance(int from, int to) const;

    // Destructor
    ~Parser();
};

#endif // PARSER_H
