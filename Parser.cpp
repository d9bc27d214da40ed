#include "Parser.h"
#include "Errors.h"
#include <iostream>
#include <fstream>
#include <sstream>
#include <cmath>
#include <climits>
#include <cstdlib>
#include <algorithm> // Para std::sort, std::replace

using namespace std;

// Parte una linea en campos. Las comas cuentan como espacios.
static vector<string> splitFields(string line) {
    replace(line.begin(), line.end(), ',', ' ');
    replace(line.begin(), line.end(), '\t', ' ');
    stringstream ss(line);
    vector<string> fields;
    string field;
    while (ss >> field) fields.push_back(field);
    return fields;
}

static bool isSkippable(const string& line) {
    size_t first = line.find_first_not_of(" \t\r");
    return first == string::npos || line[first] == '#';
}

static string location(const string& filename, int lineNumber) {
    return filename + ":" + to_string(lineNumber);
}

// Convierte un campo a double exigiendo que se consuma completo
static double parseNumber(const string& field, const string& filename, int lineNumber) {
    const char* begin = field.c_str();
    char* end = nullptr;
    double value = strtod(begin, &end);
    if (end == begin || *end != '\0' || !std::isfinite(value)) {
        throw DataFormatError(location(filename, lineNumber) +
                              ": valor no numerico '" + field + "'");
    }
    return value;
}

// Constructor: inicializa variables y dispara la lectura
Parser::Parser(const string& cityFile, const string& distanceFile)
    : cityFile(cityFile), distanceFile(distanceFile), dimension(0) {
    loadCities();
    loadDistanceMatrix();
    checkConsistency();
    buildSortedAdjacencyList(); // Pre-calculamos los vecinos ordenados
}

void Parser::loadCities() {
    ifstream in(cityFile);
    if (!in.is_open()) {
        throw DataFormatError("No se pudo abrir el archivo de ciudades: " + cityFile);
    }

    vector<City> rows;
    vector<int> lineOf;
    string line;
    int lineNumber = 0;

    while (getline(in, line)) {
        ++lineNumber;
        if (isSkippable(line)) continue;

        vector<string> fields = splitFields(line);
        if (fields.size() != 3) {
            throw DataFormatError(location(cityFile, lineNumber) +
                                  ": se esperaban 3 campos (id x y), hay " +
                                  to_string(fields.size()));
        }

        double rawId = parseNumber(fields[0], cityFile, lineNumber);
        if (rawId != std::floor(rawId)) {
            throw DataFormatError(location(cityFile, lineNumber) +
                                  ": id de ciudad no entero '" + fields[0] + "'");
        }
        if (rawId < 1 || rawId > INT_MAX) {
            throw DataFormatError(location(cityFile, lineNumber) +
                                  ": id de ciudad fuera de rango '" + fields[0] + "'");
        }
        double x = parseNumber(fields[1], cityFile, lineNumber);
        double y = parseNumber(fields[2], cityFile, lineNumber);

        rows.push_back(City(static_cast<int>(rawId), x, y));
        lineOf.push_back(lineNumber);
    }

    if (rows.empty()) {
        throw DataFormatError("El archivo de ciudades no contiene filas: " + cityFile);
    }

    // Los ids deben cubrir exactamente 1..N: ciudad con id k -> indice k-1
    int n = static_cast<int>(rows.size());
    cities.assign(n, City());
    vector<bool> seen(n, false);

    for (int r = 0; r < n; ++r) {
        int id = rows[r].getId();
        if (id < 1 || id > n) {
            throw DataFormatError(location(cityFile, lineOf[r]) + ": id " + to_string(id) +
                                  " fuera de rango (1.." + to_string(n) + ")");
        }
        if (seen[id - 1]) {
            throw DataFormatError(location(cityFile, lineOf[r]) + ": id duplicado " +
                                  to_string(id));
        }
        seen[id - 1] = true;
        cities[id - 1] = rows[r];
    }
}

void Parser::loadDistanceMatrix() {
    ifstream in(distanceFile);
    if (!in.is_open()) {
        throw DataFormatError("No se pudo abrir el archivo de distancias: " + distanceFile);
    }

    string line;
    int lineNumber = 0;
    while (getline(in, line)) {
        ++lineNumber;
        if (isSkippable(line)) continue;

        vector<double> row;
        for (const string& field : splitFields(line)) {
            double d = parseNumber(field, distanceFile, lineNumber);
            if (d < 0.0) {
                throw DataFormatError(location(distanceFile, lineNumber) +
                                      ": distancia negativa " + field);
            }
            row.push_back(d);
        }
        distanceMatrix.push_back(row);
    }

    if (distanceMatrix.empty()) {
        throw DataFormatError("La matriz de distancias esta vacia: " + distanceFile);
    }

    // La matriz debe ser cuadrada: cada fila tiene tantas columnas como filas hay
    size_t n = distanceMatrix.size();
    for (size_t i = 0; i < n; ++i) {
        if (distanceMatrix[i].size() != n) {
            throw DataFormatError(distanceFile + ": la matriz no es cuadrada (fila " +
                                  to_string(i + 1) + " tiene " +
                                  to_string(distanceMatrix[i].size()) + " columnas, se esperaban " +
                                  to_string(n) + ")");
        }
    }
}

void Parser::checkConsistency() {
    if (cities.size() != distanceMatrix.size()) {
        throw DataFormatError("Cantidad de ciudades (" + to_string(cities.size()) +
                              ") distinta al tamano de la matriz (" +
                              to_string(distanceMatrix.size()) + ")");
    }
    dimension = static_cast<int>(cities.size());

    if (!isSymmetric()) {
        cerr << "AVISO: la matriz de distancias de " << distanceFile
             << " no es simetrica." << endl;
    }
}

// Construcción de la lista de adyacencia ordenada
void Parser::buildSortedAdjacencyList() {
    sortedAdjacencyList.assign(dimension, vector<Neighbor>());

    for (int i = 0; i < dimension; ++i) {
        for (int j = 0; j < dimension; ++j) {
            if (i != j) { // No agregamos la distancia hacia sí mismo
                sortedAdjacencyList[i].push_back({j, distanceMatrix[i][j]});
            }
        }
        // stable_sort: ante empates se conserva el orden por indice
        std::stable_sort(sortedAdjacencyList[i].begin(), sortedAdjacencyList[i].end());
    }
}

bool Parser::isSymmetric() const {
    for (size_t i = 0; i < distanceMatrix.size(); ++i) {
        for (size_t j = i + 1; j < distanceMatrix.size(); ++j) {
            if (std::fabs(distanceMatrix[i][j] - distanceMatrix[j][i]) > 1e-9) return false;
        }
    }
    return true;
}

int Parser::getDimension() const { return dimension; }
const string& Parser::getCityFile() const { return cityFile; }
const string& Parser::getDistanceFile() const { return distanceFile; }
const vector<City>& Parser::getCities() const { return cities; }
const City& Parser::getCity(int index) const { return cities[index]; }
double Parser::getDistance(int from, int to) const { return distanceMatrix[from][to]; }

// Retorna la lista de vecinos ordenados de un nodo
const vector<Neighbor>& Parser::getSortedNeighbors(int index) const {
    return sortedAdjacencyList[index];
}

Parser::~Parser() {}
