// test_Parser.cpp
// Prueba de carga de la instancia: archivos válidos y cada tipo de archivo
// mal formado que debe rechazarse con DataFormatError.
//
// Uso: test_Parser <directorio de datos>   (por defecto tests/data)

#include <iostream>
#include <string>
#include <cassert>
#include <cmath>
#include "Parser.h"
#include "Errors.h"

using namespace std;

// Devuelve true si el constructor lanzó DataFormatError
bool rejects(const string& cities, const string& distances) {
    try {
        Parser parser(cities, distances);
    } catch (const DataFormatError& e) {
        cout << "  rechazado: " << e.what() << endl;
        return true;
    }
    return false;
}

// Como rejects, pero además exige que el mensaje mencione el motivo
bool rejectsWith(const string& cities, const string& distances, const string& reason) {
    try {
        Parser parser(cities, distances);
    } catch (const DataFormatError& e) {
        cout << "  rechazado: " << e.what() << endl;
        return string(e.what()).find(reason) != string::npos;
    }
    return false;
}

// ─────────────────────────────────────────────────────────────
// Test 1: carga válida
// ─────────────────────────────────────────────────────────────
void testValidLoad(const string& dir) {
    cout << "\nTEST 1: carga de toy4" << endl;
    Parser parser(dir + "/toy4_cities.txt", dir + "/toy4_distances.txt");

    assert(parser.getDimension() == 4 && "ERROR: dimension incorrecta.");
    assert(parser.getCity(0).getId() == 1 && "ERROR: la ciudad 0 debe tener id 1.");
    assert(parser.getCity(3).getId() == 4);
    assert(fabs(parser.getCity(2).getX() - 1.0) < 1e-12);
    assert(fabs(parser.getCity(2).getY() - 1.0) < 1e-12);
    assert(fabs(parser.getDistance(0, 3) - 10.0) < 1e-12 && "ERROR: d(1,4) debe ser 10.");
    assert(fabs(parser.getDistance(2, 1) - 6.0) < 1e-12);
    assert(parser.isSymmetric());

    // Vecinos ordenados de más cercano a más lejano
    const auto& neighbors = parser.getSortedNeighbors(0);
    assert(neighbors.size() == 3 && "ERROR: la lista de vecinos no debe incluir al propio nodo.");
    assert(neighbors.front().index == 1);
    assert(neighbors.back().index == 3);
    for (size_t i = 1; i < neighbors.size(); ++i) {
        assert(neighbors[i - 1].distance <= neighbors[i].distance);
    }
    cout << "PASS: toy4 cargado correctamente." << endl;
}

// ─────────────────────────────────────────────────────────────
// Test 2: archivos inválidos
// ─────────────────────────────────────────────────────────────
void testRejections(const string& dir) {
    cout << "\nTEST 2: archivos mal formados" << endl;

    assert(rejects(dir + "/toy4_cities.txt", dir + "/bad_nonsquare_distances.txt") &&
           "ERROR: se acepto una matriz no cuadrada.");
    assert(rejects(dir + "/bad_duplicate_cities.txt", dir + "/toy4_distances.txt") &&
           "ERROR: se acepto un id duplicado.");
    assert(rejects(dir + "/toy4_cities.txt", dir + "/bad_nonnumeric_distances.txt") &&
           "ERROR: se acepto un valor no numerico.");
    assert(rejects(dir + "/bad_mismatch_cities.txt", dir + "/toy4_distances.txt") &&
           "ERROR: se acepto una cantidad de ciudades distinta a la matriz.");
    assert(rejects(dir + "/no_existe.txt", dir + "/toy4_distances.txt") &&
           "ERROR: se acepto un archivo inexistente.");

    const string distances = dir + "/toy4_distances.txt";
    const string cities = dir + "/toy4_cities.txt";
    assert(rejectsWith(dir + "/bad_nonnumeric_cities.txt", distances, "valor no numerico 'abc'") &&
           "ERROR: se acepto una coordenada no numerica.");
    assert(rejectsWith(dir + "/bad_fieldcount_cities.txt", distances, "se esperaban 3 campos") &&
           "ERROR: se acepto una fila con 2 campos.");
    assert(rejectsWith(dir + "/bad_idrange_cities.txt", distances, "id 7 fuera de rango (1..4)") &&
           "ERROR: se acepto un id fuera de 1..N.");
    assert(rejectsWith(dir + "/bad_hugeid_cities.txt", distances, "id de ciudad fuera de rango '1e10'") &&
           "ERROR: se acepto un id que no entra en int.");
    assert(rejectsWith(cities, dir + "/bad_negative_distances.txt", "distancia negativa -6") &&
           "ERROR: se acepto una distancia negativa.");
    assert(rejectsWith(cities, dir + "/bad_empty_distances.txt", "vacia") &&
           "ERROR: se acepto una matriz vacia.");

    cout << "PASS: todos los archivos invalidos fueron rechazados." << endl;
}

int main(int argc, char* argv[]) {
    string dir = (argc > 1) ? argv[1] : "tests/data";

    cout << "========================================" << endl;
    cout << "  TEST PARSER" << endl;
    cout << "  Datos: " << dir << endl;
    cout << "========================================" << endl;

    testValidLoad(dir);
    testRejections(dir);

    cout << "\nTODOS LOS TESTS PASARON" << endl;
    return 0;
}
