#ifndef ERRORS_H
#define ERRORS_H

#include <stdexcept>
#include <string>

// Raiz de todos los errores del solver
class TspError : public std::runtime_error {
public:
    explicit TspError(const std::string& message) : std::runtime_error(message) {}
};

// Archivos de entrada mal formados (fatal: se aborta antes de buscar)
class DataFormatError : public TspError {
public:
    explicit DataFormatError(const std::string& message) : TspError(message) {}
};

// Poblacion/generaciones no positivas, ciudad inicial fuera de rango, etc.
class InvalidConfiguration : public TspError {
public:
    explicit InvalidConfiguration(const std::string& message) : TspError(message) {}
};

// El optimizador fallo de forma inesperada durante una corrida
class SearchFailure : public TspError {
public:
    explicit SearchFailure(const std::string& message) : TspError(message) {}
};

#endif // ERRORS_H
