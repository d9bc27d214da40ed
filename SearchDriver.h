#ifndef SEARCH_DRIVER_H
#define SEARCH_DRIVER_H

#include "Parser.h"
#include "Parameters.h"
#include "RunResult.h"

// Configura y ejecuta una búsqueda evolutiva (GA o DE) para una ciudad
// inicial y devuelve el mejor registro observado en todas las generaciones.
//
// Errores:
//   InvalidConfiguration  antes de evaluar cualquier candidato
//   SearchFailure         falla inesperada del optimizador
// Ambos mensajes incluyen la ciudad inicial y el algoritmo.
class SearchDriver {
private:
    const Parser* parserData;
    bool verbose;

public:
    explicit SearchDriver(const Parser* parser, bool verbose = false);

    void validate(const AlgorithmConfig& config, int startCity, int popSize, int nGen) const;

    RunResult run(const AlgorithmConfig& config, int startCity, int popSize, int nGen) const;
};

#endif // SEARCH_DRIVER_H
