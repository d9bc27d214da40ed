#ifndef PARAMETERS_H
#define PARAMETERS_H

#include <string>
#include <vector>

enum class AlgorithmVariant {
    Genetic,               // Permutacion + OX + inversion + torneo
    DifferentialEvolution  // Claves aleatorias decodificadas por ordenamiento
};

// Parámetros del Algoritmo Genético
struct GAParams {
    double pCrossover = 0.9;
    double pMutation = 0.1;
    int tournamentK = 2;
    bool eliminateDuplicates = true;
    int duplicateRetries = 20; // Intentos para generar un hijo no repetido
};

// Parámetros de Evolución Diferencial (DE/rand/1/bin)
struct DEParams {
    double F = 0.8;
    double CR = 0.9;
    bool dither = false; // F aleatorio en [0.5, 1.0] por generación
};

// Una configuración de algoritmo del experimento: (nombre, variante, parámetros)
struct AlgorithmConfig {
    std::string key;    // Nombre corto (GA, GA2, DE): columnas, archivos
    std::string label;  // Nombre largo para el reporte
    AlgorithmVariant variant = AlgorithmVariant::Genetic;
    unsigned int seed = 42;
    GAParams ga;
    DEParams de;
};

// Configuración completa del experimento. Se pasa explícita a cada etapa.
struct ExperimentConfig {
    int popSize = 200;
    int nGen = 1000;
    std::vector<int> startCities;  // Índices base 0
    std::vector<AlgorithmConfig> algorithms;

    std::string cityFile = "cityData.txt";
    std::string distanceFile = "intercityDistance.txt";
    std::string outputDir = "results";

    bool computeLowerBound = true;  // Cota inferior LP (CLP)
    bool computeExact = false;      // Óptimo de referencia (CBC)
    double exactTimeLimit = 120.0;  // Segundos para CBC
    bool writePlots = true;
    bool verbose = false;
};

// Presets de algoritmos
AlgorithmConfig standardGA();
AlgorithmConfig modifiedGA();
AlgorithmConfig differentialEvolution();

// Corrida completa: 5 ciudades iniciales, población y generaciones grandes
ExperimentConfig fullConfig();
// Prueba rápida: 2 ciudades iniciales, población y generaciones chicas
ExperimentConfig quickConfig();

const char* variantName(AlgorithmVariant variant);

// Lee pares "clave = valor" y sobreescribe los campos de config.
// Claves o valores inválidos generan un aviso y se conserva el valor previo.
void load_parameters_from_file(const std::string& filename, ExperimentConfig& config);

// Conversión estricta de valores de configuración: el texto completo debe
// ser el número. Lanzan InvalidConfiguration.
int parseInteger(const std::string& text);
double parseReal(const std::string& text);
unsigned int parseSeed(const std::string& text);

// Lista "1,10,20" (ids) -> índices base 0
std::vector<int> parseCityList(const std::string& text);

#endif // PARAMETERS_H
