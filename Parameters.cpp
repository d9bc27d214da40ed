#include "Parameters.h"
#include "Errors.h"
#include <iostream>
#include <fstream>
#include <sstream>
#include <algorithm> // Para std::find_if, std::replace
#include <cctype>    // Para std::isspace, std::tolower
#include <cmath>
#include <limits>

using namespace std;

// Función auxiliar para remover espacios en blanco del inicio y fin de una string
static void trim(string& s) {
    s.erase(s.begin(), find_if(s.begin(), s.end(), [](unsigned char ch) {
        return !isspace(ch);
    }));
    s.erase(find_if(s.rbegin(), s.rend(), [](unsigned char ch) {
        return !isspace(ch);
    }).base(), s.end());
}

static string toLower(string s) {
    transform(s.begin(), s.end(), s.begin(), [](unsigned char ch) {
        return static_cast<char>(tolower(ch));
    });
    return s;
}

static bool parseBool(const string& value) {
    string v = toLower(value);
    if (v == "true" || v == "1" || v == "yes" || v == "si") return true;
    if (v == "false" || v == "0" || v == "no") return false;
    throw InvalidConfiguration("valor booleano invalido '" + value + "'");
}

int parseInteger(const string& text) {
    size_t used = 0;
    long value = 0;
    try {
        value = stol(text, &used);
    } catch (const exception&) {
        used = 0;
    }
    if (text.empty() || used != text.size() ||
        value < numeric_limits<int>::min() || value > numeric_limits<int>::max()) {
        throw InvalidConfiguration("entero invalido '" + text + "'");
    }
    return static_cast<int>(value);
}

double parseReal(const string& text) {
    size_t used = 0;
    double value = 0.0;
    try {
        value = stod(text, &used);
    } catch (const exception&) {
        used = 0;
    }
    if (text.empty() || used != text.size() || !std::isfinite(value)) {
        throw InvalidConfiguration("numero invalido '" + text + "'");
    }
    return value;
}

// stoul acepta "-3" y lo convierte en un valor enorme: se exige solo dígitos
unsigned int parseSeed(const string& text) {
    if (text.empty() || !all_of(text.begin(), text.end(), [](unsigned char ch) { return isdigit(ch); })) {
        throw InvalidConfiguration("semilla invalida '" + text + "'");
    }
    unsigned long value = 0;
    try {
        value = stoul(text);
    } catch (const exception&) {
        throw InvalidConfiguration("semilla fuera de rango '" + text + "'");
    }
    if (value > numeric_limits<unsigned int>::max()) {
        throw InvalidConfiguration("semilla fuera de rango '" + text + "'");
    }
    return static_cast<unsigned int>(value);
}

AlgorithmConfig standardGA() {
    AlgorithmConfig config;
    config.key = "GA";
    config.label = "Genetic Algorithm (GA)";
    config.variant = AlgorithmVariant::Genetic;
    config.seed = 42;
    config.ga.pCrossover = 0.9;
    config.ga.pMutation = 0.1;
    return config;
}

// Mismo operador, más cruzamiento y mutación, otra semilla
AlgorithmConfig modifiedGA() {
    AlgorithmConfig config;
    config.key = "GA2";
    config.label = "Modified Genetic Algorithm (GA-2)";
    config.variant = AlgorithmVariant::Genetic;
    config.seed = 123;
    config.ga.pCrossover = 0.95;
    config.ga.pMutation = 0.2;
    return config;
}

AlgorithmConfig differentialEvolution() {
    AlgorithmConfig config;
    config.key = "DE";
    config.label = "Differential Evolution (DE, random keys)";
    config.variant = AlgorithmVariant::DifferentialEvolution;
    config.seed = 7;
    config.de.F = 0.8;
    config.de.CR = 0.9;
    return config;
}

ExperimentConfig fullConfig() {
    ExperimentConfig config;
    config.popSize = 200;
    config.nGen = 1000;
    config.startCities = {0, 9, 19, 29, 39}; // ids 1, 10, 20, 30, 40
    config.algorithms = {standardGA(), modifiedGA(), differentialEvolution()};
    return config;
}

ExperimentConfig quickConfig() {
    ExperimentConfig config;
    config.popSize = 50;
    config.nGen = 100;
    config.startCities = {0, 19}; // ids 1 y 20
    config.algorithms = {standardGA(), modifiedGA(), differentialEvolution()};
    config.outputDir = "results_quick";
    return config;
}

const char* variantName(AlgorithmVariant variant) {
    switch (variant) {
        case AlgorithmVariant::Genetic: return "ga";
        case AlgorithmVariant::DifferentialEvolution: return "de";
    }
    return "?";
}

vector<int> parseCityList(const string& text) {
    string normalized = text;
    replace(normalized.begin(), normalized.end(), ',', ' ');
    stringstream ss(normalized);
    vector<int> cities;
    string token;
    while (ss >> token) {
        int id = 0;
        try {
            id = parseInteger(token);
        } catch (const InvalidConfiguration&) {
            id = 0;
        }
        if (id < 1) {
            throw InvalidConfiguration("id de ciudad invalido '" + token + "'");
        }
        cities.push_back(id - 1);
    }
    return cities;
}

// "KEY variante semilla [param=valor ...]"
static AlgorithmConfig parseAlgorithm(const string& value) {
    stringstream ss(value);
    string key, variant, seedText;
    if (!(ss >> key >> variant >> seedText)) {
        throw InvalidConfiguration("se esperaba 'KEY variante semilla [param=valor ...]'");
    }

    AlgorithmConfig config;
    string v = toLower(variant);
    if (v == "ga") {
        config.variant = AlgorithmVariant::Genetic;
    } else if (v == "de") {
        config.variant = AlgorithmVariant::DifferentialEvolution;
    } else {
        throw InvalidConfiguration("variante desconocida '" + variant + "'");
    }
    config.key = key;
    config.label = key;
    config.seed = parseSeed(seedText);

    string param;
    while (ss >> param) {
        size_t eq = param.find('=');
        if (eq == string::npos) {
            throw InvalidConfiguration("parametro sin '=': " + param);
        }
        string name = param.substr(0, eq);
        string val = param.substr(eq + 1);

        if (name == "pCrossover") config.ga.pCrossover = parseReal(val);
        else if (name == "pMutation") config.ga.pMutation = parseReal(val);
        else if (name == "tournamentK") config.ga.tournamentK = parseInteger(val);
        else if (name == "eliminateDuplicates") config.ga.eliminateDuplicates = parseBool(val);
        else if (name == "F") config.de.F = parseReal(val);
        else if (name == "CR") config.de.CR = parseReal(val);
        else if (name == "dither") config.de.dither = parseBool(val);
        else if (name == "label") {
            config.label = val;
            replace(config.label.begin(), config.label.end(), '_', ' ');
        }
        else throw InvalidConfiguration("parametro desconocido '" + name + "'");
    }
    return config;
}

void load_parameters_from_file(const string& filename, ExperimentConfig& config) {
    ifstream file(filename);
    if (!file.is_open()) {
        cerr << "AVISO: No se pudo abrir el archivo de parametros '" << filename
             << "'. Usando valores por defecto." << endl;
        return;
    }

    bool algorithmsReplaced = false;
    string line;
    while (getline(file, line)) {
        trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }

        stringstream ss(line);
        string key, value;
        if (getline(ss, key, '=') && getline(ss, value)) {
            trim(key);
            trim(value);

            try {
                if (key == "popSize") config.popSize = parseInteger(value);
                else if (key == "nGen") config.nGen = parseInteger(value);
                else if (key == "startCities") config.startCities = parseCityList(value);
                else if (key == "outputDir") config.outputDir = value;
                else if (key == "cityFile") config.cityFile = value;
                else if (key == "distanceFile") config.distanceFile = value;
                else if (key == "lowerBound") config.computeLowerBound = parseBool(value);
                else if (key == "exact") config.computeExact = parseBool(value);
                else if (key == "exactTimeLimit") config.exactTimeLimit = parseReal(value);
                else if (key == "plots") config.writePlots = parseBool(value);
                else if (key == "verbose") config.verbose = parseBool(value);
                else if (key == "algorithm") {
                    AlgorithmConfig algorithm = parseAlgorithm(value);
                    // La primera linea 'algorithm' reemplaza la lista por defecto
                    if (!algorithmsReplaced) {
                        config.algorithms.clear();
                        algorithmsReplaced = true;
                    }
                    config.algorithms.push_back(algorithm);
                }
                else {
                    cerr << "AVISO: Clave desconocida '" << key << "' en " << filename << endl;
                }
            } catch (const exception& e) {
                cerr << "AVISO: Error al leer el valor para la clave '" << key << "'. Valor '"
                     << value << "' es invalido (" << e.what() << ")." << endl;
            }
        } else {
            cerr << "AVISO: Linea ignorada en " << filename << ": " << line << endl;
        }
    }
    cout << "Parametros leidos de '" << filename << "'." << endl;
}
