#include "menu.h"
#include "Errors.h"
#include <sstream>
#include <iomanip>
#include <limits>

using namespace std;
using chrono::steady_clock;
using chrono::duration;

// Constructor: parte de la configuración recibida (preset o archivo)
Menu::Menu(const ExperimentConfig& config)
    : parserGlobal(nullptr), configGlobal(config), instanciaCargada(false),
      mejorDistanciaGlobal(0.0) {}

// ---------------------------------------------------------
// FUNCIONES AUXILIARES
// ---------------------------------------------------------

void Menu::mostrarEncabezado() const {
    cout << "\n========================================================" << endl;
    cout << "     TSP: ALGORITMOS EVOLUTIVOS (GA / DE)               " << endl;
    cout << "========================================================" << endl;
    if (instanciaCargada) {
        cout << "[Estado] Instancia: N=" << parserGlobal->getDimension()
             << " | " << parserGlobal->getCityFile() << endl;
    } else {
        cout << "[Estado] Ninguna instancia cargada." << endl;
    }
    cout << "[Estado] Poblacion: " << configGlobal.popSize
         << " | Generaciones: " << configGlobal.nGen
         << " | Ciudades iniciales: " << configGlobal.startCities.size()
         << " | Algoritmos: " << configGlobal.algorithms.size() << endl;
    if (mejorDistanciaGlobal > 0) {
        cout << "[Estado] Mejor distancia encontrada (global): " << mejorDistanciaGlobal
             << " (" << mejorDescripcion << ")" << endl;
    }
    cout << "--------------------------------------------------------" << endl;
}

void Menu::reportarTiempo(double tiempoTotal) const {
    cout << fixed << setprecision(3);
    cout << ">> Tiempo de ejecucion: " << tiempoTotal << " segundos." << endl;
}

void Menu::actualizarMejorSolucion(double distancia, const string& descripcion) {
    if (distancia > 0 && (mejorDistanciaGlobal == 0 || distancia < mejorDistanciaGlobal)) {
        mejorDistanciaGlobal = distancia;
        mejorDescripcion = descripcion;
        cout << ">> [!] NUEVA MEJOR SOLUCION GLOBAL (" << descripcion << "): "
             << mejorDistanciaGlobal << endl;
    } else {
        cout << ">> La solucion no mejora el optimo historico (" << mejorDistanciaGlobal << ")." << endl;
    }
}

// ---------------------------------------------------------
// OPCIONES DEL MENÚ
// ---------------------------------------------------------

void Menu::cargarInstancia() {
    cout << "\nArchivo de coordenadas (ej. " << configGlobal.cityFile << "): ";
    string ciudades;
    cin >> ciudades;
    cout << "Archivo de distancias (ej. " << configGlobal.distanceFile << "): ";
    string distancias;
    cin >> distancias;

    try {
        parserGlobal = make_unique<Parser>(ciudades, distancias);
        instanciaCargada = true;
        configGlobal.cityFile = ciudades;
        configGlobal.distanceFile = distancias;
        // Reseteamos la mejor solución histórica al cambiar de mapa
        mejorDistanciaGlobal = 0.0;
        mejorDescripcion.clear();
        cout << ">> Archivos cargados correctamente (" << parserGlobal->getDimension()
             << " ciudades)." << endl;
    } catch (const DataFormatError& e) {
        cout << ">> Error al cargar los archivos: " << e.what() << endl;
        instanciaCargada = false;
    }
}

void Menu::configurarParametros() {
    cout << "\nTamano de poblacion (actual " << configGlobal.popSize << "): ";
    int pop;
    cout.flush();
    if (!(cin >> pop) || pop <= 0) {
        cout << ">> Entrada invalida. Se mantiene " << configGlobal.popSize << "." << endl;
        cin.clear();
        cin.ignore(numeric_limits<streamsize>::max(), '\n');
        return;
    }

    cout << "Generaciones (actual " << configGlobal.nGen << "): ";
    int gens;
    if (!(cin >> gens) || gens <= 0) {
        cout << ">> Entrada invalida. Se mantiene " << configGlobal.nGen << "." << endl;
        cin.clear();
        cin.ignore(numeric_limits<streamsize>::max(), '\n');
        return;
    }
    cin.ignore(numeric_limits<streamsize>::max(), '\n');

    cout << "Ciudades iniciales separadas por coma (ids, Enter = sin cambios): ";
    string linea;
    getline(cin, linea);
    if (!linea.empty()) {
        try {
            configGlobal.startCities = parseCityList(linea);
        } catch (const InvalidConfiguration& e) {
            cout << ">> " << e.what() << ". Se mantienen las ciudades actuales." << endl;
        }
    }

    configGlobal.popSize = pop;
    configGlobal.nGen = gens;
    cout << ">> Parametros actualizados." << endl;
}

void Menu::ejecutarExperimento(ExperimentConfig config) {
    auto inicio = steady_clock::now();
    ExperimentReport report = runExperimentPipeline(*parserGlobal, config);
    double tiempo = duration<double>(steady_clock::now() - inicio).count();

    reportarTiempo(tiempo);
    int best = report.bestIndex();
    if (best >= 0) {
        const RunResult& r = report.results[best];
        actualizarMejorSolucion(r.getDistance(),
                                r.getAlgorithm() + ", ciudad " + to_string(r.getStartCity() + 1));
    }
}

void Menu::ejecutarCotas() {
    cout << "\n--- Cota inferior (CLP) y optimo de referencia (CBC) ---" << endl;
    cout << "Limite de tiempo para CBC en segundos (actual " << configGlobal.exactTimeLimit << "s): ";
    double nuevoTiempo;
    if (cin >> nuevoTiempo && nuevoTiempo > 0) {
        configGlobal.exactTimeLimit = nuevoTiempo;
    } else {
        cout << ">> Entrada invalida. Se mantiene " << configGlobal.exactTimeLimit << "s." << endl;
        cin.clear();
        cin.ignore(numeric_limits<streamsize>::max(), '\n');
    }

    auto inicio = steady_clock::now();
    try {
        ClpSolver clp(parserGlobal.get());
        LowerBound lb = clp.solveRelaxation(100, configGlobal.verbose);
        cout << fixed << setprecision(2);
        cout << ">> Cota inferior LP: " << lb.value << " (" << lb.rounds << " rondas, "
             << lb.cutsAdded << " cortes, soporte " << (lb.connected ? "conexo" : "desconexo")
             << ")" << endl;

        int startCity = configGlobal.startCities.empty() ? 0 : configGlobal.startCities.front();
        CbcSolver cbc(parserGlobal.get());
        ExactResult exact = cbc.solve(startCity, configGlobal.exactTimeLimit, vector<int>(),
                                      configGlobal.verbose);
        cout << ">> " << (exact.provenOptimal ? "Optimo CBC: " : "Mejor CBC (limite de tiempo): ")
             << exact.tour.getTotalCost() << " | LB final: " << exact.lowerBound << endl;
        cout << ">> Tour: " << exact.tour.toIdString() << endl;
        actualizarMejorSolucion(exact.tour.getTotalCost(), "CBC");
    } catch (const TspError& e) {
        cout << ">> Error: " << e.what() << endl;
    }
    reportarTiempo(duration<double>(steady_clock::now() - inicio).count());
}

void Menu::ingresoManual() {
    cout << "\n--- Ingreso de Tour Manual ---" << endl;
    cout << "Ingrese los ID de las ciudades en orden, separados por espacio." << endl;
    cout << "(La primera es la ciudad inicial; el regreso a ella se agrega automaticamente)" << endl;
    cout << "Tour: ";

    cin.ignore(numeric_limits<streamsize>::max(), '\n');
    string linea;
    getline(cin, linea);

    stringstream ss(linea);
    vector<int> indices;
    int id;
    while (ss >> id) indices.push_back(id - 1);

    int n = parserGlobal->getDimension();
    if (indices.empty() || indices.front() < 0 || indices.front() >= n) {
        cout << ">> Error: ciudad inicial invalida." << endl;
        return;
    }
    for (int idx : indices) {
        if (idx < 0 || idx >= n) {
            cout << ">> Error: id fuera de rango (1.." << n << ")." << endl;
            return;
        }
    }

    int startCity = indices.front();
    vector<int> order(indices.begin() + 1, indices.end());
    TourEvaluator evaluator(parserGlobal.get(), startCity);
    Tour tour(startCity, order, parserGlobal.get());

    cout << "\n>> Validando tour manual..." << endl;
    if (tour.isValid()) {
        cout << ">> ESTADO: TOUR VALIDO (permutacion completa)" << endl;
    } else {
        cout << ">> ESTADO: TOUR INVALIDO (ciudades faltantes o repetidas)" << endl;
    }
    cout << fixed << setprecision(2);
    cout << ">> Distancia total evaluada: " << evaluator.evaluate(order) << endl;
    cout << ">> Tour: " << tour.toIdString() << endl;
    if (tour.isValid()) {
        actualizarMejorSolucion(tour.getTotalCost(), "Ingreso Manual");
    }
}

// ---------------------------------------------------------
// BUCLE PRINCIPAL
// ---------------------------------------------------------

void Menu::inicializar() {
    string opcion;

    while (true) {
        mostrarEncabezado();
        cout << "1. Cargar archivos (coordenadas + matriz de distancias)" << endl;
        cout << "2. Corrida completa (5 ciudades iniciales, GA / GA2 / DE)" << endl;
        cout << "3. Prueba rapida (2 ciudades iniciales, parametros reducidos)" << endl;
        cout << "4. Corrida con los parametros actuales" << endl;
        cout << "5. Ajustar parametros (poblacion, generaciones, ciudades iniciales)" << endl;
        cout << "6. Cota inferior (CLP) y optimo de referencia (CBC)" << endl;
        cout << "7. Ingreso de tour manual y calculo de distancia" << endl;
        cout << "8. Salir" << endl;
        cout << "\nSeleccione una opcion: ";

        if (!(cin >> opcion)) break;

        if (opcion == "1") {
            cargarInstancia();
        }
        else if (opcion == "8") {
            cout << ">> Saliendo del solver TSP. Hasta luego!" << endl;
            break;
        }
        else if (opcion == "5") {
            configurarParametros();
        }
        else if (opcion == "2" || opcion == "3" || opcion == "4" || opcion == "6" || opcion == "7") {
            if (!instanciaCargada) { cout << ">> Error: Debe cargar una instancia primero.\n"; continue; }

            if (opcion == "2" || opcion == "3") {
                ExperimentConfig preset = (opcion == "2") ? fullConfig() : quickConfig();
                preset.cityFile = configGlobal.cityFile;
                preset.distanceFile = configGlobal.distanceFile;
                preset.verbose = configGlobal.verbose;
                ejecutarExperimento(preset);
            } else if (opcion == "4") {
                ejecutarExperimento(configGlobal);
            } else if (opcion == "6") {
                ejecutarCotas();
            } else {
                ingresoManual();
            }
        }
        else {
            cout << ">> Opcion no valida. Intente de nuevo." << endl;
        }
    }
}
