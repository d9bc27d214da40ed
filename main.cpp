#include "Parser.h"
#include "Parameters.h"
#include "Pipeline.h"
#include "Errors.h"
#include "menu.h"
#include <iostream>
#include <string>
#include <vector>

using namespace std;

static void print_usage(const char* prog_name) {
    cerr << "Uso: " << prog_name << " [opciones]\n\n";
    cerr << "Sin opciones se abre el menu interactivo.\n\n";
    cerr << "Opciones:\n";
    cerr << "  --full               Corrida completa (por defecto): 5 ciudades, pop 200, 1000 gen.\n";
    cerr << "  --quick              Prueba rapida: 2 ciudades, pop 50, 100 gen.\n";
    cerr << "  --menu               Menu interactivo con la configuracion elegida.\n";
    cerr << "  --config <archivo>   Parametros 'clave = valor'.\n";
    cerr << "  --cities <archivo>   Coordenadas (por defecto cityData.txt).\n";
    cerr << "  --distances <arch.>  Matriz de distancias (por defecto intercityDistance.txt).\n";
    cerr << "  --output <dir>       Directorio de resultados.\n";
    cerr << "  --pop <n>            Tamano de poblacion.\n";
    cerr << "  --gens <n>           Numero de generaciones.\n";
    cerr << "  --start <ids>        Ciudades iniciales, ej. 1,10,20.\n";
    cerr << "  --exact              Calcula el optimo de referencia con CBC.\n";
    cerr << "  --no-bound           No calcula la cota inferior LP.\n";
    cerr << "  --no-plots           No genera imagenes SVG.\n";
    cerr << "  --verbose            Progreso por generacion y logs de COIN-OR.\n";
}

int main(int argc, char** argv) {
    if (argc == 1) {
        Menu menu(fullConfig());
        menu.inicializar();
        return 0;
    }

    vector<string> args(argv + 1, argv + argc);

    // El preset va primero; el resto de las opciones lo sobreescribe
    ExperimentConfig config = fullConfig();
    for (const auto& a : args) {
        if (a == "--quick") config = quickConfig();
    }

    bool menuMode = false;
    try {
        for (size_t i = 0; i < args.size(); ++i) {
            const string& a = args[i];
            bool hasValue = i + 1 < args.size();

            if (a == "--full" || a == "--quick") continue;
            else if (a == "--help" || a == "-h") { print_usage(argv[0]); return 0; }
            else if (a == "--menu") menuMode = true;
            else if (a == "--exact") config.computeExact = true;
            else if (a == "--no-bound") config.computeLowerBound = false;
            else if (a == "--no-plots") config.writePlots = false;
            else if (a == "--verbose") config.verbose = true;
            else if (hasValue && a == "--config") load_parameters_from_file(args[++i], config);
            else if (hasValue && a == "--cities") config.cityFile = args[++i];
            else if (hasValue && a == "--distances") config.distanceFile = args[++i];
            else if (hasValue && a == "--output") config.outputDir = args[++i];
            else if (hasValue && a == "--pop") config.popSize = parseInteger(args[++i]);
            else if (hasValue && a == "--gens") config.nGen = parseInteger(args[++i]);
            else if (hasValue && a == "--start") config.startCities = parseCityList(args[++i]);
            else {
                cerr << "Error: opcion desconocida o sin valor '" << a << "'\n\n";
                print_usage(argv[0]);
                return 1;
            }
        }
    } catch (const InvalidConfiguration& e) {
        cerr << "Error de configuracion: " << e.what() << endl;
        return 3;
    }

    if (menuMode) {
        Menu menu(config);
        menu.inicializar();
        return 0;
    }

    cout << string(80, '=') << endl;
    cout << string(20, ' ') << "TRAVELING SALESMAN PROBLEM SOLVER" << endl;
    cout << string(15, ' ') << "Algoritmos evolutivos (GA / DE) + COIN-OR" << endl;
    cout << string(80, '=') << endl;

    cout << "\nConfiguracion:" << endl;
    cout << "  - Poblacion: " << config.popSize << endl;
    cout << "  - Generaciones: " << config.nGen << endl;
    cout << "  - Ciudades iniciales (ids):";
    for (int c : config.startCities) cout << " " << c + 1;
    cout << endl;
    cout << "  - Algoritmos:";
    for (const auto& a : config.algorithms) cout << " " << a.key;
    cout << endl;

    try {
        Parser parser(config.cityFile, config.distanceFile);
        cout << "\n>> " << parser.getDimension() << " ciudades cargadas de '"
             << parser.getCityFile() << "' y '" << parser.getDistanceFile() << "'" << endl;

        ExperimentReport report = runExperimentPipeline(parser, config);
        if (report.results.empty()) {
            cerr << "\nNinguna corrida termino correctamente." << endl;
            return 1;
        }
    } catch (const DataFormatError& e) {
        cerr << "Error en los datos de entrada: " << e.what() << endl;
        return 2;
    } catch (const InvalidConfiguration& e) {
        cerr << "Error de configuracion: " << e.what() << endl;
        return 3;
    } catch (const TspError& e) {
        cerr << "Error: " << e.what() << endl;
        return 1;
    }

    cout << "\n" << string(80, '=') << endl;
    cout << "EJECUCION COMPLETADA" << endl;
    cout << string(80, '=') << endl;
    cout << "Resultados guardados en '" << config.outputDir << "/'" << endl;
    return 0;
}
