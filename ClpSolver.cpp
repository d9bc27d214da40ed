#include "ClpSolver.h"
#include "Errors.h"
#include <iostream>
#include <iomanip> // Para std::setprecision
#include <algorithm>
#include <queue>
#include <coin/CoinBuild.hpp>

using namespace std;

ClpSolver::ClpSolver(const Parser* parser) : parserData(parser) {
    numCities = parserData->getDimension();
    numVariables = numCities * (numCities - 1) / 2;
}

int ClpSolver::getVarIndex(int i, int j) const {
    if (i > j) swap(i, j);
    // Fila i del triángulo superior comienza después de las i filas anteriores
    return i * numCities - i * (i + 1) / 2 + (j - i - 1);
}

void ClpSolver::addDegreeRows(ClpSimplex& model) const {
    CoinBuild build;
    for (int i = 0; i < numCities; ++i) {
        vector<int> indices; vector<double> elements;
        for (int j = 0; j < numCities; ++j) {
            if (i != j) { indices.push_back(getVarIndex(i, j)); elements.push_back(1.0); }
        }
        build.addRow(indices.size(), indices.data(), elements.data(), 2.0, 2.0);
    }
    model.addRows(build);
}

vector<vector<int>> ClpSolver::supportComponents(const double* solution, double threshold) const {
    vector<vector<int>> components;
    vector<bool> seen(numCities, false);

    for (int start = 0; start < numCities; ++start) {
        if (seen[start]) continue;

        vector<int> component;
        queue<int> bfsQueue;
        bfsQueue.push(start);
        seen[start] = true;

        while (!bfsQueue.empty()) {
            int cur = bfsQueue.front();
            bfsQueue.pop();
            component.push_back(cur);
            for (int nb = 0; nb < numCities; ++nb) {
                if (nb != cur && !seen[nb] && solution[getVarIndex(cur, nb)] > threshold) {
                    seen[nb] = true;
                    bfsQueue.push(nb);
                }
            }
        }
        components.push_back(component);
    }
    return components;
}

LowerBound ClpSolver::solveRelaxation(int maxRounds, bool verbose) {
    if (numCities < 3) {
        throw InvalidConfiguration("La relajacion LP necesita al menos 3 ciudades");
    }

    ClpSimplex model;
    model.setLogLevel(0); // 0 = Silencioso, 1 = Prints de COIN-OR

    // 1. Columnas: una por arista, relajadas entre 0 y 1.
    //    Con matriz asimétrica se usa el menor de los dos sentidos.
    model.resize(0, numVariables);
    double* objective = model.objective();
    double* colLower = model.columnLower();
    double* colUpper = model.columnUpper();

    for (int i = 0; i < numCities; ++i) {
        for (int j = i + 1; j < numCities; ++j) {
            int idx = getVarIndex(i, j);
            objective[idx] = min(parserData->getDistance(i, j), parserData->getDistance(j, i));
            colLower[idx] = 0.0;
            colUpper[idx] = 1.0;
        }
    }

    // 2. Grado 2 en cada ciudad
    addDegreeRows(model);

    // 3. Resolver y separar subtours hasta que el soporte sea conexo
    LowerBound bound;
    model.initialSolve();

    while (true) {
        ++bound.rounds;
        if (!model.isProvenOptimal()) {
            throw SearchFailure("CLP no alcanzo el optimo de la relajacion (estado " +
                                to_string(model.status()) + ")");
        }
        bound.value = model.objectiveValue();

        vector<vector<int>> components = supportComponents(model.primalColumnSolution(), 1e-6);
        if (verbose) {
            cout << "[CLP] Ronda " << bound.rounds << " | LB: " << fixed << setprecision(3)
                 << bound.value << " | Componentes: " << components.size() << endl;
        }
        if (components.size() == 1) {
            bound.connected = true;
            break;
        }
        if (bound.rounds >= maxRounds) break;

        // Corte de subtour: al menos 2 aristas cruzan la frontera de S
        CoinBuild build;
        for (const auto& S : components) {
            vector<bool> inside(numCities, false);
            for (int v : S) inside[v] = true;

            vector<int> indices; vector<double> elements;
            for (int u : S) {
                for (int v = 0; v < numCities; ++v) {
                    if (!inside[v]) { indices.push_back(getVarIndex(u, v)); elements.push_back(1.0); }
                }
            }
            build.addRow(indices.size(), indices.data(), elements.data(), 2.0, COIN_DBL_MAX);
            ++bound.cutsAdded;
        }
        model.addRows(build);
        model.dual();
    }

    if (verbose) {
        cout << "\n--- Variables Activas (x_e > 0.01) ---" << endl;
        const double* solution = model.primalColumnSolution();
        for (int i = 0; i < numCities; ++i) {
            for (int j = i + 1; j < numCities; ++j) {
                double v = solution[getVarIndex(i, j)];
                if (v > 0.01) {
                    cout << "Arista " << i + 1 << " - " << j + 1
                         << " : " << fixed << setprecision(3) << v << endl;
                }
            }
        }
    }

    return bound;
}
