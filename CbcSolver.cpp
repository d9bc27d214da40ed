#include "CbcSolver.h"
#include "Errors.h"
#include "GreedyBuilder.h"
#include "SubtourCut.h"
#include <iostream>
#include <chrono>
#include <coin/OsiClpSolverInterface.hpp>
#include <coin/CbcModel.hpp>
#include <coin/CoinPackedMatrix.hpp>
// Cortes internos de CBC/CGL
#include <coin/CglGomory.hpp>

using namespace std;
using chrono::steady_clock;
using chrono::duration;

CbcSolver::CbcSolver(const Parser* parser) : parserData(parser) {
    numCities = parserData->getDimension();
    // Variables X_ij (N * N) + Variables U_i (N - 1) para MTZ
    numVariables = (numCities * numCities) + (numCities - 1);
}

int CbcSolver::getVarIndex(int i, int j) const {
    return i * numCities + j;
}

int CbcSolver::getUIndex(int i) const {
    return (numCities * numCities) + (i - 1);
}

Tour CbcSolver::convertToTour(const double* solution, int startCity) const {
    Tour tour(startCity, parserData);
    int curr = startCity;
    for (int step = 1; step < numCities; ++step) {
        int next = -1;
        for (int k = 0; k < numCities; ++k) {
            if (curr != k && solution[getVarIndex(curr, k)] > 0.5) {
                next = k;
                break;
            }
        }
        if (next == -1 || next == startCity) break;
        tour.addCity(next);
        curr = next;
    }
    return tour;
}

ExactResult CbcSolver::solve(int startCity, double timeLimitSeconds,
                             const vector<int>& warmStartOrder, bool verbose) {
    if (numCities < 3) {
        throw InvalidConfiguration("CBC necesita al menos 3 ciudades");
    }
    if (startCity < 0 || startCity >= numCities) {
        throw InvalidConfiguration("Ciudad inicial fuera de rango para CBC");
    }
    auto inicio = steady_clock::now();

    // =========================================================
    // 1. Interfaz OSI (CLP como solver LP interno de CBC)
    // =========================================================
    OsiClpSolverInterface osi;
    osi.setHintParam(OsiDoReducePrint, true); // Silenciar output de CLP

    // =========================================================
    // 2. Variables
    // =========================================================
    vector<double> objective(numVariables, 0.0);
    vector<double> colLower(numVariables, 0.0);
    vector<double> colUpper(numVariables, 1.0);

    for (int i = 0; i < numCities; ++i) {
        for (int j = 0; j < numCities; ++j) {
            int idx = getVarIndex(i, j);
            objective[idx] = parserData->getDistance(i, j);
            if (i == j) colUpper[idx] = 0.0; // Sin autoloops
        }
    }
    // U_i: posición de la ciudad i en el ciclo (la ciudad 0 es la referencia)
    for (int i = 1; i < numCities; ++i) {
        int idx = getUIndex(i);
        colLower[idx] = 1.0;
        colUpper[idx] = numCities - 1;
    }

    // =========================================================
    // 3. Restricciones
    // =========================================================
    CoinPackedMatrix matrix(false, 0, 0);
    matrix.setDimensions(0, numVariables);
    vector<double> rowLowerVec;
    vector<double> rowUpperVec;

    // A. Grado de salida y entrada exactamente 1
    for (int i = 0; i < numCities; ++i) {
        vector<int>    indicesOut, indicesIn;
        vector<double> elementsOut, elementsIn;
        for (int j = 0; j < numCities; ++j) {
            if (i != j) {
                indicesOut.push_back(getVarIndex(i, j)); elementsOut.push_back(1.0);
                indicesIn.push_back(getVarIndex(j, i));  elementsIn.push_back(1.0);
            }
        }
        matrix.appendRow(indicesOut.size(), indicesOut.data(), elementsOut.data());
        rowLowerVec.push_back(1.0); rowUpperVec.push_back(1.0);

        matrix.appendRow(indicesIn.size(), indicesIn.data(), elementsIn.data());
        rowLowerVec.push_back(1.0); rowUpperVec.push_back(1.0);
    }

    // B. MTZ
    for (int i = 1; i < numCities; ++i) {
        for (int j = 1; j < numCities; ++j) {
            if (i == j) continue;
            vector<int>    indices  = {getUIndex(i), getUIndex(j), getVarIndex(i, j)};
            vector<double> elements = {1.0, -1.0, (double)(numCities - 1)};
            matrix.appendRow(indices.size(), indices.data(), elements.data());
            rowLowerVec.push_back(-COIN_DBL_MAX); rowUpperVec.push_back(numCities - 2);
        }
    }

    // C. Prohibición de 2-ciclos: X_ij + X_ji <= 1
    for (int i = 0; i < numCities; ++i) {
        for (int j = i + 1; j < numCities; ++j) {
            vector<int>    indices  = {getVarIndex(i, j), getVarIndex(j, i)};
            vector<double> elements = {1.0, 1.0};
            matrix.appendRow(indices.size(), indices.data(), elements.data());
            rowLowerVec.push_back(-COIN_DBL_MAX); rowUpperVec.push_back(1.0);
        }
    }

    osi.loadProblem(matrix, colLower.data(), colUpper.data(), objective.data(),
                    rowLowerVec.data(), rowUpperVec.data());

    // =========================================================
    // 4. Integralidad de X_ij (U_i quedan continuas)
    // =========================================================
    for (int i = 0; i < numCities; ++i)
        for (int j = 0; j < numCities; ++j)
            osi.setInteger(getVarIndex(i, j));

    CbcModel model(osi);
    model.setLogLevel(verbose ? 1 : 0);

    // =========================================================
    // 5. Warm Start: tour recibido o vecino más cercano
    // =========================================================
    Tour warm;
    if (!warmStartOrder.empty()) {
        warm = Tour(startCity, warmStartOrder, parserData);
    } else {
        GreedyBuilder builder(parserData);
        warm = builder.buildTour(startCity);
    }

    if (warm.isValid()) {
        vector<double> mipStart(numVariables, 0.0);
        const auto& path = warm.getPath();
        for (size_t k = 0; k + 1 < path.size(); ++k)
            mipStart[getVarIndex(path[k], path[k + 1])] = 1.0;

        // U_i = posición a partir de la ciudad 0 en el mismo ciclo
        int zeroPos = 0;
        for (size_t k = 0; k + 1 < path.size(); ++k)
            if (path[k] == 0) zeroPos = static_cast<int>(k);
        for (int k = 1; k < numCities; ++k) {
            int city = path[(zeroPos + k) % numCities];
            mipStart[getUIndex(city)] = k;
        }

        model.setBestSolution(mipStart.data(), numVariables, warm.getTotalCost());
        model.setCutoff(warm.getTotalCost() + 1e-6);
        if (verbose) {
            cout << "[CBC] Warm start inyectado: " << warm.getTotalCost() << endl;
        }
    } else {
        cerr << "AVISO: warm start invalido para CBC, se ignora." << endl;
    }

    // =========================================================
    // 6. Cortes: DFJ propios + Gomory
    // =========================================================
    SubtourCutGenerator subtourGen(numCities);
    model.addCutGenerator(&subtourGen, 1, "SubtourDFJ");

    CglGomory gomory;
    gomory.setLimit(100);
    model.addCutGenerator(&gomory, 1, "Gomory");

    model.setMaximumSeconds(timeLimitSeconds);

    // =========================================================
    // 7. Resolver
    // =========================================================
    if (verbose) {
        cout << "\n=== INICIANDO CBC BRANCH & CUT (MTZ + DFJ) ===" << endl;
    }
    model.branchAndBound();

    ExactResult result;
    result.provenOptimal = model.isProvenOptimal();
    result.lowerBound = model.getBestPossibleObjValue();
    result.nodes = model.getNodeCount();

    bool hasRealSolution = (model.bestSolution() != nullptr)
                           && (model.getObjValue() < 1e+49);
    if (hasRealSolution) {
        result.tour = convertToTour(model.bestSolution(), startCity);
    }
    if (!result.tour.isValid()) {
        // Sin solución entera propia: se devuelve el warm start
        if (!warm.isValid()) {
            throw SearchFailure("CBC no encontro solucion entera y no hay warm start valido");
        }
        result.tour = warm;
    }
    result.elapsedSeconds = duration<double>(steady_clock::now() - inicio).count();

    if (verbose) {
        cout << (result.provenOptimal ? "CBC encontro solucion OPTIMA." : "CBC finalizo por limite de tiempo.")
             << " Costo: " << result.tour.getTotalCost()
             << " | LB: " << result.lowerBound
             << " | Nodos: " << result.nodes << endl;
    }
    return result;
}
