#include "SubtourCut.h"

#include <vector>
#include <queue>

#include <coin/OsiRowCut.hpp>
#include <coin/OsiCuts.hpp>
#include <coin/CglTreeInfo.hpp>

using namespace std;

SubtourCutGenerator::SubtourCutGenerator(int numCities) : n(numCities) {}

CglCutGenerator* SubtourCutGenerator::clone() const {
    return new SubtourCutGenerator(n);
}

vector<vector<int>> SubtourCutGenerator::findSubtours(const double* sol, double threshold) const {
    vector<vector<int>> components;
    vector<bool> processed(n, false);

    for (int start = 0; start < n; start++) {
        if (processed[start]) continue;

        // BFS para extraer la componente completa
        vector<int> component;
        queue<int> compQueue;
        compQueue.push(start);
        processed[start] = true;

        while (!compQueue.empty()) {
            int cur = compQueue.front();
            compQueue.pop();
            component.push_back(cur);

            for (int nb = 0; nb < n; nb++) {
                if (nb == cur || processed[nb]) continue;
                double flow = sol[getVarIndex(cur, nb)] + sol[getVarIndex(nb, cur)];
                if (flow > threshold) {
                    processed[nb] = true;
                    compQueue.push(nb);
                }
            }
        }
        components.push_back(component);
    }

    // Una sola componente: no hay subtour que cortar
    if (components.size() < 2) components.clear();
    return components;
}

// =============================================================================
// generateCuts
//
// Dos pasadas:
//   threshold = 0.5  : subtours en soluciones enteras (o casi)
//   threshold = 1e-4 : componentes del soporte fraccional
// =============================================================================
void SubtourCutGenerator::generateCuts(const OsiSolverInterface& si,
                                       OsiCuts& cs,
                                       const CglTreeInfo /*info*/) {
    const double* sol = si.getColSolution();
    if (!sol) return;

    const double thresholds[] = {0.5, 1e-4};

    for (double threshold : thresholds) {
        vector<vector<int>> subtours = findSubtours(sol, threshold);

        for (const auto& S : subtours) {
            if (S.size() < 2) continue; // No tiene sentido cortar un conjunto unitario

            // sum_{i in S, j in S, i!=j}  x_ij  <=  |S| - 1
            vector<int>    indices;
            vector<double> coefficients;
            indices.reserve(S.size() * (S.size() - 1));
            coefficients.reserve(S.size() * (S.size() - 1));

            for (int u : S) {
                for (int v : S) {
                    if (u != v) {
                        indices.push_back(getVarIndex(u, v));
                        coefficients.push_back(1.0);
                    }
                }
            }

            OsiRowCut cut;
            cut.setRow(static_cast<int>(indices.size()),
                       indices.data(),
                       coefficients.data());
            cut.setLb(-1.0e30);          // Sin cota inferior (desigualdad <=)
            cut.setUb(static_cast<double>(S.size() - 1));

            cs.insertIfNotDuplicate(cut);
        }
    }
}
