#ifndef SUBTOUR_CUT_H
#define SUBTOUR_CUT_H

#include <vector>
#include <coin/CglCutGenerator.hpp>  // Clase base del plugin CBC
#include <coin/OsiSolverInterface.hpp>
#include <coin/OsiCuts.hpp>
#include <coin/OsiRowCut.hpp>

// =============================================================================
// SubtourCutGenerator
// =============================================================================
// Generador de cortes DFJ (Dantzig-Fulkerson-Johnson) registrado en CBC como
// plugin CglCutGenerator. CBC lo invoca en cada nodo del árbol.
//
// El modelo de CbcSolver ya excluye subtours con MTZ, pero su relajación LP
// es débil. Para cada conjunto S de ciudades que forma una componente
// separada en la solución LP se agrega:
//       sum_{i in S, j in S, i!=j}  x_ij  <=  |S| - 1
//
// Uso en CbcSolver.cpp (antes de model.branchAndBound()):
//
//   SubtourCutGenerator subtourGen(numCities);
//   model.addCutGenerator(&subtourGen, 1, "SubtourDFJ");
// =============================================================================

class SubtourCutGenerator : public CglCutGenerator {
public:
    explicit SubtourCutGenerator(int numCities);

    // -------------------------------------------------------------------------
    // generateCuts  [override obligatorio de CglCutGenerator]
    //
    // Lee la solución LP del nodo, detecta componentes separadas y agrega
    // los cortes DFJ al objeto `cs`.
    // -------------------------------------------------------------------------
    void generateCuts(const OsiSolverInterface& si,
                      OsiCuts& cs,
                      const CglTreeInfo info = CglTreeInfo()) override;

    // CBC toma ownership de la copia y la libera
    CglCutGenerator* clone() const override;

    ~SubtourCutGenerator() override = default;

    // -------------------------------------------------------------------------
    // findSubtours
    //
    // Grafo de soporte no dirigido: arista {i,j} activa si
    // sol[i*n+j] + sol[j*n+i] > threshold. Si el grafo tiene más de una
    // componente conexa, todas son conjuntos inválidos.
    // Retorna lista de conjuntos S (índices base 0).
    // -------------------------------------------------------------------------
    std::vector<std::vector<int>> findSubtours(const double* sol, double threshold) const;

private:
    int n; // Número de ciudades

    // DEBE coincidir con CbcSolver::getVarIndex (= i * numCities + j)
    inline int getVarIndex(int i, int j) const { return i * n + j; }
};

#endif // SUBTOUR_CUT_H
