#ifndef MENU_H
#define MENU_H

#include <iostream>
#include <vector>
#include <string>
#include <memory>
#include <chrono>

// Incluimos los headers del core del proyecto
#include "Parser.h"
#include "Parameters.h"
#include "Experiment.h"
#include "TourEvaluator.h"
#include "ClpSolver.h"
#include "CbcSolver.h"
#include "Pipeline.h"

class Menu {
private:
    std::unique_ptr<Parser> parserGlobal;
    ExperimentConfig configGlobal;
    bool instanciaCargada;
    double mejorDistanciaGlobal;   // 0 = todavía no hay resultados
    std::string mejorDescripcion;

    // Métodos auxiliares privados
    void mostrarEncabezado() const;
    void reportarTiempo(double tiempoTotal) const;
    void actualizarMejorSolucion(double distancia, const std::string& descripcion);

    // Opciones del Menú
    void cargarInstancia();
    void configurarParametros();
    void ejecutarExperimento(ExperimentConfig config);
    void ejecutarCotas();
    void ingresoManual();

public:
    explicit Menu(const ExperimentConfig& config);
    void inicializar();  // El bucle principal del programa
};

#endif // MENU_H
