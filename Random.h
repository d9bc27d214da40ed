#ifndef RANDOM_H
#define RANDOM_H

#include <random>

// Cada corrida tiene su propio generador: nada de estado global, así dos
// corridas con la misma semilla evalúan exactamente los mismos candidatos.
inline int randint(std::mt19937& rng, int a, int b) {
    return std::uniform_int_distribution<int>(a, b)(rng);
}

inline double randreal(std::mt19937& rng) {
    return std::uniform_real_distribution<double>(0.0, 1.0)(rng);
}

#endif // RANDOM_H
