#include "smpsolib/core/solver.hpp"
#include <iostream>

int main(int argc, char *argv[]) {
    // 1. Instancia o Solver
    smpsolib::SMPSOSolver smpso;

    // 2. Inicializa (Lê CLI, Configs e Problema)
    int status = smpso.init(argc, argv);

    // Se houve erro de CLI (ex: --help ou arquivo não encontrado), encerra
    if (status != 0) return (status > 0) ? 0 : 1;

    // 3. Executa a otimização
    try {
        smpso.run();
    } catch (const std::exception &e) {
        std::cerr << "\nError: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
