#include "cmd_run.h"
#include "cmd_serve.h"

#include <iostream>
#include <string>

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "cordon_cli <run|grade|serve> ...\n";
        return 2;
    }
    std::string cmd = argv[1];
    if (cmd == "run") return cmd_run(argc, argv);
    if (cmd == "grade") return cmd_grade(argc, argv);
    if (cmd == "serve") return cmd_serve(argc, argv);
    std::cerr << "unknown command: " << cmd << "\n";
    return 2;
}
