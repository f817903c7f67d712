#include <exception>
#include <iostream>

#include "filetree/app.h"

int main(int argc, char** argv) {
    try {
        filetree::App app;
        return app.run(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "filetree: fatal: " << e.what() << '\n';
        return 2;
    }
}
