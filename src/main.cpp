#include <exception>
#include <iostream>

#include "gitwip/app.h"

int main(int argc, char** argv) {
    try {
        gitwip::App app;
        return app.run(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "gitwip: error: " << e.what() << "\n";
        return 2;
    }
}
