#include <iostream>
#include <string>
#include <vector>

#include "app/QuireApp.hpp"

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    quire::app::QuireApp app(std::cout, std::cerr);
    return app.Run(args);
}
