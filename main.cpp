#include <string>
#include <vector>

#include "app/ChlogApp.hpp"

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    chlog::app::ChlogApp app;
    return app.Run(args);
}
