#include "app/KelvinApp.hpp"

using namespace kelvin;

int main(int argc, char** argv) {
    app::KelvinApp application;
    return application.Run(argc, argv);
}
