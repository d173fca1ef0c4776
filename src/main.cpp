#include "engine/Engine.hpp"
#include "engine/Log.hpp"

#include <iostream>

int main(int argc, char** argv) {
    delve::Engine engine;

    const char* configPath = argc > 1 ? argv[1] : "config.json";
    if (!engine.init(configPath)) {
        return 1;
    }

    LOG_INFO("Commands: w/a/s/d move, . wait, u use item, x quit");

    engine.run(std::cin);
    engine.shutdown();

    return 0;
}
