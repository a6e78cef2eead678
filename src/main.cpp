#include <exception>
#include <iostream>
#include "cron_app.h"

int main(int argc, char* argv[]) {
    try {
        dcron::CronApp app(argc > 1 ? argv[1] : "");
        return app.run();
    } catch (const std::exception& ex) {
        std::cerr << "dcrond: fatal: " << ex.what() << std::endl;
        return 1;
    }
}
