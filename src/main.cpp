#include "core/application.hpp"

int main(int argc, char* argv[]) {
    sgba::Application app;

    if (!app.initialize(argc, argv)) {
        app.shutdown();
        return 1;
    }

    if (app.is_running()) {
        app.run();
    }

    app.shutdown();
    return 0;
}
