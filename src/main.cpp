#include "redline/cli/app.hpp"

int main(int argc, char** argv) {
    redline::cli::App app;
    return app.run(argc, argv);
}
