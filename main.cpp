#include "app/CopyCheckApp.hpp"

int main(int argc, char** argv) {
    copycheck::app::CopyCheckApp app;
    return app.Run(argc, argv);
}
