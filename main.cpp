#include "app/DropKeeperApp.hpp"

int main(int argc, char** argv) {
    dropkeeper::app::DropKeeperApp app;
    return app.Run(argc, argv);
}
