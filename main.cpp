#include "app/BePlannerApp.hpp"

int main(int argc, char* argv[]) {
    beplanner::app::BePlannerApp app;
    return app.Run(argc, argv);
}
