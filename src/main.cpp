// main.cpp - ReelSync entry point
// Manifest in, one composed rehearsal recording out.

#include "core/Application.hpp"

#include <csignal>
#include <iostream>

namespace {

rs::Application* g_app = nullptr;

void onInterrupt(int) {
    if (g_app) {
        g_app->requestStop();
    }
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        rs::Application app(argc, argv);
        g_app = &app;

        auto opts = app.parseArgs();
        if (!opts) {
            std::cerr << "Error: " << opts.error().message << "\n";
            std::cerr << "Try --help for usage information.\n";
            return 1;
        }

        if (auto initResult = app.init(*opts); !initResult) {
            std::cerr << "Error: " << initResult.error().describe() << "\n";
            return 1;
        }

        // First Ctrl-C finishes the current segment and cancels
        std::signal(SIGINT, onInterrupt);
        const int code = app.exec();
        std::signal(SIGINT, SIG_DFL);
        g_app = nullptr;
        return code;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
