#include "app/application.hpp"
#include "config/viewer_config.hpp"
#include "core/log.hpp"
#include <iostream>
#include <cstdlib>
#include <exception>

namespace {
void wv_terminate_handler() {
    std::cerr << "std::terminate invoked" << std::endl;
    if (auto current = std::current_exception()) {
        try {
            std::rethrow_exception(current);
        } catch (const std::exception& e) {
            std::cerr << "  exception: " << e.what() << std::endl;
        } catch (...) {
            std::cerr << "  exception: unknown" << std::endl;
        }
    } else {
        std::cerr << "  no current exception" << std::endl;
    }
    std::abort();
}
}

int main(int argc, char** argv) {
    std::set_terminate(wv_terminate_handler);

    auto config = wv::config::default_config();
    wv::config::apply_logging(config);

    try {
        wv::app::Application app(argc, argv, std::move(config));
        return app.run();
    } catch (const std::exception& e) {
        wv::log::critical(std::string("Unhandled exception: ") + e.what());
        return 1;
    }
}
