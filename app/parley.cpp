#include "cli.hpp"

#include <exception>
#include <iostream>

int main(int argc, char** argv) {
    try {
        parley::startup_config cfg{};
        if (auto cli_result = parley::cli::parse_cli(argc, argv, cfg)) {
            return *cli_result;
        }

        return parley::cli::run_session(cfg);
    } catch (const parley::invalid_configuration_error& e) {
        // same exit status as a command line usage error
        std::cerr << "config: " << e.what() << '\n';
        return 2;
    } catch (const parley::unknown_session_error& e) {
        std::cerr << "resume: " << e.what() << '\n';
        return 1;
    } catch (std::exception& e) {
        std::cerr << "fatal: " << e.what() << '\n';
        return 1;
    } catch (...) {
        std::cerr << "fatal: unknown exception\n";
        return 1;
    }
}
