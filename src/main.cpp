// src/main.cpp

#include <clocale>
#include <cxxopts.hpp>
#include <iostream>

#include "CLI.h"

#ifndef PKGREPORT_LOCALEDIR
#define PKGREPORT_LOCALEDIR "/usr/share/locale"
#endif

int main(int argc, char* argv[]) {
    std::setlocale(LC_ALL, "");
    pkgreport::GettextTranslator::bindDomain("pkgreport", PKGREPORT_LOCALEDIR);

    try {
        pkgreport::CLI cli(argc, argv);
        return cli.run();
    } catch (const cxxopts::exceptions::exception& e) {
        std::cerr << "\033[31merror:\033[0m " << e.what() << "\n";
        return 1;
    }
}
