// folio.cpp : command-line entry point for the static site generator
//
#include "../folio/config.hpp"
#include "../folio/reporter.hpp"
#include "../folio/site.hpp"

#include <iostream>

using std::cout;
using std::endl;

int XMain(int argc, char* argv[]) {
    Config::Flags_ flags;
    std::string command;
    if (!Config::ReadCommandLine(argc, argv, &flags, &command)) {
        cout << Config::USAGE;
        return 0;
    }
    const Config_ config = Config::Resolve(flags);
    const ConsoleReporter_ reporter(config.verbosity_, cout);

    if (command == "clean")
        Site::Clean(config, reporter);
    else
        Site::Build(config, reporter);
    cout.flush();
    return 0;
}

int main(int argc, char* argv[]) {
    try {
        return XMain(argc, argv);
    } catch (std::exception& e) {
        std::cerr << "Error:  " << e.what() << endl;
        return 1;
    }
}
