#include <iostream>
#include <string>
#include <vector>

#include "app/DistillDaemon.hpp"

namespace {

void PrintUsage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " [--root DIR] <command>\n"
              << "Commands:\n"
              << "  run                 poll the inbox until interrupted (default)\n"
              << "  once                run a single tick and exit\n"
              << "  status              list file records and their progress\n"
              << "  delete <hash>       delete a completed or failed record (unique prefix accepted)\n"
              << "  submit <file>       copy a file into the inbox and queue it\n";
}

} // namespace

int main(int argc, char** argv) {
    std::string root = ".";
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--root" && i + 1 < argc) {
            root = argv[++i];
        } else if (a == "-h" || a == "--help") {
            PrintUsage(argv[0]);
            return 0;
        } else {
            args.push_back(a);
        }
    }

    std::string command = args.empty() ? "run" : args[0];
    bool needsArgument = command == "delete" || command == "submit";
    if (needsArgument && args.size() < 2) {
        PrintUsage(argv[0]);
        return 64;
    }

    distill::app::DistillDaemon daemon(root);
    if (!daemon.initialize()) {
        return 1;
    }

    if (command == "run") return daemon.run();
    if (command == "once") return daemon.runOnce();
    if (command == "status") return daemon.printStatus(std::cout);
    if (command == "delete") return daemon.deleteRecord(args[1]);
    if (command == "submit") return daemon.submitFile(args[1]);

    PrintUsage(argv[0]);
    return 64;
}
