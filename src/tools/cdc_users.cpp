#include <iostream>
#include <string>

#include "crypto_utils.h"

// =============================================================================
// cdc_users: print one credential line for the server's cdcusers file
// =============================================================================
static void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " [-h] USER PASSWORD\n"
              << "\nCDC user manager\n"
              << "\nPositional arguments:\n"
              << "  USER        Username\n"
              << "  PASSWORD    Password\n"
              << "\nAppend the output of this program to /var/cache/maxscale/<service name>/cdcusers\n";
}

int main(int argc, char* argv[]) {
    for (int i = 1; i < argc; i++) {
        std::string arg(argv[i]);
        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        }
    }

    if (argc != 3) {
        std::cerr << argv[0] << ": expected USER and PASSWORD\n";
        print_usage(argv[0]);
        return 2;
    }

    try {
        std::cout << encode_credentials(argv[1], argv[2]) << "\n";
    } catch (const std::exception& e) {
        std::cerr << argv[0] << ": " << e.what() << "\n";
        return 1;
    }
    return 0;
}
