#include "cmd_scrape.h"

#include <iostream>
#include <string>

static int cmd_health() {
    std::cout << "{\"status\":\"healthy\",\"service\":\"scrapeguard\"}\n";
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "scrapeguard_cli <scrape|exec|check|policy|health> ...\n";
        return 2;
    }
    std::string cmd = argv[1];
    if (cmd == "scrape") return cmd_scrape(argc, argv);
    if (cmd == "exec") return cmd_exec(argc, argv);
    if (cmd == "check") return cmd_check(argc, argv);
    if (cmd == "policy") return cmd_policy(argc, argv);
    if (cmd == "health") return cmd_health();
    std::cerr << "unknown command: " << cmd << "\n";
    return 2;
}
