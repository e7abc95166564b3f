#include "motd/motd.h"

#include <iostream>

int main(int argc, char *argv[]) {
    const std::string address = argc > 1 ? argv[1] : "127.0.0.1:19132";

    motd::MotdError error;
    const auto status = motd::FetchServerIdString(address, {}, &error);
    if (!status) {
        std::cerr << "Query failed: " << error.message << std::endl;
        return 1;
    }

    // -1 / -1 when the server left the player counts out.
    std::cout << status->motd << " (" << status->playerCount << " / " << status->maxPlayerCount << ")" << std::endl;
    return 0;
}
