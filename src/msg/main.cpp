#include "ipc/IpcClient.hpp"
#include "util/Platform.hpp"
#include <iostream>
#include <string>

using namespace lazybar;

namespace {

void print_usage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " <bar> <message>\n"
              << "\n"
              << "Messages:\n"
              << "  quit                 Stop the bar\n"
              << "  show | hide | toggle Map or unmap the bar window\n"
              << "  <panel>.<action>     Send an action to a panel\n"
              << "  #<l|c|r><index>.show|hide|toggle\n"
              << "                       Change a panel's visibility, e.g. #l0.hide\n";
}

}  // namespace

int main(int argc, char** argv) {
    if (argc == 2 && (std::string(argv[1]) == "-h" || std::string(argv[1]) == "--help")) {
        print_usage(argv[0]);
        return 0;
    }
    if (argc != 3) {
        print_usage(argv[0]);
        return 2;
    }

    std::string bar_name = argv[1];
    std::string message = argv[2];
    auto socket_path = util::Platform::get_ipc_socket_path(bar_name);

    auto raw = ipc::send_message(socket_path, message);
    if (!raw) {
        std::cerr << "Failed to reach bar " << bar_name << " at " << socket_path.string() << std::endl;
        return 1;
    }

    std::cout << *raw << std::endl;

    auto response = ipc::parse_response(*raw);
    if (!response) {
        std::cerr << "Malformed response from bar " << bar_name << std::endl;
        return 1;
    }
    return response->ok ? 0 : 1;
}
