#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include <unistd.h>

#include "app/config.hpp"
#include "app/shell_app.hpp"

int main(int argc, char **argv) {
    std::cout << std::unitbuf;
    std::cerr << std::unitbuf;

    std::vector<std::string> args(argv + 1, argv + argc);
    const bool input_is_terminal = ::isatty(STDIN_FILENO) == 1;
    const int out_terminal = ::isatty(STDOUT_FILENO) == 1 ? STDOUT_FILENO : -1;
    const int err_terminal = ::isatty(STDERR_FILENO) == 1 ? STDERR_FILENO : -1;

    dimsh::SessionIo io{
        .in = std::cin,
        .out = std::cout,
        .err = std::cerr,
        .input_is_terminal = input_is_terminal,
        .out_terminal = out_terminal,
        .err_terminal = err_terminal,
        .line_editing = input_is_terminal,
    };

    dimsh::ShellApp app(std::move(args), io, dimsh::load_config(std::cerr));
    return app.run();
}
