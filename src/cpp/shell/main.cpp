#include "thoughts_shell/cli_parser.h"
#include "thoughts_shell/shell_app.h"
#include <thoughts/version.h>
#include <iostream>
#include <exception>

int main(int argc, char* argv[]) {
    thoughts_shell::CLIParser parser;
    parser.parse(argc, argv);
    if (!parser.should_continue()) {
        return parser.get_exit_code();
    }

    if (parser.should_show_version()) {
        std::cout << "thoughts version " << THOUGHTS_VERSION_STRING << std::endl;
        return 0;
    }

    try {
        thoughts_shell::ShellApp app(parser.get_config());
        return app.run();
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
