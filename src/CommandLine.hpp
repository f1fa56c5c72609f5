#ifndef COMMAND_LINE_HPP
#define COMMAND_LINE_HPP

#include "Config.hpp"

#include <iostream>
#include <string>

class CommandLine
{
public:
    enum Result
    {
        CONTINUE,   // Config filled in, run the program
        EXIT_OK,    // --help was printed
        EXIT_USAGE  // Invalid arguments, message and usage printed
    };

    static Result parse(int argc, char *argv[], Config &config,
                        std::ostream &out = std::cout, std::ostream &err = std::cerr);

    static void print_usage(const char *prog, std::ostream &out);
    static void print_help(const char *prog, std::ostream &out);

private:
    static bool parse_int(const char *text, int &value);
};

#endif // COMMAND_LINE_HPP
