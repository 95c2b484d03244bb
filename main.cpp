#include <getopt.h>

#include <filesystem>
#include <iostream>

#include "driver.hpp"
#include "file.hpp"

namespace
{
void print_usage()
{
    std::cerr << "usage: jack_analyzer [-t] [-c] [-o dir] <file.jack | dir>\n\n";
    std::cerr << "  -t        also write XxxT.xml with the token listing\n";
    std::cerr << "  -c        write the parse tree without indentation\n";
    std::cerr << "  -o <dir>  output directory (default: beside each input)\n";
}
} // namespace

int main(int argc, char **argv)
{
    jack::driver::Options options;
    int opt;
    while ((opt = getopt(argc, argv, "tco:")) != -1)
    {
        switch (opt)
        {
        case 't':
            options.tokens = true;
            break;
        case 'c':
            options.compact = true;
            break;
        case 'o':
            options.out_dir = optarg;
            break;
        default:
            print_usage();
            return 1;
        }
    }
    if (optind >= argc)
    {
        std::cerr << "error: no input file\n";
        print_usage();
        return 1;
    }

    const std::filesystem::path input(argv[optind]);
    if (!std::filesystem::exists(input))
    {
        std::cerr << "error: " << input.string() << " does not exist\n";
        return 1;
    }

    const int status = jack::driver::analyze_all(input, options, std::cout);
    output_errors(std::cerr);
    return status;
}
