#ifndef JACK_DRIVER_HPP
#define JACK_DRIVER_HPP

#include <filesystem>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "ast.hpp"

namespace jack::driver
{
    namespace fs = std::filesystem;

    struct Options
    {
        // also write XxxT.xml with the token listing
        bool tokens = false;
        // write the tree without indentation
        bool compact = false;
        // empty means beside each input
        fs::path out_dir;
    };

    // a directory yields its .jack files in name order, anything else itself
    std::vector<fs::path> collect_inputs(const fs::path &input);

    std::string token_listing(std::string_view text);
    std::string render_tree(const ast::ASTNode &tree, bool compact);

    // parses one file and writes Xxx.xml (and XxxT.xml); throws on failure
    void analyze(const fs::path &path, const Options &options);

    // Runs analyze over every input under `input`. Failures go to error_set
    // instead of propagating. Returns the process exit status.
    int analyze_all(const fs::path &input, const Options &options, std::ostream &log);
} // namespace jack::driver

#endif // JACK_DRIVER_HPP
