#include "driver.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>

#include "error.hpp"
#include "file.hpp"
#include "lexer.hpp"
#include "parser.hpp"

std::set<ErrorInfo> error_set;

namespace jack::driver
{
    std::vector<fs::path> collect_inputs(const fs::path &input)
    {
        std::vector<fs::path> inputs;
        if (fs::is_directory(input))
        {
            for (const auto &entry : fs::directory_iterator(input))
            {
                if (entry.is_regular_file() && entry.path().extension() == ".jack")
                {
                    inputs.push_back(entry.path());
                }
            }
            std::sort(inputs.begin(), inputs.end());
        }
        else
        {
            inputs.push_back(input);
        }
        return inputs;
    }

    std::string token_listing(std::string_view text)
    {
        lexer::Lexer lexer(text);
        std::ostringstream os;
        os << "<tokens>" << std::endl;
        for (const auto &token : lexer.tokenize())
        {
            os << token << std::endl;
        }
        os << "</tokens>" << std::endl;
        return os.str();
    }

    std::string render_tree(const ast::ASTNode &tree, bool compact)
    {
        if (compact)
        {
            return ast::to_xml(tree) + "\n";
        }
        std::ostringstream os;
        tree.print_tree(os);
        return os.str();
    }

    void analyze(const fs::path &path, const Options &options)
    {
        const auto source = read_source(path);
        const auto dir = options.out_dir.empty() ? path.parent_path() : options.out_dir;
        const auto stem = path.stem().string();

        if (options.tokens)
        {
            write_output(dir / (stem + "T.xml"), token_listing(source));
        }

        lexer::Lexer lexer(source);
        parser::Parser parser(&lexer);
        const auto tree = parser.compile_class();
        write_output(dir / (stem + ".xml"), render_tree(*tree, options.compact));
    }

    int analyze_all(const fs::path &input, const Options &options, std::ostream &log)
    {
        std::vector<fs::path> inputs;
        try
        {
            inputs = collect_inputs(input);
            if (inputs.empty())
            {
                error_report(input.string(), 0, "no .jack files found");
            }
        }
        catch (const fs::filesystem_error &e)
        {
            error_report(input.string(), 0, e.what());
        }

        for (const auto &path : inputs)
        {
            try
            {
                analyze(path, options);
                log << "analyzed " << path.string() << std::endl;
            }
            catch (const error::ParseError &e)
            {
                error_report(path.string(), e.line(), e.what());
            }
            catch (const std::runtime_error &e)
            {
                error_report(path.string(), 0, e.what());
            }
        }
        return error_set.empty() ? 0 : 1;
    }
} // namespace jack::driver
