#ifndef JACK_FILE_HPP
#define JACK_FILE_HPP

#include <filesystem>
#include <fstream>
#include <ostream>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

struct ErrorInfo
{
    std::string file;
    size_t line;
    std::string message;

    ErrorInfo(std::string file, size_t line, std::string message)
        : file(std::move(file)), line(line), message(std::move(message)) {}

    bool operator<(const ErrorInfo &other) const
    {
        // by file, then from small to big line number
        if (file != other.file)
        {
            return file < other.file;
        }
        if (line != other.line)
        {
            return line < other.line;
        }
        return message < other.message;
    }
};

extern std::set<ErrorInfo> error_set;

inline void error_report(const std::string &file, size_t line, const std::string &message) {
    error_set.emplace(file, line, message);
}

inline void output_errors(std::ostream &os) {
    for (const auto &err : error_set) {
        os << err.file << ':' << err.line << ": " << err.message << std::endl;
    }
}

inline std::string read_source(const std::filesystem::path &path)
{
    std::ifstream src_file(path);
    if (!src_file.is_open())
    {
        throw std::runtime_error("cannot open " + path.string());
    }
    std::stringstream buffer;
    buffer << src_file.rdbuf();
    return buffer.str();
}

inline void write_output(const std::filesystem::path &path, const std::string &content)
{
    std::ofstream out_file(path);
    if (!out_file.is_open())
    {
        throw std::runtime_error("cannot write " + path.string());
    }
    out_file << content;
}

#endif
