#pragma once
#include "Config.h"
#include <functional>
#include <iosfwd>
#include <string>
#include <vector>

namespace open_ports {

class ArgumentParser {
public:
    ArgumentParser();

    // Fills cfg from argv. Returns false when the program must stop before scanning:
    // --help / --version (exit_code()==0) or a usage error (exit_code()==2, error() set).
    bool parse(int argc, char** argv, Config& cfg);

    int exit_code() const { return exit_code_; }
    const std::string& error() const { return error_; }

    void print_help(std::ostream& os) const;
    static void print_version(std::ostream& os);

private:
    enum class ArgKind { None, String, Int, OptionalInt };
    struct FlagSpec {
        const char* name;
        char short_name; // 0 = long only
        ArgKind kind;
        const char* value_hint;
        const char* help;
        std::function<void(Config&, const std::string&)> apply;
    };

    const FlagSpec* find_long(const std::string& name) const;
    const FlagSpec* find_short(char c) const;
    bool apply(const FlagSpec& spec, const std::string& value, Config& cfg);
    bool fail(const std::string& msg);
    bool parse_short_bundle(const std::string& arg, int argc, char** argv, int& i, Config& cfg);

    std::vector<FlagSpec> specs_;
    int exit_code_ = 0;
    std::string error_;
};

}
