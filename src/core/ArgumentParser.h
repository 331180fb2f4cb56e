#pragma once
#include "Config.h"
#include <functional>
#include <string>
#include <vector>

namespace lan_scan {

class ArgumentParser {
public:
    ArgumentParser();
    // Returns false when the program should exit right away: --help/--version
    // (exit_code() == 0) or a malformed command line (exit_code() == 2).
    bool parse(int argc, char** argv, Config& cfg);
    int exit_code() const { return exit_code_; }
    void print_help() const;
private:
    enum class ArgKind { None, String, Int, Double, CSV };
    struct FlagSpec {
        const char* name;
        ArgKind kind;
        const char* help;
        std::function<void(Config&, const std::string&)> apply;
    };
    const FlagSpec* find_spec(const std::string& flag) const;
    std::vector<FlagSpec> specs_;
    int exit_code_ = 0;
};

}
