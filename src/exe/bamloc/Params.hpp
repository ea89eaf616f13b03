#pragma once

#include <string>

struct Params {
    std::string in_path;
    std::string target_index;
    std::string out_path;
    std::string out_format;
    bool sam_input;
    bool locations;
    bool quiet;
};

Params parse_cmdline(int argc, char** argv);
