#pragma once
#include <string>

// Command line settings for the frontend
struct Config {
    std::string rom_path;
    int scale = 2;              // window is 256x240 times this
    std::string trace_path;     // empty = no CPU trace, "-" = stdout
    bool odd_frame_skip = true;
    int headless_frames = 0;    // > 0 runs without a window and prints a frame checksum
    bool show_help = false;
};

// Throws std::invalid_argument on anything it doesn't understand
Config parse_args(int argc, char** argv);

void print_usage(const char* program);
