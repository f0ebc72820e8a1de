#include "config.h"

#include <cstdio>
#include <stdexcept>

static int parse_int(const std::string& option, const std::string& text, int low, int high) {
  size_t used = 0;
  int value = 0;
  try {
    value = std::stoi(text, &used);
  } catch (const std::exception&) {
    throw std::invalid_argument(option + " expects a number, got '" + text + "'");
  }
  if (used != text.size() || value < low || value > high) {
    throw std::invalid_argument(option + " must be between " + std::to_string(low) +
                                " and " + std::to_string(high));
  }
  return value;
}

Config parse_args(int argc, char** argv) {
  Config config;

  for (int i = 1; i < argc; i++) {
    std::string arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      config.show_help = true;
      return config;
    }

    if (arg == "--scale" || arg == "--trace" || arg == "--frames") {
      if (i + 1 >= argc) {
        throw std::invalid_argument(arg + " needs a value");
      }
      std::string value = argv[++i];
      if (arg == "--scale") {
        config.scale = parse_int(arg, value, 1, 8);
      } else if (arg == "--frames") {
        config.headless_frames = parse_int(arg, value, 1, 1000000);
      } else {
        config.trace_path = value;
      }
    } else if (arg == "--no-odd-skip") {
      config.odd_frame_skip = false;
    } else if (arg.size() > 1 && arg[0] == '-') {
      throw std::invalid_argument("unknown option " + arg);
    } else if (config.rom_path.empty()) {
      config.rom_path = arg;
    } else {
      throw std::invalid_argument("only one ROM file can be given");
    }
  }

  if (config.rom_path.empty()) {
    throw std::invalid_argument("no ROM file given");
  }
  return config;
}

void print_usage(const char* program) {
  printf("Usage: %s [options] <rom_file>\n", program);
  printf("  --scale N      window scale, 1-8 (default 2)\n");
  printf("  --trace FILE   log every CPU instruction to FILE ('-' for stdout)\n");
  printf("  --no-odd-skip  keep dot 340 of the pre-render line on odd frames\n");
  printf("  --frames N     run N frames without a window and print a frame checksum\n");
  printf("  -h, --help     show this message\n");
}
