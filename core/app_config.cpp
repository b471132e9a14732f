#include "app_config.h"
#include "board.h"
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstring>
#include <iostream>

namespace {

// Strictly positive decimal integer, whole argument consumed
bool parsePositive(const char* text, int& out) {
    if (!text || *text == '\0') return false;

    char* end = nullptr;
    errno = 0;
    long value = std::strtol(text, &end, 10);
    if (errno != 0 || *end != '\0' || value <= 0 || value > INT_MAX) {
        return false;
    }
    out = static_cast<int>(value);
    return true;
}

bool parseUnsigned(const char* text, unsigned int& out) {
    if (!text || *text == '\0' || *text == '-') return false;

    char* end = nullptr;
    errno = 0;
    unsigned long value = std::strtoul(text, &end, 10);
    if (errno != 0 || *end != '\0' || value > UINT_MAX) {
        return false;
    }
    out = static_cast<unsigned int>(value);
    return true;
}

// "640x480"
bool parseWindowSize(const char* text, int& width, int& height) {
    const char* sep = text ? std::strchr(text, 'x') : nullptr;
    if (!sep) return false;

    std::string widthPart(text, sep - text);
    return parsePositive(widthPart.c_str(), width) && parsePositive(sep + 1, height);
}

const char* requireValue(int& i, int argc, char* argv[]) {
    if (i + 1 >= argc) {
        std::cerr << "❌ Missing value for " << argv[i] << std::endl;
        return nullptr;
    }
    return argv[++i];
}

} // anonymous namespace

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "  -f, --fullscreen     Use the desktop resolution\n"
              << "  --window WxH         Window size in pixels (default 640x480)\n"
              << "  --cell N             Cell size in pixels (default 20)\n"
              << "  --fps N              Ticks per second (default 20)\n"
              << "  --seed N             Fixed random seed\n"
              << "  --shaders DIR        Shader directory (default shaders)\n"
              << "  -h, --help           Show this help" << std::endl;
}

ParseResult parseCommandLine(int argc, char* argv[], AppConfig& config) {
    for (int i = 1; i < argc; i++) {
        const char* arg = argv[i];

        if (strcmp(arg, "-h") == 0 || strcmp(arg, "--help") == 0) {
            printUsage(argv[0]);
            return ParseResult::HELP;
        } else if (strcmp(arg, "-f") == 0 || strcmp(arg, "--fullscreen") == 0) {
            config.fullscreen = true;
        } else if (strcmp(arg, "--window") == 0) {
            const char* value = requireValue(i, argc, argv);
            if (!value) return ParseResult::ERROR;
            if (!parseWindowSize(value, config.windowWidth, config.windowHeight)) {
                std::cerr << "❌ Invalid window size '" << value << "', expected WxH" << std::endl;
                return ParseResult::ERROR;
            }
        } else if (strcmp(arg, "--cell") == 0) {
            const char* value = requireValue(i, argc, argv);
            if (!value) return ParseResult::ERROR;
            if (!parsePositive(value, config.cellSize)) {
                std::cerr << "❌ Invalid cell size '" << value << "'" << std::endl;
                return ParseResult::ERROR;
            }
        } else if (strcmp(arg, "--fps") == 0) {
            const char* value = requireValue(i, argc, argv);
            if (!value) return ParseResult::ERROR;
            if (!parsePositive(value, config.ticksPerSecond)) {
                std::cerr << "❌ Invalid tick rate '" << value << "'" << std::endl;
                return ParseResult::ERROR;
            }
        } else if (strcmp(arg, "--seed") == 0) {
            const char* value = requireValue(i, argc, argv);
            if (!value) return ParseResult::ERROR;
            unsigned int seed = 0;
            if (!parseUnsigned(value, seed)) {
                std::cerr << "❌ Invalid seed '" << value << "'" << std::endl;
                return ParseResult::ERROR;
            }
            config.seed = seed;
        } else if (strcmp(arg, "--shaders") == 0) {
            const char* value = requireValue(i, argc, argv);
            if (!value) return ParseResult::ERROR;
            config.shaderDir = value;
        } else {
            std::cerr << "❌ Unknown option: " << arg << std::endl;
            return ParseResult::ERROR;
        }
    }

    if (config.gridWidth() < kMinBoardCells || config.gridHeight() < kMinBoardCells) {
        std::cerr << "❌ Window " << config.windowWidth << "x" << config.windowHeight
                  << " holds fewer than " << kMinBoardCells << " cells of " << config.cellSize
                  << " px per axis" << std::endl;
        return ParseResult::ERROR;
    }

    return ParseResult::OK;
}
