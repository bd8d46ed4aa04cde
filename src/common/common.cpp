#include "common/common.hpp"

namespace {
    // Destination of Log::info, nullptr means std::cout
    std::ostream* infoStream = nullptr;
}

namespace Log {
    void error(const std::string& message, int line) {
        std::cerr << (line >= 0 ? "[line " + std::to_string(line) + "] " : std::string())
                  << "Error: " << message << std::endl;
    }

    void warning(const std::string& message) {
        std::cerr << "Warning: " << message << std::endl;
    }

    void info(const std::string& message) {
        std::ostream& out = infoStream != nullptr ? *infoStream : std::cout;
        out << "Info: " << message << std::endl;
    }

    void setInfoStream(std::ostream* stream) {
        infoStream = stream;
    }

    void debug(const std::string& message) {
#ifdef LOG_GC
        std::cerr << "gc: " << message << std::endl;
#else
        UNUSED(message);
#endif
    }
}
