#ifndef RCGC_COMMON_HPP
#define RCGC_COMMON_HPP

#include <cstdint>
#include <cstddef>
#include <iostream>
#include <string>
#include <stdexcept>
#include <vector>

// Debug flags (set via CMake options)
#ifdef DEBUG_LOG_GC
    #define LOG_GC
#endif

// Utility macros
#define UNUSED(x) (void)(x)

// Stable object handle. Ids are never reused, 0 is never a live object.
using ObjectId = uint64_t;
constexpr ObjectId NO_OBJECT = 0;

// Number of generation buckets
constexpr int NUM_GENERATIONS = 3;
constexpr int OLDEST_GENERATION = NUM_GENERATIONS - 1;

// Error reporting
class GCError : public std::runtime_error {
public:
    explicit GCError(const std::string& message)
        : std::runtime_error(message) {}
};

// Operation on an unknown or already freed object
class InvalidReference : public GCError {
public:
    explicit InvalidReference(ObjectId id, const std::string& detail = "")
        : GCError(formatMessage(id, detail)), id_(id) {}

    ObjectId id() const { return id_; }

private:
    ObjectId id_;

    static std::string formatMessage(ObjectId id, const std::string& detail) {
        std::string message = "Invalid reference: object #" + std::to_string(id);
        if (!detail.empty()) {
            message += " (" + detail + ")";
        }
        return message;
    }
};

class InvalidConfiguration : public GCError {
public:
    explicit InvalidConfiguration(const std::string& message)
        : GCError("Invalid configuration: " + message) {}
};

// Collection requested while a pass is already running
class ReentrantCollection : public GCError {
public:
    ReentrantCollection()
        : GCError("Reentrant collection: a collection pass is already running") {}
};

// A finalizer re-established an external reference to an unreachable object
class ResurrectionDetected : public GCError {
public:
    ResurrectionDetected(const std::vector<ObjectId>& ids, size_t collected)
        : GCError(formatMessage(ids)), ids_(ids), collected_(collected) {}

    const std::vector<ObjectId>& ids() const { return ids_; }

    // Objects reclaimed by the pass that detected the resurrection
    size_t collected() const { return collected_; }

private:
    std::vector<ObjectId> ids_;
    size_t collected_;

    static std::string formatMessage(const std::vector<ObjectId>& ids) {
        std::string message = "Resurrection detected: ";
        for (size_t i = 0; i < ids.size(); i++) {
            if (i > 0) message += ", ";
            message += "#" + std::to_string(ids[i]);
        }
        return message;
    }
};

class ShellError : public std::runtime_error {
public:
    explicit ShellError(const std::string& message, int line = -1)
        : std::runtime_error(formatMessage(message, line)), message_(message), line_(line) {}

    const std::string& message() const { return message_; }
    int line() const { return line_; }

private:
    std::string message_;
    int line_;

    static std::string formatMessage(const std::string& message, int line) {
        if (line >= 0) {
            return "[line " + std::to_string(line) + "] Error: " + message;
        }
        return "Error: " + message;
    }
};

// Logging utilities
namespace Log {
    void error(const std::string& message, int line = -1);
    void warning(const std::string& message);
    void info(const std::string& message);
    void debug(const std::string& message);

    // Redirects info() output, nullptr restores std::cout
    void setInfoStream(std::ostream* stream);
}

#endif // RCGC_COMMON_HPP
