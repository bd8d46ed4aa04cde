#include "shell/shell.hpp"
#include <sstream>

unsigned parseDebugFlagList(const std::string& text) {
    unsigned flags = 0;
    std::stringstream stream(text);
    std::string item;
    while (std::getline(stream, item, ',')) {
        if (item == "stats") flags |= DEBUG_STATS;
        else if (item == "collectable") flags |= DEBUG_COLLECTABLE;
        else if (item == "uncollectable") flags |= DEBUG_UNCOLLECTABLE;
        else if (item == "saveall") flags |= DEBUG_SAVEALL;
        else if (item == "leak") flags |= DEBUG_LEAK;
        else if (item == "none" || item.empty()) continue;
        else throw ShellError("unknown debug flag '" + item + "'");
    }
    return flags;
}

Shell::Shell(std::ostream& out, const GCConfig& config)
    : out_(out), graph_(), controller_(graph_, config), lastCollected_(0), echo_(false) {
    Log::setInfoStream(&out_);
}

Shell::~Shell() {
    Log::setInfoStream(nullptr);
}

Shell::Args Shell::tokenize(const std::string& line) {
    std::string code = line.substr(0, line.find('#'));
    std::istringstream stream(code);
    Args args;
    std::string word;
    while (stream >> word) {
        args.push_back(word);
    }
    return args;
}

size_t Shell::parseCount(const std::string& text, int lineNumber) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        throw ShellError("expected a non-negative number, got '" + text + "'", lineNumber);
    }
    try {
        return static_cast<size_t>(std::stoull(text));
    } catch (const std::out_of_range&) {
        throw ShellError("number out of range: " + text, lineNumber);
    }
}

void Shell::expectArgs(const Args& args, size_t min, size_t max, int lineNumber) const {
    size_t given = args.size() - 1;
    if (given < min || given > max) {
        throw ShellError("wrong number of arguments to '" + args[0] + "'", lineNumber);
    }
}

ObjectId Shell::resolve(const std::string& name) const {
    auto it = names_.find(name);
    if (it == names_.end()) {
        throw ShellError("unknown name '" + name + "'");
    }
    return it->second;
}

// Takes over the root reference the caller already holds on id
void Shell::bindName(const std::string& name, ObjectId id) {
    auto it = bindings_.find(name);
    ObjectId previous = it != bindings_.end() ? it->second : NO_OBJECT;

    bindings_[name] = id;
    names_[name] = id;
    if (previous != NO_OBJECT) {
        graph_.release(previous);
    }
}

void Shell::unbindName(const std::string& name) {
    auto it = bindings_.find(name);
    if (it == bindings_.end()) {
        throw ShellError("'" + name + "' is not bound");
    }
    graph_.release(it->second);
    bindings_.erase(it);
}

std::string Shell::describe(ObjectId id) const {
    std::lock_guard<std::recursive_mutex> lock(graph_.mutex());
    const RcObject* object = graph_.find(id);
    if (object == nullptr) {
        return "<freed #" + std::to_string(id) + ">";
    }

    std::ostringstream out;
    out << "<" << object->typeName() << " #" << id << "> " << kindName(object->kind());
    if (object->isContainer()) {
        out << " gen " << object->generation();
    }
    out << " count " << object->strongCount() << " roots " << object->rootCount();
    if (object->isContainer()) {
        out << " refs [";
        const auto& refs = object->references();
        for (size_t i = 0; i < refs.size(); i++) {
            if (i > 0) out << ", ";
            out << "#" << refs[i];
        }
        out << "]";
    }
    return out.str();
}

void Shell::execute(const std::string& line, int lineNumber) {
    Args args = tokenize(line);
    if (args.empty()) return;

    if (echo_) {
        out_ << "> " << line << std::endl;
    }

    const std::string& command = args[0];
    if (command == "new") {
        cmdNew(args, lineNumber);
    } else if (command == "bind") {
        expectArgs(args, 2, 2, lineNumber);
        ObjectId id = resolve(args[2]);
        graph_.retain(id);
        bindName(args[1], id);
    } else if (command == "del") {
        expectArgs(args, 1, 1, lineNumber);
        unbindName(args[1]);
    } else if (command == "link") {
        expectArgs(args, 2, 2, lineNumber);
        graph_.addEdge(resolve(args[1]), resolve(args[2]));
    } else if (command == "unlink") {
        expectArgs(args, 2, 2, lineNumber);
        graph_.removeEdge(resolve(args[1]), resolve(args[2]));
    } else if (command == "finalizer") {
        cmdFinalizer(args, lineNumber);
    } else if (command == "collect") {
        cmdCollect(args, lineNumber);
    } else if (command == "enable") {
        controller_.enable();
    } else if (command == "disable") {
        controller_.disable();
    } else if (command == "threshold") {
        expectArgs(args, 3, 3, lineNumber);
        controller_.setThresholds(parseCount(args[1], lineNumber),
                                  parseCount(args[2], lineNumber),
                                  parseCount(args[3], lineNumber));
    } else if (command == "debug") {
        expectArgs(args, 1, 1, lineNumber);
        controller_.setDebugFlags(parseDebugFlagList(args[1]));
    } else if (command == "policy") {
        expectArgs(args, 1, 1, lineNumber);
        if (args[1] == "defer") {
            controller_.setResurrectionPolicy(ResurrectionPolicy::DEFER);
        } else if (args[1] == "raise") {
            controller_.setResurrectionPolicy(ResurrectionPolicy::RAISE);
        } else {
            throw ShellError("policy must be 'defer' or 'raise'", lineNumber);
        }
    } else if (command == "show") {
        expectArgs(args, 1, 1, lineNumber);
        cmdShow(args);
    } else if (command == "tracked") {
        TrackedObjects tracked = controller_.getTrackedObjects();
        out_ << "tracked:";
        ObjectId id = NO_OBJECT;
        while (tracked.next(id)) {
            out_ << " #" << id;
        }
        out_ << std::endl;
    } else if (command == "count") {
        auto counts = controller_.getCount();
        out_ << "count: " << counts[0] << " " << counts[1] << " " << counts[2] << std::endl;
    } else if (command == "stats") {
        cmdStats();
    } else if (command == "garbage") {
        out_ << "garbage:";
        for (ObjectId id : controller_.garbage()) {
            out_ << " #" << id;
        }
        out_ << std::endl;
    } else if (command == "clear-garbage") {
        out_ << "released " << controller_.clearGarbage() << std::endl;
    } else if (command == "expect" || command == "expect-collected" || command == "expect-tracked") {
        cmdExpect(args, lineNumber);
    } else {
        throw ShellError("unknown command '" + command + "'", lineNumber);
    }
}

void Shell::cmdNew(const Args& args, int lineNumber) {
    expectArgs(args, 2, 3, lineNumber);

    RcObject::Kind kind;
    if (args[2] == "container") {
        kind = RcObject::Kind::CONTAINER;
    } else if (args[2] == "atom") {
        kind = RcObject::Kind::ATOM;
    } else {
        throw ShellError("object kind must be 'container' or 'atom'", lineNumber);
    }

    std::string typeName = args.size() > 3 ? args[3] : std::string(kindName(kind));
    bindName(args[1], graph_.allocate(kind, typeName));
}

void Shell::cmdFinalizer(const Args& args, int lineNumber) {
    expectArgs(args, 2, 3, lineNumber);
    std::string name = args[1];
    ObjectId id = resolve(name);

    if (args[2] == "log") {
        graph_.setFinalizer(id, [this, name](ObjectId dying) {
            out_ << "finalizing " << name << " #" << dying << std::endl;
        });
    } else if (args[2] == "resurrect") {
        if (args.size() != 4) {
            throw ShellError("finalizer resurrect needs a holder", lineNumber);
        }
        ObjectId holder = resolve(args[3]);
        graph_.setFinalizer(id, [this, name, holder](ObjectId dying) {
            out_ << "finalizing " << name << " #" << dying << std::endl;
            graph_.addEdge(holder, dying);
        });
    } else {
        throw ShellError("finalizer must be 'log' or 'resurrect'", lineNumber);
    }
}

void Shell::cmdCollect(const Args& args, int lineNumber) {
    expectArgs(args, 0, 1, lineNumber);
    if (args.size() == 2) {
        size_t generation = parseCount(args[1], lineNumber);
        if (generation > static_cast<size_t>(OLDEST_GENERATION)) {
            throw ShellError("generation must be between 0 and " +
                             std::to_string(OLDEST_GENERATION), lineNumber);
        }
        lastCollected_ = controller_.collect(static_cast<int>(generation));
    } else {
        lastCollected_ = controller_.collect();
    }
    out_ << "collected " << lastCollected_ << std::endl;
}

void Shell::cmdShow(const Args& args) {
    out_ << args[1] << " = " << describe(resolve(args[1])) << std::endl;
}

void Shell::cmdStats() {
    auto stats = controller_.getStats();
    for (int i = 0; i < NUM_GENERATIONS; i++) {
        out_ << "gen " << i << ": collections " << stats[i].collections
             << " collected " << stats[i].collected
             << " uncollectable " << stats[i].uncollectable << std::endl;
    }
    out_ << "objects " << graph_.objectCount() << " freed " << graph_.freedCount() << std::endl;
}

void Shell::cmdExpect(const Args& args, int lineNumber) {
    const std::string& command = args[0];

    if (command == "expect-collected") {
        expectArgs(args, 1, 1, lineNumber);
        size_t expected = parseCount(args[1], lineNumber);
        if (lastCollected_ != expected) {
            throw ShellError("expected " + std::to_string(expected) + " collected, got " +
                             std::to_string(lastCollected_), lineNumber);
        }
        return;
    }

    if (command == "expect-tracked") {
        expectArgs(args, 2, 2, lineNumber);
        int expected = static_cast<int>(parseCount(args[2], lineNumber));
        int actual = controller_.generationOf(resolve(args[1]));
        if (actual != expected) {
            throw ShellError("expected " + args[1] + " in generation " + args[2] +
                             ", found in " + std::to_string(actual), lineNumber);
        }
        return;
    }

    expectArgs(args, 2, 2, lineNumber);
    bool alive = graph_.contains(resolve(args[1]));
    if (args[2] == "alive") {
        if (!alive) throw ShellError("expected " + args[1] + " to be alive", lineNumber);
    } else if (args[2] == "dead") {
        if (alive) throw ShellError("expected " + args[1] + " to be dead", lineNumber);
    } else {
        throw ShellError("expect takes 'alive' or 'dead'", lineNumber);
    }
}

bool Shell::runScript(const std::string& source) {
    std::istringstream stream(source);
    std::string line;
    int lineNumber = 0;

    while (std::getline(stream, line)) {
        lineNumber++;
        try {
            execute(line, lineNumber);
        } catch (const ShellError& e) {
            Log::error(e.message(), e.line() >= 0 ? e.line() : lineNumber);
            return false;
        } catch (const GCError& e) {
            Log::error(e.what(), lineNumber);
            return false;
        }
    }
    return true;
}

bool Shell::runLine(const std::string& line) {
    try {
        execute(line);
        return true;
    } catch (const ShellError& e) {
        Log::error(e.message());
    } catch (const GCError& e) {
        Log::error(e.what());
    }
    return false;
}
