#ifndef RCGC_SHELL_SHELL_HPP
#define RCGC_SHELL_SHELL_HPP

#include "common/common.hpp"
#include "heap/graph.hpp"
#include "gc/controller.hpp"
#include <ostream>
#include <string>
#include <unordered_map>
#include <vector>

// Line-oriented host for the collector. Each named binding holds one root
// reference; scripts build object graphs and drive collections with it.
// Collector diagnostics (debug flags) are written to the shell's stream.
//
//   new <name> container|atom [type]    link <from> <to>     collect [gen]
//   bind <name> <other>                 unlink <from> <to>   enable | disable
//   del <name>                          threshold t0 t1 t2   debug <flags> | policy defer|raise
//   finalizer <name> log | resurrect <holder>
//   show <name> | tracked | count | stats | garbage | clear-garbage
//   expect <name> alive|dead | expect-collected <n> | expect-tracked <name> <gen>
class Shell {
public:
    explicit Shell(std::ostream& out, const GCConfig& config = GCConfig());
    ~Shell();

    Shell(const Shell&) = delete;
    Shell& operator=(const Shell&) = delete;

    // Executes a single command. Throws ShellError or GCError.
    void execute(const std::string& line, int lineNumber = -1);

    // Executes a whole script, stopping at the first failing line
    bool runScript(const std::string& source);

    // Executes one interactive line, reporting errors instead of throwing
    bool runLine(const std::string& line);

    void setEcho(bool echo) { echo_ = echo; }

    ReferenceGraph& graph() { return graph_; }
    CollectorController& controller() { return controller_; }

    // Id last bound to the name, whether or not it is still alive
    ObjectId resolve(const std::string& name) const;

    size_t lastCollected() const { return lastCollected_; }

private:
    using Args = std::vector<std::string>;

    static Args tokenize(const std::string& line);
    static size_t parseCount(const std::string& text, int lineNumber);
    void expectArgs(const Args& args, size_t min, size_t max, int lineNumber) const;

    void bindName(const std::string& name, ObjectId id);
    void unbindName(const std::string& name);
    std::string describe(ObjectId id) const;

    void cmdNew(const Args& args, int lineNumber);
    void cmdFinalizer(const Args& args, int lineNumber);
    void cmdCollect(const Args& args, int lineNumber);
    void cmdShow(const Args& args);
    void cmdStats();
    void cmdExpect(const Args& args, int lineNumber);

    std::ostream& out_;
    ReferenceGraph graph_;
    CollectorController controller_;
    std::unordered_map<std::string, ObjectId> bindings_;  // names holding a root reference
    std::unordered_map<std::string, ObjectId> names_;     // every name ever bound
    size_t lastCollected_;
    bool echo_;
};

// Parses "stats,collectable,..." into DebugFlag bits. Throws ShellError.
unsigned parseDebugFlagList(const std::string& text);

#endif // RCGC_SHELL_SHELL_HPP
