#pragma once
#include <string>
#include <vector>

namespace toolmux {

struct RuntimeSpec {
    const char* name;
    const char* extension;       // with leading dot
    const char* interpreter;     // program run on the source file
    const char* prefix_args;     // space-separated args before the file
    const char* compiler;        // non-null: compile to a binary, then run it
};

// The static runtime table in a fixed order.
const std::vector<RuntimeSpec>& runtime_table();

// nullptr for an unknown name.
const RuntimeSpec* find_runtime(const std::string& name);

// Comma-separated runtime names, for error messages.
std::string runtime_names();

// First matching rule of the ordered heuristic list; falls back to the host
// scripting runtime (typescript when the code has import/export, else nodejs).
const RuntimeSpec& detect_runtime(const std::string& code);

// Descriptive language label used only in history summaries.
std::string describe_language(const std::string& code);

// Code over 200 chars becomes "<Language> code (<n> lines): <first 100>...".
std::string compact_code(const std::string& code);

struct Invocation {
    std::string command;
    std::vector<std::string> args;
    std::string binary_path;     // compiled output to delete afterwards
};

// Command line running source_path under runtime. Compiled runtimes run
// `sh -c 'compile && run'` so one child covers both steps.
Invocation build_invocation(const RuntimeSpec& runtime, const std::string& source_path);

} // namespace toolmux
