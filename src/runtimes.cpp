#include "runtimes.hpp"
#include "util.hpp"
#include <functional>

namespace toolmux {

const std::vector<RuntimeSpec>& runtime_table() {
    static const std::vector<RuntimeSpec> table = {
        {"nodejs",     ".js",  "node",    "",        nullptr},
        {"typescript", ".ts",  "npx",     "ts-node", nullptr},
        {"deno",       ".ts",  "deno",    "run",     nullptr},
        {"bun",        ".js",  "bun",     "run",     nullptr},
        {"python",     ".py",  "python3", "",        nullptr},
        {"bash",       ".sh",  "bash",    "",        nullptr},
        {"go",         ".go",  "go",      "run",     nullptr},
        {"rust",       ".rs",  nullptr,   "",        "rustc"},
        {"c",          ".c",   nullptr,   "",        "gcc"},
        {"cpp",        ".cpp", nullptr,   "",        "g++"},
    };
    return table;
}

const RuntimeSpec* find_runtime(const std::string& name) {
    for (const auto& r : runtime_table()) {
        if (name == r.name) return &r;
    }
    return nullptr;
}

std::string runtime_names() {
    std::string names;
    for (const auto& r : runtime_table()) {
        if (!names.empty()) names += ", ";
        names += r.name;
    }
    return names;
}

static bool has(const std::string& code, const char* needle) {
    return code.find(needle) != std::string::npos;
}

namespace {

struct DetectionRule {
    std::function<bool(const std::string&)> matches;
    const char* runtime;
};

} // namespace

// Order is authoritative: python code that echoes a shell line is python.
static const std::vector<DetectionRule>& detection_rules() {
    static const std::vector<DetectionRule> rules = {
        {[](const std::string& c) { return has(c, "import ") && has(c, "print("); }, "python"},
        {[](const std::string& c) { return has(c, "#!/bin/bash") || has(c, "echo "); }, "bash"},
        {[](const std::string& c) { return has(c, "package main"); }, "go"},
        {[](const std::string& c) { return has(c, "fn main()"); }, "rust"},
        {[](const std::string& c) { return has(c, "#include <stdio.h>"); }, "c"},
        {[](const std::string& c) { return has(c, "#include <iostream>"); }, "cpp"},
    };
    return rules;
}

const RuntimeSpec& detect_runtime(const std::string& code) {
    for (const auto& rule : detection_rules()) {
        if (rule.matches(code)) return *find_runtime(rule.runtime);
    }
    if (has(code, "import ") || has(code, "export ")) {
        return *find_runtime("typescript");
    }
    return *find_runtime("nodejs");
}

std::string describe_language(const std::string& code) {
    if (has(code, "def ") || has(code, "import ")) return "Python";
    if (has(code, "function ") || has(code, "const ")) return "JavaScript";
    if (has(code, "package main")) return "Go";
    if (has(code, "fn main()")) return "Rust";
    if (has(code, "#include")) return "C/C++";
    if (has(code, "#!/bin/bash")) return "Bash";
    return "Unknown";
}

std::string compact_code(const std::string& code) {
    if (code.size() <= 200) return code;
    return describe_language(code) + " code (" + std::to_string(count_lines(code)) +
           " lines): " + prefix(code, 100) + "...";
}

Invocation build_invocation(const RuntimeSpec& runtime, const std::string& source_path) {
    Invocation inv;
    if (runtime.compiler) {
        inv.binary_path = source_path + ".bin";
        inv.command = "sh";
        inv.args = {"-c", std::string(runtime.compiler) + " \"$1\" -o \"$2\" && \"$2\"",
                    "sh", source_path, inv.binary_path};
        return inv;
    }

    inv.command = runtime.interpreter;
    for (const auto& a : split(runtime.prefix_args, ' ')) {
        if (!a.empty()) inv.args.push_back(a);
    }
    inv.args.push_back(source_path);
    return inv;
}

} // namespace toolmux
