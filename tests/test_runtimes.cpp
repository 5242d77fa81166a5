#include <catch2/catch.hpp>
#include "runtimes.hpp"
#include <string>

using namespace toolmux;

// ── Table ────────────────────────────────────────────────────────

TEST_CASE("runtime_table: every runtime has an extension and a command", "[runtimes]") {
    REQUIRE(runtime_table().size() == 10);
    for (const auto& r : runtime_table()) {
        REQUIRE(r.extension[0] == '.');
        REQUIRE((r.interpreter != nullptr || r.compiler != nullptr));
    }
    REQUIRE(find_runtime("python") != nullptr);
    REQUIRE(find_runtime("cobol") == nullptr);
}

// ── Detection order ──────────────────────────────────────────────

TEST_CASE("detect_runtime: first matching rule wins", "[runtimes]") {
    REQUIRE(std::string(detect_runtime("import os\nprint(os.name)").name) == "python");
    // python needs both markers
    REQUIRE(std::string(detect_runtime("print(1)").name) == "nodejs");
    REQUIRE(std::string(detect_runtime("#!/bin/bash\nls").name) == "bash");
    REQUIRE(std::string(detect_runtime("echo hi").name) == "bash");
    REQUIRE(std::string(detect_runtime("package main\nfunc main() {}").name) == "go");
    REQUIRE(std::string(detect_runtime("fn main() { }").name) == "rust");
    REQUIRE(std::string(detect_runtime("#include <stdio.h>\nint main(){}").name) == "c");
    REQUIRE(std::string(detect_runtime("#include <iostream>\nint main(){}").name) == "cpp");
}

TEST_CASE("detect_runtime: earlier rules shadow later ones", "[runtimes]") {
    // Python that shells out still counts as python.
    REQUIRE(std::string(detect_runtime("import os\nprint('echo x')").name) == "python");
    // A Go program printing "echo " is classified as bash: the heuristic is best-effort.
    REQUIRE(std::string(detect_runtime("package main\n// echo demo").name) == "bash");
}

TEST_CASE("detect_runtime: falls back to the host scripting runtime", "[runtimes]") {
    REQUIRE(std::string(detect_runtime("console.log(1)").name) == "nodejs");
    REQUIRE(std::string(detect_runtime("export const x = 1;").name) == "typescript");
    REQUIRE(std::string(detect_runtime("import fs from 'fs';").name) == "typescript");
}

// ── Descriptive language ─────────────────────────────────────────

TEST_CASE("describe_language: ordered checks", "[runtimes]") {
    REQUIRE(describe_language("def f(): pass") == "Python");
    REQUIRE(describe_language("function f() {}") == "JavaScript");
    REQUIRE(describe_language("package main") == "Go");
    REQUIRE(describe_language("fn main() {}") == "Rust");
    REQUIRE(describe_language("#include <vector>") == "C/C++");
    REQUIRE(describe_language("#!/bin/bash") == "Bash");
    REQUIRE(describe_language("SELECT 1") == "Unknown");
}

TEST_CASE("compact_code: short code is kept verbatim", "[runtimes]") {
    std::string code(200, 'x');
    REQUIRE(compact_code(code) == code);
}

TEST_CASE("compact_code: long code becomes a summary", "[runtimes]") {
    std::string code = "def f():\n" + std::string(250, 'x');
    auto summary = compact_code(code);
    REQUIRE(summary.rfind("Python code (2 lines): def f():", 0) == 0);
    REQUIRE(summary.size() == std::string("Python code (2 lines): ").size() + 100 + 3);
    REQUIRE(summary.substr(summary.size() - 3) == "...");
}

// ── Invocation ───────────────────────────────────────────────────

TEST_CASE("build_invocation: interpreters run the file directly", "[runtimes]") {
    auto py = build_invocation(*find_runtime("python"), "/tmp/a.py");
    REQUIRE(py.command == "python3");
    REQUIRE(py.args == std::vector<std::string>{"/tmp/a.py"});
    REQUIRE(py.binary_path.empty());

    auto ts = build_invocation(*find_runtime("typescript"), "/tmp/a.ts");
    REQUIRE(ts.command == "npx");
    REQUIRE(ts.args == std::vector<std::string>{"ts-node", "/tmp/a.ts"});

    auto deno = build_invocation(*find_runtime("deno"), "/tmp/a.ts");
    REQUIRE(deno.args == std::vector<std::string>{"run", "/tmp/a.ts"});
}

TEST_CASE("build_invocation: compiled runtimes compile then run in one shell", "[runtimes]") {
    auto c = build_invocation(*find_runtime("c"), "/tmp/a.c");
    REQUIRE(c.command == "sh");
    REQUIRE(c.binary_path == "/tmp/a.c.bin");
    REQUIRE(c.args.size() == 5);
    REQUIRE(c.args[0] == "-c");
    REQUIRE(c.args[1].find("gcc") == 0);
    REQUIRE(c.args[3] == "/tmp/a.c");
    REQUIRE(c.args[4] == "/tmp/a.c.bin");
}
