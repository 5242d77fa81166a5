// Minimal provider speaking newline-delimited JSON-RPC on stdio, used by the
// supervisor and dispatcher tests.
//
//   --no-tools   answer tools/list with an empty list
//   --hang       never answer initialize
//   --noise      write non-JSON lines and notifications before answering
//
// Tools: add {a,b}, echo {...}, delayed {ms}, fail {}, crash {}
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using nlohmann::json;

static std::mutex g_out_mutex;

static void send(const json& message) {
    std::lock_guard<std::mutex> lock(g_out_mutex);
    std::cout << message.dump() << "\n" << std::flush;
}

static json text_result(const std::string& text) {
    return {{"content", json::array({{{"type", "text"}, {"text", text}}})}};
}

static json tool_list() {
    auto number = json{{"type", "number"}};
    return json::array({
        {{"name", "add"}, {"description", "Add two numbers"},
         {"inputSchema", {{"type", "object"},
                          {"properties", {{"a", number}, {"b", number}}},
                          {"required", json::array({"a", "b"})}}}},
        {{"name", "echo"}, {"description", "Echo the arguments"}},
        {{"name", "delayed"}, {"description", "Answer after ms milliseconds"},
         {"inputSchema", {{"type", "object"}, {"properties", {{"ms", number}}}}}},
        {{"name", "fail"}, {"description", "Always fails"}},
        {{"name", "crash"}, {"description", "Exit without answering"}}
    });
}

int main(int argc, char* argv[]) {
    bool no_tools = false;
    bool hang = false;
    bool noise = false;
    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "--no-tools") == 0) no_tools = true;
        else if (std::strcmp(argv[i], "--hang") == 0) hang = true;
        else if (std::strcmp(argv[i], "--noise") == 0) noise = true;
    }

    std::cerr << "fake provider ready" << std::endl;

    std::vector<std::thread> workers;
    std::string line;
    while (std::getline(std::cin, line)) {
        json request = json::parse(line, nullptr, false);
        if (request.is_discarded() || !request.is_object()) continue;
        if (!request.contains("id")) continue; // notification

        json id = request["id"];
        std::string method = request.value("method", "");

        if (noise) {
            std::lock_guard<std::mutex> lock(g_out_mutex);
            std::cout << "this is not json\n"
                      << json{{"jsonrpc", "2.0"}, {"method", "notifications/message"}}.dump()
                      << "\n" << std::flush;
        }

        if (method == "initialize") {
            if (hang) continue;
            send({{"jsonrpc", "2.0"}, {"id", id}, {"result", {
                {"protocolVersion", "2024-11-05"},
                {"capabilities", {{"tools", json::object()}}},
                {"serverInfo", {{"name", "fake"}, {"version", "1.0"}}}
            }}});
        } else if (method == "tools/list") {
            send({{"jsonrpc", "2.0"}, {"id", id},
                  {"result", {{"tools", no_tools ? json::array() : tool_list()}}}});
        } else if (method == "tools/call") {
            json params = request.value("params", json::object());
            std::string name = params.value("name", "");
            json args = params.value("arguments", json::object());

            if (name == "add") {
                double sum = args.value("a", 0.0) + args.value("b", 0.0);
                json number = sum;
                if (sum == static_cast<double>(static_cast<long long>(sum))) {
                    number = static_cast<long long>(sum);
                }
                send({{"jsonrpc", "2.0"}, {"id", id}, {"result", text_result(number.dump())}});
            } else if (name == "echo") {
                send({{"jsonrpc", "2.0"}, {"id", id}, {"result", {{"echo", args}}}});
            } else if (name == "delayed") {
                int ms = args.value("ms", 100);
                workers.emplace_back([id, ms]() {
                    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
                    send({{"jsonrpc", "2.0"}, {"id", id}, {"result", text_result("late")}});
                });
            } else if (name == "fail") {
                send({{"jsonrpc", "2.0"}, {"id", id},
                      {"error", {{"code", -32000}, {"message", "tool failed on purpose"}}}});
            } else if (name == "crash") {
                std::_Exit(3);
            } else {
                send({{"jsonrpc", "2.0"}, {"id", id},
                      {"error", {{"code", -32601}, {"message", "Unknown tool: " + name}}}});
            }
        } else {
            send({{"jsonrpc", "2.0"}, {"id", id},
                  {"error", {{"code", -32601}, {"message", "Method not found"}}}});
        }
    }

    for (auto& w : workers) w.join();
    return 0;
}
