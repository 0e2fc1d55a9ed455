//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: Command line front end for the toolhost library
//==========================================================================================================

#include "logging/Logger.h"
#include "toolhost/ToolHost.h"
#include "toolhost/errors/Errors.h"
#include "toolhost/version.h"
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace toolhost;

//==========================================================================================================
// getArgValue
// Purpose: Parses --key=value style CLI options.
// Args:
//   argc: Argument count
//   argv: Argument vector
//   key: Key string including leading dashes (e.g., "--config")
// Returns:
//   Optional string containing the value when present
//==========================================================================================================
static std::optional<std::string> getArgValue(int argc, char** argv, const std::string& key) {
    for (size_t i = 1; i < static_cast<size_t>(argc); ++i) {
        std::string a = argv[i];
        auto eq = a.find('=');
        if (eq != std::string::npos) {
            std::string k = a.substr(0, eq);
            std::string v = a.substr(eq + 1);
            if (k == key) {
                return v;
            }
        }
    }
    return std::nullopt;
}

// Arguments that are not --options, in order (the command first).
static std::vector<std::string> positionalArgs(int argc, char** argv) {
    std::vector<std::string> out;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a.rfind("--", 0) != 0) {
            out.push_back(a);
        }
    }
    return out;
}

static void printUsage() {
    std::cerr << "toolhost " << getVersionString() << "\n"
              << "usage: toolhost_cli <command> [args] [--config=PATH] [--custom=PATH] [--log-level=LEVEL]\n"
              << "  list                          list configured servers with status\n"
              << "  status <id>                   print the status of one server\n"
              << "  start <id>                    start a server, run the handshake, then stop it\n"
              << "  tools <id>                    list the tools a server advertises\n"
              << "  call <id> <tool> [--args=JSON]\n"
              << "  request <id> <method> [--params=JSON]\n"
              << "  add <url> [--id=ID] [--name=NAME] [--description=TEXT] [--timeout=SECONDS] [--token=TOKEN]\n"
              << "  delete <id>\n";
}

static int runCommand(ToolHost& host, const std::vector<std::string>& pos, int argc, char** argv) {
    const std::string& cmd = pos[0];
    auto need = [&pos](std::size_t n) {
        if (pos.size() < n + 1) {
            throw errors::InvalidOperationError("'" + pos[0] + "' expects " + std::to_string(n) + " argument(s)");
        }
    };

    if (cmd == "list") {
        for (const auto& s : host.ListServers()) {
            std::cout << s.id << "\t" << ToString(s.transport) << "\t" << ToString(s.status)
                      << (s.enabled ? "" : "\tdisabled") << (s.isCustom ? "\tcustom" : "")
                      << "\t" << (s.url ? *s.url : s.name) << "\n";
        }
        return 0;
    }
    if (cmd == "status") {
        need(1);
        std::cout << ToString(host.GetServerStatus(pos[1])) << "\n";
        return 0;
    }
    if (cmd == "start") {
        need(1);
        host.StartServer(pos[1]);
        std::cout << pos[1] << ": " << ToString(host.GetServerStatus(pos[1])) << "\n";
        return 0;
    }
    if (cmd == "tools") {
        need(1);
        for (const auto& t : host.DiscoverTools(pos[1])) {
            std::cout << t.name << "\t" << t.description << "\n";
        }
        return 0;
    }
    if (cmd == "call") {
        need(2);
        JSONValue args = ParseJSON(getArgValue(argc, argv, "--args").value_or("{}"));
        for (const auto& t : host.DiscoverTools(pos[1])) {
            if (t.name != pos[2]) {
                continue;
            }
            auto missing = ToolCatalog::MissingRequiredArguments(t, args);
            if (!missing.empty()) {
                std::string names;
                for (const auto& m : missing) {
                    names += (names.empty() ? "" : ", ") + m;
                }
                std::cerr << "missing required argument(s): " << names << "\n";
                return 2;
            }
        }
        JSONValue result = host.CallTool(pos[1], pos[2], args);
        std::cout << ToolCatalog::FormatToolResult(result) << "\n";
        return 0;
    }
    if (cmd == "request") {
        need(2);
        std::optional<JSONValue> params;
        if (auto p = getArgValue(argc, argv, "--params")) {
            params = ParseJSON(*p);
        }
        host.StartServer(pos[1]);
        std::cout << SerializeJSON(host.SendRequest(pos[1], pos[2], std::move(params)), 2) << "\n";
        return 0;
    }
    if (cmd == "add") {
        need(1);
        const std::string& url = pos[1];
        std::string id = getArgValue(argc, argv, "--id").value_or(ServerRegistry::MakeServerIdFromUrl(url));
        std::string name = getArgValue(argc, argv, "--name").value_or(id);
        std::string timeout = getArgValue(argc, argv, "--timeout").value_or(std::to_string(DefaultTimeoutSeconds));
        int timeoutSeconds = 0;
        try {
            timeoutSeconds = std::stoi(timeout);
        } catch (const std::exception&) {
            throw errors::InvalidOperationError("--timeout must be a number of seconds");
        }
        auto cfg = host.AddCustomServer(id, name, url, getArgValue(argc, argv, "--description").value_or(""),
                                        timeoutSeconds, getArgValue(argc, argv, "--token").value_or(""));
        std::cout << "added " << cfg.id << "\n";
        return 0;
    }
    if (cmd == "delete") {
        need(1);
        host.DeleteCustomServer(pos[1]);
        std::cout << "deleted " << pos[1] << "\n";
        return 0;
    }
    printUsage();
    return 2;
}

int main(int argc, char** argv) {
    FUNC_SCOPE();
    Logger::configureFromEnv();
    if (auto lvl = getArgValue(argc, argv, "--log-level")) {
        Logger::setLogLevel(Logger::levelFromString(*lvl));
    }

    auto pos = positionalArgs(argc, argv);
    if (pos.empty()) {
        printUsage();
        return 2;
    }

    RegistryOptions opts = RegistryOptions::FromEnv();
    if (auto p = getArgValue(argc, argv, "--config")) {
        opts.configPath = *p;
    }
    if (auto p = getArgValue(argc, argv, "--custom")) {
        opts.customServersPath = *p;
    }

    try {
        ToolHost host(opts);
        host.Load();
        int rc = runCommand(host, pos, argc, argv);
        host.Shutdown();
        return rc;
    } catch (const errors::RPCError& e) {
        std::cerr << "error: " << e.what();
        if (e.data()) {
            std::cerr << " " << SerializeJSON(*e.data());
        }
        std::cerr << "\n";
        return 1;
    } catch (const errors::ToolHostError& e) {
        std::cerr << "error (" << errors::errorKindName(e.kind()) << "): " << e.what() << "\n";
        return 1;
    } catch (const JSONParseError& e) {
        std::cerr << "invalid JSON argument: " << e.what() << "\n";
        return 2;
    }
}
