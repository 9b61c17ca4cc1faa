#include <cxxopts.hpp>
#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "tomlet/Array.hpp"
#include "tomlet/Document.hpp"
#include "tomlet/LineSource.hpp"
#include "tomlet/Parser.hpp"

using namespace tomlet;

int main(int argc, char** argv) {
    try {
        cxxopts::Options options("tomlet-cli", "Inspect TOML documents via dot-notation");
        options.positional_help("COMMAND [ARGS]");

        // Global options
        options.add_options()
            ("f,file", "Path to the TOML document (stdin if omitted)", cxxopts::value<std::string>())
            ("indent", "Indentation for the json command", cxxopts::value<int>()->default_value("2"))
            ("v,verbose", "Trace every parsed token to stderr")
            ("h,help", "Show help");

        // Command + arguments captured as positional strings
        options.add_options()
            ("command", "Subcommand", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"command"});

        auto result = options.parse(argc, argv);
        if (result.count("help") || !result.count("command")) {
            std::cout << options.help() << "\n";
            std::cout << "Commands: get KEY | type KEY | exists KEY | list | dump | json\n";
            return 0;
        }

        auto cmdv = result["command"].as<std::vector<std::string>>();
        if (cmdv.empty()) { std::cerr << "Error: missing command\n"; return 1; }
        std::string cmd = cmdv[0];

        TokenObserver trace;
        if (result.count("verbose")) {
            trace = [](const Token& token) {
                if (token.kind == TokenKind::Group) {
                    std::cerr << token.line << ":" << token.column << " [" << token.group << "]\n";
                } else {
                    std::cerr << token.line << ":" << token.column << " "
                              << token.entry->full_name() << " "
                              << type_name(token.entry->type()) << "\n";
                }
            };
        }

        std::unique_ptr<LineSource> source;
        if (result.count("file")) {
            source = std::make_unique<FileLineSource>(result["file"].as<std::string>());
        } else {
            source = std::make_unique<StreamLineSource>(std::cin, "<stdin>");
        }
        Document doc = parse(std::move(source), trace);

        // Helpers to require extra args
        auto expect_args = [&](size_t want) {
            if (cmdv.size() < want) {
                std::cerr << "Error: insufficient arguments for command '" << cmd << "'\n";
                return false;
            }
            return true;
        };

        // GET
        if (cmd == "get") {
            if (!expect_args(2)) return 1;
            const std::string key = cmdv[1];
            const Entry* entry = nullptr;
            if (!doc.try_get_value(key, entry)) {
                std::cerr << "Key not found: " << key << "\n";
                return 1;
            }
            std::cout << entry->literal() << "\n";
            return 0;
        }

        // TYPE
        if (cmd == "type") {
            if (!expect_args(2)) return 1;
            const std::string key = cmdv[1];
            const Entry& entry = doc.get_value(key);
            std::cout << type_name(entry.type());
            if (entry.type() == ValueType::Array) {
                const auto& array = static_cast<const Array&>(entry);
                const auto dims = array.dimensions();
                std::cout << " " << array.element_type().to_string()
                          << " depth=" << dims.depth << " length=" << dims.length;
            }
            std::cout << "\n";
            return 0;
        }

        // EXISTS
        if (cmd == "exists") {
            if (!expect_args(2)) return 1;
            const std::string key = cmdv[1];
            bool ok = doc.find_value(key) != nullptr || doc.group_exists(key);
            std::cout << (ok ? "true" : "false") << "\n";
            return ok ? 0 : 1;
        }

        // LIST
        if (cmd == "list") {
            for (const auto& [name, entry] : doc.all_items()) {
                std::cout << name << " " << type_name(entry->type()) << "\n";
            }
            return 0;
        }

        // DUMP
        if (cmd == "dump") {
            std::cout << doc.to_string();
            return 0;
        }

        // JSON
        if (cmd == "json") {
            std::cout << doc.to_json().dump(result["indent"].as<int>()) << "\n";
            return 0;
        }

        std::cerr << "Unknown command: " << cmd << "\n";
        return 1;

    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
