#include <cxxopts.hpp>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <nlohmann/json.hpp>
#include "plaincfg/Convert.hpp"
#include "plaincfg/Errors.hpp"
#include "plaincfg/File.hpp"
#include "plaincfg/Literal.hpp"
#include "plaincfg/Util.hpp"
#include "plaincfg/Writer.hpp"

using namespace plaincfg;

int main(int argc, char** argv) {
    try {
        cxxopts::Options options("plaincfg", "Inspect & edit plain key/value config files");
        options.positional_help("COMMAND [ARGS]");

        // Global options
        options.add_options()
            ("c,config", "Path to the config file", cxxopts::value<std::string>())
            ("width", "Wrap width for long values (0 disables wrapping)",
             cxxopts::value<std::size_t>()->default_value(std::to_string(kDefaultMaxWidth)))
            ("continuation", "Continuation marker candidates, in preference order",
             cxxopts::value<std::string>())
            ("to", "Output format for dump: json or toml", cxxopts::value<std::string>()->default_value("json"))
            ("unsafe", "Allow opaque object serialization")
            ("rewrite-old", "Keep lines of keys no longer present")
            ("h,help", "Show help");

        // Command + arguments captured as positional strings
        options.add_options()
            ("command", "Subcommand", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"command"});

        auto result = options.parse(argc, argv);
        if (result.count("help") || !result.count("command")) {
            std::cout << options.help({""}) << "\n";
            std::cout << "Commands: get KEY | set KEY VALUE | delete KEY | keys | dump [--to json|toml] | check\n";
            return 0;
        }

        if (!result.count("config")) {
            std::cerr << "Error: --config must be provided\n";
            return 1;
        }
        const std::string path = result["config"].as<std::string>();
        const bool safe = result.count("unsafe") == 0;

        auto cmdv = result["command"].as<std::vector<std::string>>();
        if (cmdv.empty()) { std::cerr << "Error: missing command\n"; return 1; }
        const std::string cmd = cmdv[0];

        auto expect_args = [&](std::size_t want) {
            if (cmdv.size() < want) {
                std::cerr << "Error: insufficient arguments for command '" << cmd << "'\n";
                std::exit(1);
            }
        };

        std::vector<Diagnostic> collected;

        ReadOptions read;
        read.safe = safe;
        read.diagnostics = cmd == "check" ? collecting_sink(collected) : console_sink(std::cerr);

        WriteOptions write;
        write.safe = safe;
        write.max_width = result["width"].as<std::size_t>();
        write.rewrite_old = result.count("rewrite-old") > 0;
        write.diagnostics = console_sink(std::cerr);
        if (result.count("continuation")) {
            write.continuation_chars = utf8_chars(result["continuation"].as<std::string>());
        }

        // set may create the file; every other command needs it
        ReadResult cfg;
        if (cmd != "set" || std::filesystem::exists(path)) {
            cfg = read_config_file(path, read);
        }

        // GET
        if (cmd == "get") {
            expect_args(2);
            const std::string key = cmdv[1];
            auto it = cfg.data.find(key);
            if (it == cfg.data.end()) {
                std::cerr << "Key not found: " << key << "\n";
                return 1;
            }
            std::cout << to_json(it->second).dump(2) << "\n";
            return 0;
        }

        // SET
        if (cmd == "set") {
            expect_args(3);
            const std::string key = cmdv[1];
            Value parsed = parse_literal_or_string(cmdv[2]);
            validate_key(key);
            const std::string shown = to_json(parsed).dump();
            cfg.data[key] = std::move(parsed);
            write_config_file(path, cfg.data, cfg.structure, write);
            std::cout << "Set " << key << " = " << shown << " in " << path << "\n";
            return 0;
        }

        // DELETE
        if (cmd == "delete") {
            expect_args(2);
            const std::string key = cmdv[1];
            if (cfg.data.erase(key) == 0) {
                std::cerr << "Key not found: " << key << "\n";
                return 1;
            }
            write_config_file(path, cfg.data, cfg.structure, write);
            std::cout << "Deleted " << key << " from " << path << "\n";
            return 0;
        }

        // KEYS
        if (cmd == "keys") {
            for (const auto& kv : cfg.data) {
                std::cout << kv.first << "\n";
            }
            return 0;
        }

        // DUMP
        if (cmd == "dump") {
            const std::string to = result["to"].as<std::string>();
            if (to == "toml") {
                std::cout << to_toml_string(cfg.data) << "\n";
            } else if (to == "json") {
                std::cout << to_json_string(cfg.data, 2) << "\n";
            } else {
                std::cerr << "Error: unsupported format '" << to << "'\n";
                return 1;
            }
            return 0;
        }

        // CHECK
        if (cmd == "check") {
            std::size_t problems = 0;
            for (const auto& d : collected) {
                if (d.severity >= Severity::Warning) {
                    std::cout << format_diagnostic(d) << "\n";
                    ++problems;
                }
            }
            if (problems == 0) {
                std::cout << path << ": " << cfg.data.size() << " keys, no problems\n";
                return 0;
            }
            return 1;
        }

        std::cerr << "Unknown command: " << cmd << "\n";
        return 1;

    } catch (const ConfigError& ce) {
        std::cerr << "Error: " << ce.what() << "\n";
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
