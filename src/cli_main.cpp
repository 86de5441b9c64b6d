#include <cxxopts.hpp>
#include <cstdlib>
#include <iostream>
#include <map>
#include <string>
#include "yedit/Config.hpp"
#include "yedit/Errors.hpp"
#include "yedit/Loader.hpp"
#include "yedit/Logger.hpp"
#include "yedit/Params.hpp"
#include "yedit/Runner.hpp"

using namespace yedit;

namespace {

// Text-valued flags and the parameter each one sets
const std::map<std::string, std::string> TEXT_FLAGS = {
    {"state", "state"},
    {"src", "src"},
    {"content", "content"},
    {"content-type", "content_type"},
    {"key", "key"},
    {"value", "value"},
    {"value-type", "value_type"},
    {"index", "index"},
    {"curr-value", "curr_value"},
    {"curr-value-format", "curr_value_format"},
    {"backup-ext", "backup_ext"},
    {"separator", "separator"},
};

const char* const BOOL_FLAGS[] = {"update", "append", "insert", "backup", "debug"};

} // namespace

int main(int argc, char** argv) {
    try {
        cxxopts::Options options("yedit", "Idempotent, path-addressed edits of YAML/JSON files");

        options.add_options()
            ("state", "present, absent or list", cxxopts::value<std::string>())
            ("src", "File to edit", cxxopts::value<std::string>())
            ("content", "Document text to use instead of (or to replace) the file", cxxopts::value<std::string>())
            ("content-type", "yaml or json", cxxopts::value<std::string>())
            ("key", "Path of the node to edit, e.g. a.b[0].c", cxxopts::value<std::string>())
            ("value", "Value to set, append, insert or remove", cxxopts::value<std::string>())
            ("value-type", "Declared type of --value (e.g. str, bool)", cxxopts::value<std::string>())
            ("update", "Merge into a mapping or replace within a sequence")
            ("append", "Append to a sequence")
            ("insert", "Insert into a sequence at --index")
            ("index", "Sequence index", cxxopts::value<std::string>())
            ("curr-value", "Sequence element to replace with --update", cxxopts::value<std::string>())
            ("curr-value-format", "yaml, json or plain-string", cxxopts::value<std::string>())
            ("backup", "Copy the file before writing")
            ("backup-ext", "Suffix of the backup copy", cxxopts::value<std::string>())
            ("separator", "Path separator character", cxxopts::value<std::string>())
            ("edits", "JSON/TOML/YAML file holding a list of edits", cxxopts::value<std::string>())
            ("params", "JSON/TOML/YAML file holding run parameters", cxxopts::value<std::string>())
            ("env-prefix", "Env-var prefix for parameters", cxxopts::value<std::string>()->default_value("YEDIT"))
            ("debug", "Log at debug level")
            ("h,help", "Show help");

        auto result = options.parse(argc, argv);
        if (result.count("help")) {
            std::cout << options.help() << "\n";
            return 0;
        }

        if (const char* level = std::getenv("YEDIT_LOG_LEVEL")) {
            Logger::instance().set_level(parse_log_level(level));
        }
        if (result.count("debug")) {
            Logger::instance().set_level(LogLevel::DEBUG);
        }

        // Prepare LoadOptions
        LoadOptions load;
        if (result.count("params")) load.file_path = result["params"].as<std::string>();
        load.prefix = result["env-prefix"].as<std::string>();

        for (const auto& [flag, param] : TEXT_FLAGS) {
            if (result.count(flag)) {
                load.overrides[param] = result[flag].as<std::string>();
            }
        }
        for (const char* flag : BOOL_FLAGS) {
            if (result.count(flag)) {
                load.overrides[flag] = result[flag].as<bool>();
            }
        }
        if (result.count("edits")) {
            load.overrides["edits"] = load_structured_file(result["edits"].as<std::string>());
        }

        Config cfg = Config::load(load);
        ModuleParams params = ModuleParams::from_value(cfg.data());
        if (params.debug) {
            Logger::instance().set_level(LogLevel::DEBUG);
        }

        Value rval = run(params);
        std::cout << rval.dump(2, ' ', false, Value::error_handler_t::replace) << "\n";

        auto failed = rval.find("failed");
        if (failed != rval.end() && failed->is_boolean() && failed->get<bool>()) {
            YEDIT_LOG_ERROR("%s", rval.value("msg", std::string()).c_str());
            return 1;
        }
        return 0;

    } catch (const YeditError& e) {
        Value rval{{"failed", true}, {"msg", e.what()}};
        std::cout << rval.dump(2, ' ', false, Value::error_handler_t::replace) << "\n";
        YEDIT_LOG_ERROR("%s", e.what());
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
