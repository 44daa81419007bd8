#include "language/language.hpp"
#include <glog/logging.h>
#include <stdexcept>
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"

namespace codegrade {
using namespace std;

language_registry language_registry::defaults() {
    language_registry registry;
    registry.add({"c", "main.c",
                  {"gcc", "-O2", "-std=gnu11", "-o", "main", "main.c", "-lm"},
                  {"main"},
                  {"./main"}});
    registry.add({"cpp", "main.cpp",
                  {"g++", "-O2", "-std=c++17", "-o", "main", "main.cpp"},
                  {"main"},
                  {"./main"}});
    registry.add({"python3", "main.py",
                  {"python3", "-m", "py_compile", "main.py"},
                  {"main.py"},
                  {"python3", "main.py"}});
    return registry;
}

void language_registry::add(language lang) {
    if (lang.name.empty())
        throw invalid_argument("language without name");
    if (lang.compile_command.empty() || lang.run_command.empty())
        throw invalid_argument("language " + lang.name + " needs both a compile and a run command");
    if (lang.artifact_files.empty())
        throw invalid_argument("language " + lang.name + " keeps no artifact");
    assert_safe_path(lang.source_file);
    for (auto &file : lang.artifact_files)
        assert_safe_path(file);

    string name = lang.name;
    languages[name] = move(lang);
}

const language *language_registry::find(const string &name) const {
    auto it = languages.find(name);
    return it == languages.end() ? nullptr : &it->second;
}

vector<string> language_registry::names() const {
    vector<string> result;
    for (auto &[name, lang] : languages)
        result.push_back(name);
    return result;
}

void language_registry::load(const filesystem::path &config) {
    nlohmann::json table;
    try {
        table = nlohmann::json::parse(read_file_content(config));
    } catch (nlohmann::json::exception &e) {
        throw invalid_argument("language table " + config.string() + " is not valid JSON: " + e.what());
    }
    if (!table.is_array())
        throw invalid_argument("language table " + config.string() + " must be an array");

    for (auto &entry : table) {
        language lang;
        lang.name = nlohmann::get_value<string>(entry, "name");
        lang.source_file = nlohmann::get_value<string>(entry, "source_file");
        lang.compile_command = nlohmann::get_value<vector<string>>(entry, "compile");
        lang.artifact_files = nlohmann::get_value<vector<string>>(entry, "artifacts");
        lang.run_command = nlohmann::get_value<vector<string>>(entry, "run");
        LOG(INFO) << "Loaded language " << lang.name << " from " << config;
        add(move(lang));
    }
}

}  // namespace codegrade
