#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace codegrade {

/**
 * @brief How programs of one language are built and run.
 * Commands run inside the scratch directory of a sandbox run.
 */
struct language {
    /**
     * @brief Name used in requests, like "c" or "python3".
     */
    std::string name;

    /**
     * @brief File name the submitted code is written to, like "main.c".
     */
    std::string source_file;

    /**
     * @brief Command that builds source_file, like {"gcc", "-o", "main", "main.c"}.
     * For interpreted languages a syntax check.
     */
    std::vector<std::string> compile_command;

    /**
     * @brief Files kept from the compilation directory as the artifact.
     */
    std::vector<std::string> artifact_files;

    /**
     * @brief Command that runs the artifact, like {"./main"}.
     */
    std::vector<std::string> run_command;
};

/**
 * @brief Languages a judge accepts, looked up by name.
 * Filled once at startup and read-only afterwards.
 */
struct language_registry {
    /**
     * @brief Registry with the built-in languages c, cpp and python3.
     */
    static language_registry defaults();

    /**
     * @brief Add or replace a language.
     * @throw std::invalid_argument if a command is empty or a file name is unsafe
     */
    void add(language lang);

    /**
     * @return the language, or nullptr if it is not supported
     */
    const language *find(const std::string &name) const;

    std::vector<std::string> names() const;

    /**
     * @brief Add the languages of a JSON table to this registry.
     * The table is an array of objects with fields name, source_file,
     * compile, artifacts and run.
     * @throw std::invalid_argument if the table is malformed
     */
    void load(const std::filesystem::path &config);

private:
    std::map<std::string, language> languages;
};

}  // namespace codegrade
