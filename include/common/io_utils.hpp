#pragma once

#include <filesystem>
#include <string>

namespace codegrade {

/**
 * @brief Read the whole content of a file.
 * @throw std::system_error if the file cannot be opened
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief Read the whole content of a file.
 * @param def returned when the file does not exist
 */
std::string read_file_content(std::filesystem::path const &path, const std::string &def);

/**
 * @brief Replace the content of a file, creating it when needed.
 * @throw std::system_error if the file cannot be written
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

/**
 * @brief Make sure a file name cannot escape the directory it is joined to.
 * The sandbox joins file names from the language table to scratch
 * directories, an absolute path or a "../" would let it touch files
 * outside of them.
 * @param subpath the file name to check
 * @return subpath unchanged
 * @throw std::invalid_argument if subpath is absolute or walks upwards
 */
std::string assert_safe_path(const std::string &subpath);

}  // namespace codegrade
