#pragma once

#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include <chrono>
#include <filesystem>
#include <map>
#include <sstream>
#include <string>
#include <vector>

namespace fmt {
template <>
struct formatter<std::filesystem::path> {
    template <typename ParseContext>
    constexpr auto parse(ParseContext &ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(const std::filesystem::path &p, FormatContext &ctx) const {
        return format_to(ctx.out(), "{}", p.string());
    }
};
}  // namespace fmt

namespace codegrade {

template <typename T>
struct to_string_cont {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const T &element) {
        cont.push_back(boost::lexical_cast<std::string>(element));
    }
};

template <>
struct to_string_cont<std::filesystem::path> {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const std::filesystem::path &element) {
        cont.push_back(element.string());
    }
};

template <typename T>
struct to_string_cont<std::vector<T>> {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const std::vector<T> &vec) {
        for (const T &value : vec)
            to_string_cont<T>::to_string(cont, value);
    }
};

/**
 * @brief Convert every argument to a string and append it to cont.
 * Container arguments are flattened element by element.
 */
template <typename ContainerT, typename Head, typename... Args>
void to_string_list(ContainerT &cont, Head &head, Args &... args) {
    to_string_cont<std::decay_t<Head>>::to_string(cont, head);
    if constexpr (sizeof...(args) > 0)
        to_string_list(cont, args...);
}

/**
 * @brief Run an external command and wait for it.
 * @param env additional environment variables
 * @param argv program (argv[0], looked up in PATH) and its arguments
 * @return exit code of the command, -1 if it was killed by a signal
 * @throw std::system_error if fork fails
 */
int exec_program(const std::map<std::string, std::string> &env, const char **argv);

/**
 * @brief Type safe wrapper around exec_program.
 * Unlike system(cmd) no shell is involved, so arguments need no escaping.
 * @code{.cpp}
 *     std::filesystem::path report("/tmp/report.json");
 *     int exitcode = call_process("timeout", 30, "explain", report);
 * @endcode
 */
template <typename... Args>
int call_process_env(std::map<std::string, std::string> const &env, Args &&... args) {
    std::vector<std::string> list;
    to_string_list(list, args...);
    std::vector<const char *> argv(list.size() + 1, nullptr);
    for (size_t i = 0; i < list.size(); ++i)
        argv[i] = list[i].data();

#ifndef NDEBUG
    std::stringstream ss;
    for (size_t i = 0; i < list.size(); ++i)
        ss << argv[i] << ' ';
    LOG(INFO) << ss.str();
#endif

    return exec_program(env, argv.data());
}

template <typename... Args>
int call_process(Args &&... args) {
    return call_process_env({}, args...);
}

/**
 * @brief Look up an environment variable.
 * @return its value, or def_value when unset
 */
std::string get_env(const std::string &key, const std::string &def_value);

/**
 * @brief Cut text down to at most limit bytes.
 * The cut never falls inside a UTF-8 sequence. A marker noting how many bytes were dropped is appended when
 * anything was cut.
 */
std::string truncate_text(const std::string &text, size_t limit);

struct elapsed_time {
    elapsed_time();

    template <typename DurationT>
    DurationT duration() const {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

private:
    std::chrono::steady_clock::time_point start;
};

}  // namespace codegrade
