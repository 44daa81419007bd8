#pragma once

/**
 * @brief Build a visitor for std::visit out of several lambdas.
 * @code{.cpp}
 *     std::visit(overloaded{
 *         [](const source_payload &src) { ... },
 *         [](const compiled_artifact *artifact) { ... }}, payload);
 * @endcode
 */
template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };

template <class... Ts>
overloaded(Ts...)->overloaded<Ts...>;
