/**
 * @file command.hpp
 * @brief marginalia-id command dispatch
 *
 * Converts annotation identifiers between their URL-safe and UUID forms
 * and escapes/unescapes selector documents, for use from shell scripts
 * and when inspecting the database by hand.
 */

#pragma once

#include <iosfwd>
#include <string>
#include <vector>

namespace marginalia::cli {

constexpr int kExitOk = 0;
constexpr int kExitInvalid = 1;   // an identifier or document was rejected
constexpr int kExitUsage = 2;     // bad command line or configuration

/**
 * @brief Run one marginalia-id invocation
 *
 * @param args Command line without the program name
 * @param in   Document input for escape/unescape when no FILE is given
 * @param out  Converted values, documents and --help text
 * @param err  Error messages and usage after a usage error
 * @return kExitOk, kExitInvalid or kExitUsage
 */
int run(const std::vector<std::string>& args, std::istream& in, std::ostream& out, std::ostream& err);

} // namespace marginalia::cli
