/**
 * @file IconForgeCli.hpp
 * @brief Command-line front end of IconForge.
 */

#pragma once

#include <ostream>
#include <string>
#include <vector>

namespace iconforge::app {

/**
 * @class IconForgeCli
 * @brief Parses the command line, runs one import and writes the resulting JSON.
 *
 * Commands:
 *  - `collection <dir>`: one directory, one record.
 *  - `collections <root>`: one record per directory that holds icons.
 *  - `reprocess <file.json>`: runs an exported record through the pipeline again.
 */
class IconForgeCli {
public:
    enum ExitCode {
        Success = 0,
        UsageError = 1,
        WriteError = 2
    };

    /**
     * @brief Runs the command named by the arguments.
     * @return Exit code for the process.
     */
    int Run(int argc, char** argv);

private:
    struct Options {
        std::string command;
        std::string source;
        std::string output;      ///< File or directory; stdout when empty.
        std::string configPath;  ///< Defaults to the user settings file.
        std::string prefix;
        bool prefixGiven = false;
        bool noSubDirs = false;
        bool verbose = false;
        bool help = false;
    };

    /**
     * @brief Fills m_options from argv.
     * @return Error message, empty when the arguments are valid.
     */
    std::string ParseArguments(const std::vector<std::string>& args);

    int RunCollection();
    int RunCollections();
    int RunReprocess();

    /** @brief Writes text to the output file, or to stdout when no file was given. */
    int Emit(const std::string& path, const std::string& text);

    /** @brief Stream for progress lines: stderr while stdout carries the JSON. */
    std::ostream& Progress() const;

    static void PrintUsage();

    Options m_options;
};

} // namespace iconforge::app
