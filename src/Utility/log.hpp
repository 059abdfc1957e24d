#ifndef LOG_HPP
#define LOG_HPP

#include <string>

/**
 * @brief Process-wide diagnostic output switches.
 *
 * Summaries go to stdout unless quiet mode is on. Detail lines only appear in
 * verbose mode. Errors always go to stderr.
 */
class Log {
private:
    static bool quietMode;
    static bool verboseMode;

public:
    static void setQuiet(bool quiet) { quietMode = quiet; }
    static bool isQuiet() { return quietMode; }

    static void setVerbose(bool verbose) { verboseMode = verbose; }
    static bool isVerbose() { return verboseMode; }

    // Turns verbose mode on when SPLHDR_VERBOSE is set to anything but "0"
    static void initFromEnvironment();

    static void info(const std::string& message);
    static void detail(const std::string& message);
    static void error(const std::string& message);
};

#endif
