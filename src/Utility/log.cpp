#include "log.hpp"

#include <cstdlib>
#include <iostream>
#include <string>

using namespace std;

bool Log::quietMode = false;
bool Log::verboseMode = false;

void Log::initFromEnvironment() {
    const char* value = getenv("SPLHDR_VERBOSE");
    if (value != nullptr && string(value) != "" && string(value) != "0") {
        verboseMode = true;
    }
}

void Log::info(const string& message) {
    if (!quietMode) {
        cout << message << endl;
    }
}

void Log::detail(const string& message) {
    if (verboseMode && !quietMode) {
        cout << "  " << message << endl;
    }
}

void Log::error(const string& message) {
    cerr << message << endl;
}
