#include "workpipe/logger/ConsoleLogger.hpp"

#include <iostream>

namespace workpipe {
void ConsoleLogger::logMessage(std::string_view msg) {
    std::cout << "[INFO] " << msg << std::endl;
}

void ConsoleLogger::logWarning(std::string_view msg) {
    std::cerr << "[WARN] " << msg << std::endl;
}

void ConsoleLogger::logError(std::string_view msg) {
    std::cerr << "[ERROR] " << msg << std::endl;
}
}
