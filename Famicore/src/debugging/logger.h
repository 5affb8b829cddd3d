#pragma once

#include <quill/Logger.h>
#include <quill/Frontend.h>
#include <quill/Backend.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>
#include <quill/backend/PatternFormatter.h>
#include <quill/LogMacros.h>
#include <string>
#include <string_view>

struct LoggerOptions {
    std::string pattern =
        "%(time) [%(thread_id)] %(short_source_location:<28) "
        "LOG_%(log_level:<9) %(logger:<12) %(message)";
    std::string timestampPattern = "%H:%M:%S.%Qns";
    quill::LogLevel level = quill::LogLevel::Info;

    // Also write to this file when non-empty.
    std::string logFile;
};

void initLogger(const LoggerOptions& options = LoggerOptions{});
void shutdownLogger();

void logInfo(std::string_view msg);
void logWarn(std::string_view msg);
void logError(std::string_view msg);
void logDebug(std::string_view msg);

bool debugLoggingEnabled();

void enableDebugLogging();
void disableDebugLogging();

quill::Logger* getQuillLogger();
