#include "logger.h"

#include <memory>
#include <vector>

static quill::Logger* g_logger = nullptr;

static bool debugLogging = false;

void initLogger(const LoggerOptions& options) {
    if (!quill::Backend::is_running()) {

        quill::BackendOptions backOptions;
        backOptions.check_backend_singleton_instance = true;
        backOptions.sleep_duration = std::chrono::milliseconds(1);
        backOptions.sink_min_flush_interval = std::chrono::milliseconds(10);
        backOptions.wait_for_queues_to_empty_before_exit = true;

        quill::Backend::start(backOptions);
    }

    std::vector<std::shared_ptr<quill::Sink>> sinks;
    sinks.push_back(quill::Frontend::create_or_get_sink<quill::ConsoleSink>("console_sink"));

    if (!options.logFile.empty()) {
        quill::FileSinkConfig fileConfig;
        fileConfig.set_open_mode('w');
        sinks.push_back(quill::Frontend::create_or_get_sink<quill::FileSink>(
            options.logFile, fileConfig, quill::FileEventNotifier{}));
    }

    quill::PatternFormatterOptions format{
        options.pattern,
        options.timestampPattern,
        quill::Timezone::LocalTime
    };

    g_logger = quill::Frontend::create_or_get_logger("famicore", sinks, format);
    g_logger->set_log_level(options.level);
}

void shutdownLogger() {
    if (!g_logger) return;
    g_logger->flush_log();
    quill::Frontend::remove_logger(g_logger);
    quill::Backend::stop();
    g_logger = nullptr;
}

void logInfo(std::string_view msg) {
    if (debugLoggingEnabled()) {
        LOG_INFO(getQuillLogger(), "{}", msg);
    }
}

void logWarn(std::string_view msg) {
    if (debugLoggingEnabled()) {
        LOG_WARNING(getQuillLogger(), "{}", msg);
    }
}

void logError(std::string_view msg) {
    if (debugLoggingEnabled()) {
        LOG_ERROR(getQuillLogger(), "{}", msg);
    }
}

void logDebug(std::string_view msg) {
    if (debugLoggingEnabled()) {
        LOG_DEBUG(getQuillLogger(), "{}", msg);
    }
}

bool debugLoggingEnabled() {
    return debugLogging;
}

void enableDebugLogging() {
    debugLogging = true;
}

void disableDebugLogging() {
    debugLogging = false;
}

quill::Logger* getQuillLogger() {
    if (!g_logger) {
        initLogger();
    }
    return g_logger;
}
