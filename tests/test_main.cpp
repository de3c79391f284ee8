#define CATCH_CONFIG_MAIN
#include <catch2/catch_all.hpp>
#include <apisrv/util/logger.hpp>
#include <cstdlib>

// Global test event listener to initialize logging
class LoggingInitializer : public Catch::EventListenerBase {
public:
    using Catch::EventListenerBase::EventListenerBase;

    void testRunStarting(Catch::TestRunInfo const&) override {
        static bool initialized = false;
        if (!initialized) {
            apisrv::logging::enable();

            // Set log level based on environment variable or default to warn
            const char* log_level_env = std::getenv("APISRV_LOG_LEVEL");
            if (log_level_env) {
                std::string level_str(log_level_env);
                if (level_str == "trace") {
                    apisrv::logging::set_log_level(spdlog::level::trace);
                } else if (level_str == "debug") {
                    apisrv::logging::set_log_level(spdlog::level::debug);
                } else if (level_str == "info") {
                    apisrv::logging::set_log_level(spdlog::level::info);
                } else if (level_str == "warn") {
                    apisrv::logging::set_log_level(spdlog::level::warn);
                } else if (level_str == "error") {
                    apisrv::logging::set_log_level(spdlog::level::err);
                } else if (level_str == "off") {
                    apisrv::logging::set_log_level(spdlog::level::off);
                }
            } else {
                apisrv::logging::set_log_level(spdlog::level::warn);
            }

            initialized = true;

            LOG_INFO("Test logging initialized. Level: {}",
                     log_level_env ? log_level_env : "warn");
        }
    }
};

CATCH_REGISTER_LISTENER(LoggingInitializer)

int main(int argc, char* argv[]) {
    return Catch::Session().run(argc, argv);
}
