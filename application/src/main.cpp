/**
 * @file main.cpp
 * @brief rastercube_assemble 命令行工具
 *
 * 用法:
 *   rastercube_assemble --request=request.json [--config=rastercube.yaml]
 *                       [--materialize] [--log_level=debug] [--retry.max_attempts=3] ...
 *
 * 配置优先级: 命令行 > 环境变量 (RASTERCUBE_*) > YAML 文件 > 默认值。
 * Ctrl+C 请求取消，装配在下一个检查点停止。
 */

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <limits>

#include "common_utils/async/cancellation_token.h"
#include "common_utils/async/signal_cancellation.h"
#include "common_utils/utilities/app_config_loader.h"
#include "common_utils/utilities/exceptions.h"
#include "common_utils/utilities/logging_utils.h"
#include "core_services/assembly/raster_dataset_assembler.h"
#include "core_services/data_access/gdal_environment.h"
#include "core_services/data_access/request_metadata_parser.h"
#include "core_services/exceptions.h"

using namespace rastercube;

namespace {

void printUsage() {
    std::cout << "Usage: rastercube_assemble --request=<metadata.json> [--config=<config.yaml>]"
              << " [--materialize] [--<key>=<value> ...]" << std::endl;
}

void printSummary(const core_services::AssembledDataset& dataset, bool materialize) {
    std::cout << "Attributes:" << std::endl;
    for (const auto& [key, value] : dataset.attributes()) {
        std::cout << "  " << key << " = " << value << std::endl;
    }

    std::cout << "Variables (" << dataset.variables().size() << "):" << std::endl;
    for (const auto& [name, array] : dataset.variables()) {
        std::cout << "  " << name << ": " << array.describe() << std::endl;
        if (array.hasTimeAxis()) {
            std::cout << "    time:";
            for (const auto& t : array.timeCoordinates()) {
                std::cout << " " << t.toISOString();
            }
            std::cout << std::endl;
        }
        if (materialize) {
            const auto& values = array.values();
            double minValue = std::numeric_limits<double>::infinity();
            double maxValue = -std::numeric_limits<double>::infinity();
            size_t nanCount = 0;
            for (double v : values) {
                if (std::isnan(v)) {
                    ++nanCount;
                    continue;
                }
                minValue = std::min(minValue, v);
                maxValue = std::max(maxValue, v);
            }
            std::cout << "    values: " << values.size() << " (nodata " << nanCount << ")";
            if (nanCount < values.size()) {
                std::cout << " min " << minValue << " max " << maxValue;
            }
            std::cout << std::endl;
        }
    }

    if (!dataset.diagnostics().empty()) {
        std::cout << "Diagnostics (" << dataset.diagnostics().size() << "):" << std::endl;
        for (const auto& diagnostic : dataset.diagnostics()) {
            std::cout << "  " << diagnostic.toString() << std::endl;
        }
    }
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        // --- Configuration ---
        common_utils::AppConfigLoader config("rastercube");
        config.setDefault("request", "", "Path of the request metadata JSON");
        config.setDefault("materialize", "false", "Read all pixels and print value statistics");
        core_services::assembly::AssemblerOptions::registerDefaults(config);

        config.loadFromEnvironment("RASTERCUBE_");
        config.loadFromCommandLine(argc, argv);
        const std::string configFile = config.getString("config_file", config.getString("config"));
        if (!configFile.empty()) {
            if (!config.loadFromFile(configFile)) {
                std::cerr << "Config file not found: " << configFile << std::endl;
                return EXIT_FAILURE;
            }
            // 文件不应覆盖环境变量和命令行
            config.loadFromEnvironment("RASTERCUBE_");
            config.loadFromCommandLine(argc, argv);
        }

        const std::string requestPath = config.getString("request");
        if (requestPath.empty()) {
            printUsage();
            return EXIT_FAILURE;
        }

        // --- Logging ---
        common_utils::LoggingConfig loggingConfig;
        loggingConfig.console_level = config.getString("log_level", "info");
        common_utils::LoggingManager::configureGlobal(loggingConfig);
        config.printConfig();

        // --- Initialize Core Systems ---
        core_services::data_access::GdalGlobalInitializer::initialize();

        const auto options = core_services::assembly::AssemblerOptions::fromConfig(config);
        const auto metadata = core_services::data_access::RequestMetadataParser::parseFile(requestPath);
        auto assembler = core_services::assembly::RasterDatasetAssembler::createDefault(options);

        // --- Register Signal Handler for Cancellation ---
        common_utils::async::CancellationToken cancellation;
        int exitCode = EXIT_SUCCESS;
        {
            common_utils::async::ScopedSignalCancellation signalScope(cancellation);
            try {
                const auto dataset = assembler->assemble(metadata, cancellation);
                printSummary(dataset, config.getBool("materialize", false));
            } catch (const common_utils::OperationCancelledException& e) {
                RASTERCUBE_LOG_ERROR("Application", "Assembly cancelled: {}", e.what());
                exitCode = 130;
            } catch (const common_utils::RasterCubeBaseException& e) {
                RASTERCUBE_LOG_ERROR("Application", "Assembly failed: {}", e.what());
                exitCode = EXIT_FAILURE;
            } catch (const std::exception& e) {
                RASTERCUBE_LOG_ERROR("Application", "Unexpected error during assembly: {}", e.what());
                exitCode = EXIT_FAILURE;
            }
        }

        common_utils::LoggingManager::getGlobalInstance().flushAll();
        return exitCode;

    } catch (const std::exception& e) {
        std::cerr << "An unhandled exception occurred: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }
}
