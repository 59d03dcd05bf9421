#include "core_services/assembly/assembler_options.h"
#include "common_utils/utilities/app_config_loader.h"
#include "common_utils/utilities/exceptions.h"
#include "common_utils/utilities/string_utils.h"

#include <sstream>

namespace rastercube::core_services::assembly {

using common_utils::ConfigurationException;
using common_utils::StringUtils;

UntimedPlanePolicy untimedPlanePolicyFromString(const std::string& name) {
    const std::string lower = StringUtils::toLower(StringUtils::trim(name));
    if (lower == "reject") return UntimedPlanePolicy::REJECT;
    if (lower == "keep_first") return UntimedPlanePolicy::KEEP_FIRST;
    throw ConfigurationException("Unknown untimed plane policy '" + name + "' (expected reject or keep_first)");
}

LoadFailurePolicy loadFailurePolicyFromString(const std::string& name) {
    const std::string lower = StringUtils::toLower(StringUtils::trim(name));
    if (lower == "fail") return LoadFailurePolicy::FAIL;
    if (lower == "skip") return LoadFailurePolicy::SKIP;
    throw ConfigurationException("Unknown load failure policy '" + name + "' (expected fail or skip)");
}

std::string toString(UntimedPlanePolicy policy) {
    return policy == UntimedPlanePolicy::REJECT ? "reject" : "keep_first";
}

std::string toString(LoadFailurePolicy policy) {
    return policy == LoadFailurePolicy::FAIL ? "fail" : "skip";
}

void AssemblerOptions::registerDefaults(common_utils::AppConfigLoader& config) {
    config.setDefault("retry.max_attempts", "5", "Attempts per file/band load");
    config.setDefault("retry.initial_delay_ms", "1000", "Wait before the first retry");
    config.setDefault("retry.multiplier", "2.0", "Backoff multiplier");
    config.setDefault("assembly.max_concurrent_loads", "4", "Worker threads for band loads");
    config.setDefault("assembly.untimed_plane_policy", "reject", "reject | keep_first");
    config.setDefault("assembly.load_failure_policy", "fail", "fail | skip");
    config.setDefault("assembly.geometry_policy", "verify", "verify | trust_first");
    config.setDefault("assembly.align_grids", "false", "Warp time planes onto the first plane's grid");
    config.setDefault("time.fallback_formats", "%Y-%m-%d,%Y", "Formats tried when no time_pattern is given");
    config.setDefault("reader.chunk_size", "2000", "Read window edge in pixels");
    config.setDefault("object_store.page_size", "1000", "Keys per listing page");
    config.setDefault("object_store.region", "", "AWS region for /vsis3/");
    config.setDefault("object_store.endpoint", "", "S3 endpoint override");
}

AssemblerOptions AssemblerOptions::fromConfig(const common_utils::AppConfigLoader& config) {
    AssemblerOptions options;

    const int maxAttempts = config.getInt("retry.max_attempts", 5);
    const int initialDelay = config.getInt("retry.initial_delay_ms", 1000);
    const int maxConcurrentLoads = config.getInt("assembly.max_concurrent_loads", 4);
    const int pageSize = config.getInt("object_store.page_size", 1000);
    if (maxAttempts < 1) {
        throw ConfigurationException("retry.max_attempts must be at least 1");
    }
    if (initialDelay < 0) {
        throw ConfigurationException("retry.initial_delay_ms must not be negative");
    }
    if (maxConcurrentLoads < 1) {
        throw ConfigurationException("assembly.max_concurrent_loads must be at least 1");
    }
    if (pageSize < 1) {
        throw ConfigurationException("object_store.page_size must be at least 1");
    }

    options.retry.maxAttempts = static_cast<size_t>(maxAttempts);
    options.retry.initialDelay = std::chrono::milliseconds(initialDelay);
    options.retry.multiplier = config.getDouble("retry.multiplier", 2.0);
    options.maxConcurrentLoads = static_cast<size_t>(maxConcurrentLoads);
    options.untimedPlanePolicy = untimedPlanePolicyFromString(
        config.getString("assembly.untimed_plane_policy", "reject"));
    options.loadFailurePolicy = loadFailurePolicyFromString(
        config.getString("assembly.load_failure_policy", "fail"));
    try {
        options.geometryPolicy = data_access::geometryPolicyFromString(
            config.getString("assembly.geometry_policy", "verify"));
    } catch (const common_utils::ValidationException& e) {
        throw ConfigurationException(e.what());
    }
    options.alignGrids = config.getBool("assembly.align_grids", false);
    options.fallbackTimeFormats = config.getStringList("time.fallback_formats", {"%Y-%m-%d", "%Y"});
    options.chunkSize = config.getInt("reader.chunk_size", 2000);
    options.pageSize = static_cast<size_t>(pageSize);
    options.objectStoreRegion = config.getString("object_store.region");
    options.objectStoreEndpoint = config.getString("object_store.endpoint");

    options.validate();
    return options;
}

void AssemblerOptions::validate() const {
    try {
        retry.validate();
    } catch (const common_utils::ValidationException& e) {
        throw ConfigurationException(e.what());
    }
    if (maxConcurrentLoads == 0) {
        throw ConfigurationException("assembly.max_concurrent_loads must be at least 1");
    }
    if (chunkSize <= 0) {
        throw ConfigurationException("reader.chunk_size must be positive");
    }
    if (fallbackTimeFormats.empty()) {
        throw ConfigurationException("time.fallback_formats must list at least one format");
    }
}

std::string AssemblerOptions::toString() const {
    std::ostringstream oss;
    oss << "AssemblerOptions[" << retry.toString()
        << " MaxConcurrentLoads:" << maxConcurrentLoads
        << " UntimedPlanes:" << assembly::toString(untimedPlanePolicy)
        << " LoadFailures:" << assembly::toString(loadFailurePolicy)
        << " Geometry:" << data_access::toString(geometryPolicy)
        << " AlignGrids:" << (alignGrids ? "Yes" : "No")
        << " FallbackFormats:" << StringUtils::join(fallbackTimeFormats, ",")
        << " ChunkSize:" << chunkSize
        << " PageSize:" << pageSize << "]";
    return oss.str();
}

} // namespace rastercube::core_services::assembly
