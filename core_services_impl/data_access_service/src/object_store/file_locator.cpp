/**
 * @file file_locator.cpp
 * @brief 请求文件解析实现
 */

#include "core_services/data_access/file_locator.h"
#include "core_services/exceptions.h"
#include "common_utils/utilities/logging_utils.h"
#include "common_utils/utilities/string_utils.h"

#include <regex>

namespace rastercube::core_services::data_access {

using common_utils::StringUtils;
using common_utils::async::CancellationToken;

GeometryPolicy geometryPolicyFromString(const std::string& name) {
    const std::string lower = StringUtils::toLower(StringUtils::trim(name));
    if (lower == "verify") return GeometryPolicy::VERIFY;
    if (lower == "trust_first") return GeometryPolicy::TRUST_FIRST;
    throw common_utils::ValidationException("Unknown geometry policy '" + name +
                                            "' (expected verify or trust_first)");
}

std::string toString(GeometryPolicy policy) {
    return policy == GeometryPolicy::VERIFY ? "verify" : "trust_first";
}

FileLocator::FileLocator(IObjectStoreClient& objectStore,
                         IBandReader& reader,
                         const common_utils::async::RetryExecutor& retry,
                         FileLocatorOptions options)
    : objectStore_(objectStore), reader_(reader), retry_(retry), options_(options) {}

std::string FileLocator::filenameFromKey(const std::string& key) {
    const auto slash = key.rfind('/');
    std::string name = slash == std::string::npos ? key : key.substr(slash + 1);
    const auto dot = name.rfind('.');
    if (dot != std::string::npos) {
        name = name.substr(0, dot);
    }
    return name;
}

std::optional<std::string> FileLocator::extractTimestamp(const std::string& key) {
    static const std::regex pattern(R"(\d{4}/\d{2}/\d{2}/\d{2}/\d{2}/\d{2})");
    std::smatch match;
    if (std::regex_search(key, match, pattern)) {
        return match.str();
    }
    return std::nullopt;
}

ResolvedFiles FileLocator::resolve(const RequestMetadata& metadata,
                                   const AccessContext& baseAccess,
                                   const CancellationToken& cancellation) {
    if (metadata.isObjectStoreForm()) {
        return resolveObjectStore(metadata, baseAccess, cancellation);
    }

    ResolvedFiles resolved;
    resolved.files = metadata.files;
    resolved.access = baseAccess;
    RASTERCUBE_LOG_INFO("DataAccess", "Request {} lists {} file(s) directly",
                        metadata.dataRequestId, resolved.files.size());
    return resolved;
}

std::vector<std::string> FileLocator::listAllKeys(const ObjectStoreSource& source,
                                                  const AccessContext& access,
                                                  const CancellationToken& cancellation) {
    auto listing = retry_.execute([&]() { return objectStore_.list(source.bucket, access); },
                                  "list s3://" + source.bucket.name + "/" + source.bucket.prefix);

    std::vector<std::string> keys;
    for (;;) {
        cancellation.throwIfCancelled("listing objects");
        std::vector<std::string> page = retry_.execute([&]() { return listing->nextPage(); },
                                                       "list next page");
        if (page.empty()) {
            break;
        }
        keys.insert(keys.end(), page.begin(), page.end());
    }

    RASTERCUBE_LOG_INFO("ObjectStore", "Listed {} object(s) under s3://{}/{}",
                        keys.size(), source.bucket.name, source.bucket.prefix);
    return keys;
}

ResolvedFiles FileLocator::resolveObjectStore(const RequestMetadata& metadata,
                                              const AccessContext& baseAccess,
                                              const CancellationToken& cancellation) {
    const ObjectStoreSource& source = *metadata.objectStore;

    ResolvedFiles resolved;
    resolved.access = baseAccess;
    resolved.access.credentials = source.credentials;

    for (const auto& key : listAllKeys(source, resolved.access, cancellation)) {
        const std::string filename = filenameFromKey(key);
        auto layoutIt = source.fileMapping.find(filename);
        if (layoutIt == source.fileMapping.end()) {
            RASTERCUBE_LOG_DEBUG("ObjectStore", "Skipping unmapped key '{}'", key);
            resolved.diagnostics.push_back({DiagnosticSeverity::Debug, DiagnosticKind::UNMAPPED_OBJECT_KEY,
                                            key, "no file mapping for '" + filename + "'"});
            continue;
        }
        const FileLayout& layout = layoutIt->second;

        std::optional<std::string> timestamp = extractTimestamp(key);
        if (!timestamp) {
            RASTERCUBE_LOG_WARN("ObjectStore", "Key '{}' has no timestamp segment, treating as untimed", key);
            resolved.diagnostics.push_back({DiagnosticSeverity::Warning, DiagnosticKind::MISSING_TIMESTAMP,
                                            key, "no YYYY/MM/DD/HH/MM/SS segment, treated as untimed"});
        } else if (*timestamp == kNoTimeTimestamp) {
            timestamp.reset();
        }

        FileDescriptor file;
        file.location = objectStore_.objectLocation(source.bucket, key);
        const DataType dataType = dataTypeFromString(layout.dtype);
        int bandNumber = 1;
        for (const auto& variableName : layout.bands) {
            BandDescriptor band;
            band.number = bandNumber++;
            band.variableName = variableName;
            if (timestamp) {
                band.time = *timestamp;
                band.timePattern = std::string(kKeyTimestampFormat);
            }
            if (dataType != DataType::Unknown) {
                band.dataType = dataType;
            }
            file.bands.push_back(std::move(band));
        }
        resolved.files.push_back(std::move(file));
    }

    inspectGeometry(resolved, cancellation);
    return resolved;
}

void FileLocator::inspectGeometry(ResolvedFiles& resolved, const CancellationToken& cancellation) {
    std::vector<FileDescriptor> inspected;
    inspected.reserve(resolved.files.size());

    for (auto& file : resolved.files) {
        cancellation.throwIfCancelled("inspecting " + file.location);

        if (resolved.authoritativeHeader && options_.geometryPolicy == GeometryPolicy::TRUST_FIRST) {
            file.knownHeader = resolved.authoritativeHeader;
            inspected.push_back(std::move(file));
            continue;
        }

        RasterHeader header;
        try {
            header = retry_.execute([&]() { return reader_.readHeader(file.location, resolved.access); },
                                    "inspect '" + file.location + "'");
        } catch (const DataAccessException& e) {
            if (!options_.skipUnreadableFiles) {
                throw;
            }
            RASTERCUBE_LOG_ERROR("ObjectStore", "Skipping unreadable object '{}': {}", file.location, e.what());
            resolved.diagnostics.push_back({DiagnosticSeverity::Error, DiagnosticKind::LOAD_FAILURE,
                                            file.location, e.what()});
            continue;
        }

        if (!resolved.authoritativeHeader) {
            RASTERCUBE_LOG_INFO("ObjectStore", "Authoritative grid from '{}': {}",
                                file.location, header.geometry.toString());
            resolved.authoritativeHeader = header;
        } else if (header.geometry != resolved.authoritativeHeader->geometry) {
            throw GeometryMismatchException("Grid of '" + file.location + "' " + header.geometry.toString() +
                                            " differs from the first file's " +
                                            resolved.authoritativeHeader->geometry.toString());
        }

        file.knownHeader = header;
        inspected.push_back(std::move(file));
    }

    resolved.files = std::move(inspected);
}

} // namespace rastercube::core_services::data_access
