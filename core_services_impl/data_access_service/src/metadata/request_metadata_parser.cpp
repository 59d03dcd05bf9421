#include "core_services/data_access/request_metadata_parser.h"
#include "common_utils/utilities/exceptions.h"
#include "common_utils/utilities/logging_utils.h"

#include <fstream>
#include <set>
#include <sstream>

#include <nlohmann/json.hpp>

namespace rastercube::core_services::data_access {

using common_utils::ValidationException;
using nlohmann::json;

namespace {

std::string requireString(const json& object, const char* key, const std::string& context) {
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        throw ValidationException(context + ": '" + key + "' must be a string");
    }
    return it->get<std::string>();
}

std::string stringOr(const json& object, const char* key, const std::string& fallback = "") {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return fallback;
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    return it->dump();
}

std::optional<std::string> optionalString(const json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_string()) {
        throw ValidationException(std::string("'") + key + "' must be a string or null");
    }
    return it->get<std::string>();
}

BandDescriptor parseBand(const json& node, const std::string& context) {
    if (!node.is_object()) {
        throw ValidationException(context + ": band entry must be an object");
    }

    BandDescriptor band;
    auto number = node.find("number");
    if (number == node.end() || !number->is_number_integer()) {
        throw ValidationException(context + ": band 'number' must be an integer");
    }
    band.number = number->get<int>();
    band.variableName = requireString(node, "variable_name", context);
    band.time = optionalString(node, "time");
    band.timePattern = optionalString(node, "time_pattern");

    if (auto dtype = optionalString(node, "dtype")) {
        DataType dataType = dataTypeFromString(*dtype);
        if (dataType == DataType::Unknown) {
            throw ValidationException(context + ": unknown dtype '" + *dtype + "'");
        }
        band.dataType = dataType;
    }
    auto noData = node.find("nodata");
    if (noData != node.end() && !noData->is_null()) {
        if (!noData->is_number()) {
            throw ValidationException(context + ": 'nodata' must be a number");
        }
        band.noData = noData->get<double>();
    }
    return band;
}

void parseDirectForm(const json& document, RequestMetadata& metadata) {
    const json& files = document.at("files");
    if (!files.is_array()) {
        throw ValidationException("'files' must be an array");
    }

    for (size_t i = 0; i < files.size(); ++i) {
        const json& node = files[i];
        const std::string context = "files[" + std::to_string(i) + "]";
        if (!node.is_object()) {
            throw ValidationException(context + " must be an object");
        }

        FileDescriptor file;
        file.location = requireString(node, "url", context);
        auto bands = node.find("bands");
        if (bands == node.end() || !bands->is_array()) {
            throw ValidationException(context + ": 'bands' must be an array");
        }
        for (const auto& band : *bands) {
            file.bands.push_back(parseBand(band, context + " (" + file.location + ")"));
        }
        metadata.files.push_back(std::move(file));
    }
}

void parseObjectStoreForm(const json& document, RequestMetadata& metadata) {
    ObjectStoreSource source;

    const json& bucket = document.at("bucket");
    source.bucket.name = requireString(bucket, "name", "bucket");
    source.bucket.prefix = stringOr(bucket, "prefix");

    auto credentials = document.find("credentials");
    if (credentials == document.end() || !credentials->is_object()) {
        throw ValidationException("object-store request requires a 'credentials' object");
    }
    source.credentials.accessKeyId = requireString(*credentials, "access_key_id", "credentials");
    source.credentials.secretAccessKey = requireString(*credentials, "secret_access_key", "credentials");
    source.credentials.sessionToken = stringOr(*credentials, "session_token");
    source.credentials.expiration = stringOr(*credentials, "expiration");

    auto mapping = document.find("file_mapping");
    if (mapping == document.end() || !mapping->is_object()) {
        throw ValidationException("object-store request requires a 'file_mapping' object");
    }
    for (auto it = mapping->begin(); it != mapping->end(); ++it) {
        const std::string context = "file_mapping['" + it.key() + "']";
        FileLayout layout;
        auto bands = it->find("bands");
        if (bands == it->end() || !bands->is_array()) {
            throw ValidationException(context + ": 'bands' must be an array");
        }
        for (const auto& band : *bands) {
            if (!band.is_string()) {
                throw ValidationException(context + ": band names must be strings");
            }
            layout.bands.push_back(band.get<std::string>());
        }
        layout.dtype = stringOr(*it, "dtype", stringOr(*it, "type"));
        source.fileMapping.emplace(it.key(), std::move(layout));
    }

    metadata.objectStore = std::move(source);
}

} // namespace

RequestMetadata RequestMetadataParser::parse(const std::string& jsonText) {
    json document;
    try {
        document = json::parse(jsonText);
    } catch (const json::parse_error& e) {
        throw ValidationException("Failed to parse request metadata JSON: " + std::string(e.what()));
    }
    return fromJson(document);
}

RequestMetadata RequestMetadataParser::parseFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw common_utils::ResourceNotFoundException("Could not open request metadata file: " + path.string());
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str());
}

RequestMetadata RequestMetadataParser::fromJson(const json& document) {
    if (!document.is_object()) {
        throw ValidationException("Request metadata must be a JSON object");
    }

    RequestMetadata metadata;
    try {
        metadata.providerName = stringOr(document, "provider_name");
        metadata.datasetId = stringOr(document, "dataset_id");
        metadata.datasetName = stringOr(document, "dataset_name");
        metadata.datasetCrs = optionalString(document, "dataset_crs");
        metadata.aoiId = stringOr(document, "aoi_id");
        metadata.dataRequestId = stringOr(document, "data_request_id");

        const bool hasFiles = document.contains("files");
        const bool hasBucket = document.contains("bucket");
        if (hasFiles == hasBucket) {
            throw ValidationException("Request metadata must contain exactly one of 'files' or 'bucket'");
        }
        if (hasFiles) {
            parseDirectForm(document, metadata);
        } else {
            parseObjectStoreForm(document, metadata);
        }
    } catch (const json::exception& e) {
        throw ValidationException("Malformed request metadata: " + std::string(e.what()));
    }

    validate(metadata);
    LOG_DEBUG("Parsed request metadata {} ({} form)", metadata.dataRequestId,
              metadata.isObjectStoreForm() ? "object-store" : "direct");
    return metadata;
}

void RequestMetadataParser::validate(const RequestMetadata& metadata) {
    for (const auto& file : metadata.files) {
        if (file.location.empty()) {
            throw ValidationException("File entry has an empty url");
        }
        std::set<int> seen;
        for (const auto& band : file.bands) {
            if (band.number < 1) {
                throw ValidationException("Band number " + std::to_string(band.number) + " in '" +
                                          file.location + "' must be >= 1");
            }
            if (!seen.insert(band.number).second) {
                throw ValidationException("Duplicate band number " + std::to_string(band.number) +
                                          " in '" + file.location + "'");
            }
            if (band.variableName.empty()) {
                throw ValidationException("Band " + std::to_string(band.number) + " in '" +
                                          file.location + "' has an empty variable name");
            }
        }
    }

    if (metadata.objectStore) {
        if (metadata.objectStore->bucket.name.empty()) {
            throw ValidationException("Bucket name must not be empty");
        }
        for (const auto& [filename, layout] : metadata.objectStore->fileMapping) {
            for (const auto& variableName : layout.bands) {
                if (variableName.empty()) {
                    throw ValidationException("file_mapping['" + filename + "'] has an empty variable name");
                }
            }
        }
    }
}

} // namespace rastercube::core_services::data_access
