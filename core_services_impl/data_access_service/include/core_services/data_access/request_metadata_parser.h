/**
 * @file request_metadata_parser.h
 * @brief 请求元数据 JSON 解码 (nlohmann/json)
 */

#pragma once

#include "core_services/data_access/request_metadata.h"

#include <filesystem>
#include <string>

#include <nlohmann/json_fwd.hpp>

namespace rastercube::core_services::data_access {

/**
 * @brief 解析两种元数据形态
 *
 * 含 "files" 键时按直接 URL 形态解析，含 "bucket" 键时按对象存储形态
 * 解析。所有校验在任何 I/O 之前完成，失败抛出 ValidationException。
 */
class RequestMetadataParser {
public:
    static RequestMetadata parse(const std::string& jsonText);

    /**
     * @throws ResourceNotFoundException 文件不存在
     */
    static RequestMetadata parseFile(const std::filesystem::path& path);

    static RequestMetadata fromJson(const nlohmann::json& document);

    /**
     * @brief 波段号唯一且 >= 1、变量名非空
     */
    static void validate(const RequestMetadata& metadata);
};

} // namespace rastercube::core_services::data_access
