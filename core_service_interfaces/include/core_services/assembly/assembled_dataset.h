/**
 * @file assembled_dataset.h
 * @brief 装配结果与诊断信息
 */

#pragma once

#include "core_services/gridded_array.h"

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace rastercube {
namespace core_services {

enum class DiagnosticSeverity {
    Debug,
    Info,
    Warning,
    Error
};

enum class DiagnosticKind {
    UNMAPPED_OBJECT_KEY,     // 对象键没有对应的波段布局
    MISSING_TIMESTAMP,       // 对象键中没有时间段
    UNPARSED_TIME,           // 备选格式都无法解析时间
    LOAD_FAILURE,            // 平面加载失败并被跳过
    EMPTY_VARIABLE,          // 变量没有任何平面
    DISCARDED_PLANE,         // 平面因时间轴规则被丢弃
    EXCLUDED_VARIABLES,      // 组合回退时被排除的变量
    GRID_ALIGNED             // 平面被重投影到参考网格
};

std::string toString(DiagnosticSeverity severity);
std::string toString(DiagnosticKind kind);

/**
 * @brief 一次装配运行中的非致命事件
 */
struct AssemblyDiagnostic {
    DiagnosticSeverity severity = DiagnosticSeverity::Info;
    DiagnosticKind kind = DiagnosticKind::EMPTY_VARIABLE;
    std::string subject;     // 变量名或对象键
    std::string message;

    std::string toString() const;
};

/**
 * @brief 装配结果：有序的变量表、来源属性和诊断记录
 */
class AssembledDataset {
public:
    using Variable = std::pair<std::string, GriddedArray>;

    AssembledDataset(std::vector<Variable> variables,
                     std::map<std::string, std::string> attributes,
                     std::vector<AssemblyDiagnostic> diagnostics);

    const std::vector<Variable>& variables() const { return variables_; }

    std::vector<std::string> variableNames() const;

    bool contains(const std::string& name) const;

    /**
     * @throws ResourceNotFoundException 变量不存在
     */
    const GriddedArray& variable(const std::string& name) const;

    const std::map<std::string, std::string>& attributes() const { return attributes_; }

    std::optional<std::string> attribute(const std::string& key) const;

    const std::vector<AssemblyDiagnostic>& diagnostics() const { return diagnostics_; }

    std::vector<AssemblyDiagnostic> diagnosticsOfKind(DiagnosticKind kind) const;

private:
    std::vector<Variable> variables_;
    std::map<std::string, std::string> attributes_;
    std::vector<AssemblyDiagnostic> diagnostics_;
};

} // namespace core_services
} // namespace rastercube
