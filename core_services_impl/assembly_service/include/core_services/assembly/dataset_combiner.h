/**
 * @file dataset_combiner.h
 * @brief 把各变量数组合并为一个数据集，空间轴冲突时按签名分组回退
 */

#pragma once

#include "core_services/assembly/assembled_dataset.h"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace rastercube::core_services::assembly {

struct CombineResult {
    std::vector<AssembledDataset::Variable> variables;
    std::vector<std::string> excluded;
    std::vector<AssemblyDiagnostic> diagnostics;
};

/**
 * @brief 数据集组合器
 *
 * 所有变量的 y、x 坐标及 CRS 完全一致时直接合并。否则按空间签名
 * （排序后的空间轴名称及长度）分组，保留成员最多的组（并列时取最先出现的组），
 * 组内再只保留与首个成员坐标及 CRS 一致的变量，其余变量被排除并记录诊断。
 * 时间轴属于各变量自身，不参与比较。
 */
class DatasetCombiner {
public:
    /**
     * @param variables 按变量首次出现的顺序排列
     * @throws NoAssemblableDataException 没有任何变量
     * @throws CombineIncompatibleException 回退后没有任何变量保留
     */
    CombineResult combine(std::vector<AssembledDataset::Variable> variables) const;

    /**
     * @brief 空间签名，如 "x:10,y:10"
     */
    static std::string signature(const GriddedArray& array);

    /**
     * @brief candidate 的 y、x 坐标或 CRS 与 reference 不一致时返回描述
     */
    static std::optional<std::string> describeMismatch(const AssembledDataset::Variable& reference,
                                                       const AssembledDataset::Variable& candidate);

    /**
     * @brief 查找第一个与首个变量坐标或 CRS 不一致的变量
     * @return 冲突描述，没有冲突时为空
     */
    static std::optional<std::string> findConflict(const std::vector<AssembledDataset::Variable>& variables);
};

} // namespace rastercube::core_services::assembly
