/**
 * @file variable_merger.h
 * @brief 单个变量的平面合并：排序、并行加载、时间轴拼接
 */

#pragma once

#include "core_services/assembly/assembled_dataset.h"
#include "core_services/assembly/assembler_options.h"
#include "core_services/data_access/i_band_reader.h"
#include "core_services/data_access/i_grid_aligner.h"
#include "common_utils/async/cancellation_token.h"
#include "common_utils/async/retry_policy.h"
#include "common_utils/infrastructure/task_pool.h"
#include "common_utils/time/time_parser.h"

#include <optional>
#include <string>
#include <vector>

namespace rastercube::core_services::assembly {

/**
 * @brief 变量的一个来源平面 (文件, 波段)
 */
struct PlaneSource {
    std::string location;
    BandDescriptor band;
    std::optional<RasterHeader> knownHeader;
};

struct MergeResult {
    std::optional<GriddedArray> array;             // 没有任何可用平面时为空
    std::vector<AssemblyDiagnostic> diagnostics;
};

/**
 * @brief 变量合并器
 *
 * 平面按解析后的时间稳定排序（哨兵值在前），在 TaskPool 上并行加载，
 * 再按排序顺序收集结果，因此输出与调度顺序无关。
 */
class VariableMerger {
public:
    /**
     * @param aligner 可为空；仅在 options.alignGrids 为 true 时使用
     */
    VariableMerger(IBandReader& reader,
                   const common_utils::async::RetryExecutor& retry,
                   const common_utils::time::TimeParser& timeParser,
                   common_utils::infrastructure::TaskPool& pool,
                   const AssemblerOptions& options,
                   IGridAligner* aligner = nullptr);

    /**
     * @throws TimeParseException 显式时间格式不匹配
     * @throws TransientIOException 重试耗尽且加载失败策略为 fail
     * @throws BandOutOfRangeException 波段号越界
     * @throws DimensionMismatchException 时间平面空间轴不一致
     * @throws AmbiguousTimeAxisException 策略为 reject 且有平面会被丢弃
     * @throws OperationCancelledException
     */
    MergeResult merge(const std::string& variableName,
                      const std::vector<PlaneSource>& sources,
                      const AccessContext& access,
                      const common_utils::async::CancellationToken& cancellation);

private:
    struct TimedSource {
        const PlaneSource* source;
        CalendarTime time;
    };

    std::vector<TimedSource> sortByTime(const std::string& variableName,
                                        const std::vector<PlaneSource>& sources,
                                        std::vector<AssemblyDiagnostic>& diagnostics) const;

    std::vector<std::optional<GriddedArray>> loadAll(const std::string& variableName,
                                                     const std::vector<TimedSource>& ordered,
                                                     const AccessContext& access,
                                                     const common_utils::async::CancellationToken& cancellation,
                                                     std::vector<AssemblyDiagnostic>& diagnostics);

    IBandReader& reader_;
    const common_utils::async::RetryExecutor& retry_;
    const common_utils::time::TimeParser& timeParser_;
    common_utils::infrastructure::TaskPool& pool_;
    const AssemblerOptions& options_;
    IGridAligner* aligner_;
};

} // namespace rastercube::core_services::assembly
