#include "core_services/assembly/variable_merger.h"
#include "core_services/exceptions.h"
#include "common_utils/utilities/logging_utils.h"

#include <algorithm>
#include <utility>

namespace rastercube::core_services::assembly {

using common_utils::async::CancellationToken;

namespace {

std::string describeSource(const PlaneSource& source) {
    return source.location + "#" + std::to_string(source.band.number);
}

bool hasRawTime(const BandDescriptor& band) {
    return band.time && band.time->find_first_not_of(" \t\r\n") != std::string::npos;
}

} // anonymous namespace

VariableMerger::VariableMerger(IBandReader& reader,
                               const common_utils::async::RetryExecutor& retry,
                               const common_utils::time::TimeParser& timeParser,
                               common_utils::infrastructure::TaskPool& pool,
                               const AssemblerOptions& options,
                               IGridAligner* aligner)
    : reader_(reader),
      retry_(retry),
      timeParser_(timeParser),
      pool_(pool),
      options_(options),
      aligner_(aligner) {
}

std::vector<VariableMerger::TimedSource> VariableMerger::sortByTime(
    const std::string& variableName,
    const std::vector<PlaneSource>& sources,
    std::vector<AssemblyDiagnostic>& diagnostics) const {

    std::vector<TimedSource> ordered;
    ordered.reserve(sources.size());
    for (const auto& source : sources) {
        const auto time = timeParser_.parse(source.band.time, source.band.timePattern);
        if (!time.isValid() && hasRawTime(source.band)) {
            // 只有备选格式模式会走到这里，显式格式失败已经抛出
            diagnostics.push_back({DiagnosticSeverity::Warning, DiagnosticKind::UNPARSED_TIME, variableName,
                                   "time '" + *source.band.time + "' of " + describeSource(source) +
                                   " matched no fallback format; treated as untimed"});
        }
        ordered.push_back({&source, time});
    }

    std::stable_sort(ordered.begin(), ordered.end(), [](const TimedSource& a, const TimedSource& b) {
        return a.time < b.time;
    });
    return ordered;
}

std::vector<std::optional<GriddedArray>> VariableMerger::loadAll(
    const std::string& variableName,
    const std::vector<TimedSource>& ordered,
    const AccessContext& access,
    const CancellationToken& cancellation,
    std::vector<AssemblyDiagnostic>& diagnostics) {

    std::vector<boost::future<GriddedArray>> futures;
    futures.reserve(ordered.size());
    for (const auto& entry : ordered) {
        PlaneSource source = *entry.source;
        futures.push_back(pool_.submitTask([this, source, access, cancellation]() {
            cancellation.throwIfCancelled("band load");
            const std::string description = "load " + describeSource(source);
            return retry_.execute([&]() {
                if (source.knownHeader) {
                    return reader_.readWithHeader(source.location, source.band, *source.knownHeader, access);
                }
                return reader_.read(source.location, source.band, access);
            }, description);
        }));
    }

    // 先等待全部任务结束，再按排序顺序处理结果和错误
    std::vector<std::optional<GriddedArray>> planes(ordered.size());
    std::vector<boost::exception_ptr> errors(ordered.size());
    for (size_t i = 0; i < futures.size(); ++i) {
        futures[i].wait();
        if (futures[i].has_exception()) {
            errors[i] = futures[i].get_exception_ptr();
        } else {
            planes[i] = futures[i].get();
        }
    }

    for (size_t i = 0; i < errors.size(); ++i) {
        if (!errors[i]) {
            continue;
        }
        try {
            boost::rethrow_exception(errors[i]);
        } catch (const TransientIOException& e) {
            if (options_.loadFailurePolicy != LoadFailurePolicy::SKIP) {
                RASTERCUBE_LOG_ERROR("Assembly", "Variable '{}': {} failed after {} attempts: {}",
                                     variableName, describeSource(*ordered[i].source),
                                     retry_.policy().maxAttempts, e.what());
                throw;
            }
            RASTERCUBE_LOG_ERROR("Assembly", "Variable '{}': skipping {}: {}",
                                 variableName, describeSource(*ordered[i].source), e.what());
            diagnostics.push_back({DiagnosticSeverity::Error, DiagnosticKind::LOAD_FAILURE, variableName,
                                   describeSource(*ordered[i].source) + ": " + e.what()});
        }
    }
    return planes;
}

MergeResult VariableMerger::merge(const std::string& variableName,
                                  const std::vector<PlaneSource>& sources,
                                  const AccessContext& access,
                                  const CancellationToken& cancellation) {
    MergeResult result;

    const auto ordered = sortByTime(variableName, sources, result.diagnostics);
    auto loaded = loadAll(variableName, ordered, access, cancellation, result.diagnostics);

    std::vector<GriddedArray> timed;
    std::vector<GriddedArray> untimed;
    std::vector<std::string> untimedOrigins;
    for (size_t i = 0; i < ordered.size(); ++i) {
        if (!loaded[i]) {
            continue;
        }
        if (ordered[i].time.isValid()) {
            timed.push_back(loaded[i]->expandTime(ordered[i].time));
        } else {
            untimed.push_back(std::move(*loaded[i]));
            untimedOrigins.push_back(describeSource(*ordered[i].source));
        }
    }

    if (timed.empty() && untimed.empty()) {
        RASTERCUBE_LOG_WARN("Assembly", "Variable '{}' has no loadable planes; omitted", variableName);
        result.diagnostics.push_back({DiagnosticSeverity::Warning, DiagnosticKind::EMPTY_VARIABLE, variableName,
                                      "no planes could be loaded; variable omitted"});
        return result;
    }

    if (options_.alignGrids && aligner_ != nullptr && timed.size() > 1) {
        const GridGeometry reference = timed.front().geometry();
        for (size_t i = 1; i < timed.size(); ++i) {
            if (timed[i].geometry() == reference) {
                continue;
            }
            RASTERCUBE_LOG_INFO("Assembly", "Variable '{}': aligning {} onto {}",
                                variableName, timed[i].geometry().toString(), reference.toString());
            result.diagnostics.push_back({DiagnosticSeverity::Info, DiagnosticKind::GRID_ALIGNED, variableName,
                                          timed[i].geometry().toString() + " -> " + reference.toString()});
            timed[i] = aligner_->align(timed[i], reference);
        }
    }

    cancellation.throwIfCancelled("time concatenation");

    // 候选顺序: [时间拼接结果, 无时间平面...]，只有第一个成为最终数组
    size_t discardFrom = 0;
    if (!timed.empty()) {
        result.array = timed.size() == 1 ? timed.front() : GriddedArray::concatenateTime(timed);
    } else {
        result.array = untimed.front();
        discardFrom = 1;
    }

    if (discardFrom < untimed.size()) {
        const size_t discarded = untimed.size() - discardFrom;
        if (options_.untimedPlanePolicy == UntimedPlanePolicy::REJECT) {
            throw AmbiguousTimeAxisException(
                "Variable '" + variableName + "' has " + std::to_string(discarded) +
                " plane(s) without a time coordinate that cannot be placed on its time axis (first: " +
                untimedOrigins[discardFrom] + ")");
        }
        for (size_t i = discardFrom; i < untimed.size(); ++i) {
            RASTERCUBE_LOG_WARN("Assembly", "Variable '{}': discarding untimed plane {}",
                                variableName, untimedOrigins[i]);
            result.diagnostics.push_back({DiagnosticSeverity::Warning, DiagnosticKind::DISCARDED_PLANE,
                                          variableName, untimedOrigins[i] + " discarded"});
        }
    }

    RASTERCUBE_LOG_DEBUG("Assembly", "Variable '{}' merged: {}", variableName, result.array->describe());
    return result;
}

} // namespace rastercube::core_services::assembly
