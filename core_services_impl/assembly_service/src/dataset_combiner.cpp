#include "core_services/assembly/dataset_combiner.h"
#include "core_services/exceptions.h"
#include "common_utils/utilities/logging_utils.h"
#include "common_utils/utilities/string_utils.h"

#include <map>

namespace rastercube::core_services::assembly {

using common_utils::StringUtils;

std::string DatasetCombiner::signature(const GriddedArray& array) {
    std::vector<std::string> parts;
    for (const auto& [axis, size] : array.spatialSizes()) {
        parts.push_back(axis + ":" + std::to_string(size));
    }
    return StringUtils::join(parts, ",");
}

std::optional<std::string> DatasetCombiner::describeMismatch(const AssembledDataset::Variable& reference,
                                                             const AssembledDataset::Variable& candidate) {
    const auto& [referenceName, expected] = reference;
    const auto& [name, array] = candidate;
    if (array.yCoordinates() != expected.yCoordinates()) {
        return "axis 'y' of '" + name + "' differs from '" + referenceName + "'";
    }
    if (array.xCoordinates() != expected.xCoordinates()) {
        return "axis 'x' of '" + name + "' differs from '" + referenceName + "'";
    }
    if (!(array.crs() == expected.crs())) {
        return "crs of '" + name + "' (" + array.crs().identifier() + ") differs from '" +
               referenceName + "' (" + expected.crs().identifier() + ")";
    }
    return std::nullopt;
}

std::optional<std::string> DatasetCombiner::findConflict(
    const std::vector<AssembledDataset::Variable>& variables) {
    for (size_t i = 1; i < variables.size(); ++i) {
        if (auto mismatch = describeMismatch(variables.front(), variables[i])) {
            return mismatch;
        }
    }
    return std::nullopt;
}

CombineResult DatasetCombiner::combine(std::vector<AssembledDataset::Variable> variables) const {
    if (variables.empty()) {
        throw NoAssemblableDataException("No variable could be assembled from the request");
    }

    CombineResult result;
    const auto conflict = findConflict(variables);
    if (!conflict) {
        result.variables = std::move(variables);
        return result;
    }

    RASTERCUBE_LOG_WARN("Combiner", "Union failed ({}); grouping variables by spatial signature", *conflict);

    // 按签名分组，保持首次出现顺序
    std::vector<std::string> groupOrder;
    std::map<std::string, std::vector<size_t>> groups;
    for (size_t i = 0; i < variables.size(); ++i) {
        const std::string sig = signature(variables[i].second);
        auto& members = groups[sig];
        if (members.empty()) {
            groupOrder.push_back(sig);
        }
        members.push_back(i);
    }

    const std::string* selected = &groupOrder.front();
    for (const auto& sig : groupOrder) {
        if (groups[sig].size() > groups[*selected].size()) {
            selected = &sig;
        }
    }

    // 组内同尺寸但坐标或 CRS 不同的成员也被排除，以组内首个成员为准
    const std::vector<size_t>& members = groups[*selected];
    std::vector<bool> keep(variables.size(), false);
    for (size_t index : members) {
        const auto mismatch = describeMismatch(variables[members.front()], variables[index]);
        if (mismatch) {
            RASTERCUBE_LOG_WARN("Combiner", "Excluding '{}' from group {}: {}",
                                variables[index].first, *selected, *mismatch);
        }
        keep[index] = !mismatch;
    }
    for (size_t i = 0; i < variables.size(); ++i) {
        if (keep[i]) {
            result.variables.push_back(std::move(variables[i]));
        } else {
            result.excluded.push_back(variables[i].first);
        }
    }
    // 被排除的数组立即释放
    variables.clear();

    if (result.variables.empty()) {
        throw CombineIncompatibleException("No variable group with spatial signature " + *selected +
                                           " could be combined");
    }

    const std::string excludedList = StringUtils::join(result.excluded, ", ");
    RASTERCUBE_LOG_WARN("Combiner", "Kept {} variable(s) with signature {}; excluded: {}",
                        result.variables.size(), *selected, excludedList);
    result.diagnostics.push_back({DiagnosticSeverity::Warning, DiagnosticKind::EXCLUDED_VARIABLES,
                                  excludedList,
                                  "excluded from the dataset (grid differs from the kept group " + *selected + ")"});
    return result;
}

} // namespace rastercube::core_services::assembly
