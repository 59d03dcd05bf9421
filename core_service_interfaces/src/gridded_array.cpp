#include "core_services/gridded_array.h"
#include "core_services/exceptions.h"

#include <numeric>
#include <sstream>

namespace rastercube::core_services {

namespace {

size_t product(const std::vector<size_t>& shape) {
    if (shape.empty()) {
        return 0;
    }
    return std::accumulate(shape.begin(), shape.end(), size_t{1},
                           [](size_t a, size_t b) { return a * b; });
}

std::string shapeToString(const std::vector<size_t>& shape) {
    std::ostringstream oss;
    oss << "(";
    for (size_t i = 0; i < shape.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << shape[i];
    }
    oss << ")";
    return oss.str();
}

} // namespace

// === DeferredPixels ===

DeferredPixels::DeferredPixels() : state_(std::make_shared<State>()) {}

DeferredPixels::DeferredPixels(std::vector<size_t> shape, DataType dataType, Materializer materializer)
    : shape_(std::move(shape)), dataType_(dataType), state_(std::make_shared<State>()) {
    state_->materializer = std::move(materializer);
}

DeferredPixels DeferredPixels::fromValues(std::vector<size_t> shape, DataType dataType,
                                          std::vector<double> values) {
    if (values.size() != product(shape)) {
        throw common_utils::ValidationException(
            "Pixel buffer of " + std::to_string(values.size()) + " values does not match shape " +
            shapeToString(shape));
    }
    DeferredPixels pixels(std::move(shape), dataType, nullptr);
    pixels.state_->values = std::move(values);
    return pixels;
}

size_t DeferredPixels::elementCount() const {
    return product(shape_);
}

bool DeferredPixels::isMaterialized() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->values.has_value();
}

const std::vector<double>& DeferredPixels::materialize() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (state_->values) {
        return *state_->values;
    }
    if (!state_->materializer) {
        throw DataAccessException("Pixel handle of shape " + shapeToString(shape_) +
                                  " has no data source");
    }

    std::vector<double> values = state_->materializer();
    if (values.size() != elementCount()) {
        throw DataAccessException("Materialized " + std::to_string(values.size()) +
                                  " values, expected shape " + shapeToString(shape_));
    }
    state_->values = std::move(values);
    // 释放物化函数持有的资源（如捕获的其他句柄）
    state_->materializer = nullptr;
    return *state_->values;
}

DeferredPixels DeferredPixels::transform(std::vector<size_t> newShape,
                                         std::function<std::vector<double>(const std::vector<double>&)> fn) const {
    DeferredPixels source = *this;
    return DeferredPixels(std::move(newShape), dataType_,
                          [source, fn = std::move(fn)]() { return fn(source.materialize()); });
}

DeferredPixels DeferredPixels::reshaped(std::vector<size_t> newShape) const {
    if (product(newShape) != elementCount()) {
        throw common_utils::ValidationException("Cannot reshape " + shapeToString(shape_) + " to " +
                                                shapeToString(newShape));
    }
    DeferredPixels view = *this;
    view.shape_ = std::move(newShape);
    return view;
}

// === GriddedArray ===

GriddedArray::GriddedArray(SpatialGrid grid) : storage_(std::move(grid)) {}

GriddedArray::GriddedArray(SpatioTemporalGrid grid) : storage_(std::move(grid)) {}

GriddedArray GriddedArray::spatial(GridGeometry geometry, DeferredPixels pixels) {
    const std::vector<size_t> expected{geometry.rows, geometry.cols};
    if (pixels.shape() != expected) {
        throw common_utils::ValidationException("Pixel shape " + shapeToString(pixels.shape()) +
                                                " does not match grid " + geometry.toString());
    }
    return GriddedArray(SpatialGrid{std::move(geometry), std::move(pixels)});
}

const GridGeometry& GriddedArray::geometry() const {
    return std::visit([](const auto& grid) -> const GridGeometry& { return grid.geometry; }, storage_);
}

const DeferredPixels& GriddedArray::pixels() const {
    return std::visit([](const auto& grid) -> const DeferredPixels& { return grid.pixels; }, storage_);
}

std::vector<std::string> GriddedArray::dims() const {
    if (hasTimeAxis()) {
        return {"time", "y", "x"};
    }
    return {"y", "x"};
}

std::vector<size_t> GriddedArray::shape() const {
    const auto& geom = geometry();
    if (hasTimeAxis()) {
        return {timeCoordinates().size(), geom.rows, geom.cols};
    }
    return {geom.rows, geom.cols};
}

std::vector<std::pair<std::string, size_t>> GriddedArray::spatialSizes() const {
    const auto& geom = geometry();
    return {{"x", geom.cols}, {"y", geom.rows}};
}

const std::vector<CalendarTime>& GriddedArray::timeCoordinates() const {
    static const std::vector<CalendarTime> kNoTimes;
    if (const auto* cube = std::get_if<SpatioTemporalGrid>(&storage_)) {
        return cube->times;
    }
    return kNoTimes;
}

GriddedArray GriddedArray::expandTime(const CalendarTime& time) const {
    if (hasTimeAxis()) {
        throw common_utils::ValidationException("Array already has a time axis");
    }
    if (!time.isValid()) {
        throw common_utils::ValidationException("Cannot expand a time axis at NaT");
    }

    const auto& plane = std::get<SpatialGrid>(storage_);
    SpatioTemporalGrid cube;
    cube.geometry = plane.geometry;
    cube.times = {time};
    // 行优先布局下 (1, y, x) 与 (y, x) 数据相同，直接共享存储
    cube.pixels = plane.pixels.reshaped({1, plane.geometry.rows, plane.geometry.cols});
    return GriddedArray(std::move(cube));
}

GriddedArray GriddedArray::concatenateTime(const std::vector<GriddedArray>& parts) {
    if (parts.empty()) {
        throw DimensionMismatchException("Cannot concatenate zero arrays along time");
    }

    const GridGeometry& reference = parts.front().geometry();
    std::vector<CalendarTime> times;
    std::vector<DeferredPixels> sources;
    DataType dataType = parts.front().dataType();

    for (size_t i = 0; i < parts.size(); ++i) {
        const auto* cube = std::get_if<SpatioTemporalGrid>(&parts[i].storage());
        if (!cube) {
            throw DimensionMismatchException("Part " + std::to_string(i) + " has no time axis");
        }
        if (cube->geometry != reference) {
            throw DimensionMismatchException("Part " + std::to_string(i) + " grid " +
                                             cube->geometry.toString() + " differs from " +
                                             reference.toString());
        }
        times.insert(times.end(), cube->times.begin(), cube->times.end());
        sources.push_back(cube->pixels);
        if (cube->pixels.dataType() != dataType) {
            dataType = DataType::Float64;
        }
    }

    const size_t planeSize = reference.rows * reference.cols;
    const size_t totalTimes = times.size();

    SpatioTemporalGrid result;
    result.geometry = reference;
    result.times = std::move(times);
    result.pixels = DeferredPixels(
        {totalTimes, reference.rows, reference.cols}, dataType,
        [sources, planeSize, totalTimes]() {
            std::vector<double> values;
            values.reserve(planeSize * totalTimes);
            for (const auto& source : sources) {
                const auto& part = source.materialize();
                values.insert(values.end(), part.begin(), part.end());
            }
            return values;
        });
    return GriddedArray(std::move(result));
}

std::string GriddedArray::describe() const {
    std::ostringstream oss;
    const auto names = dims();
    const auto sizes = shape();
    oss << "(";
    for (size_t i = 0; i < names.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << names[i] << ": " << sizes[i];
    }
    oss << ") " << dataTypeToString(dataType());
    if (hasTimeAxis() && !timeCoordinates().empty()) {
        oss << " time=[" << timeCoordinates().front().toISOString();
        if (timeCoordinates().size() > 1) {
            oss << " .. " << timeCoordinates().back().toISOString();
        }
        oss << "]";
    }
    return oss.str();
}

} // namespace rastercube::core_services
