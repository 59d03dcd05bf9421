#include "core_services/common_data_types.h"
#include "common_utils/utilities/string_utils.h"

#include <sstream>

namespace rastercube::core_services
{
    std::string dataTypeToString(DataType dataType)
    {
        switch (dataType)
        {
        case DataType::Byte: return "uint8";
        case DataType::Int8: return "int8";
        case DataType::UInt16: return "uint16";
        case DataType::Int16: return "int16";
        case DataType::UInt32: return "uint32";
        case DataType::Int32: return "int32";
        case DataType::Float32: return "float32";
        case DataType::Float64: return "float64";
        case DataType::Unknown:
        default: return "unknown";
        }
    }

    DataType dataTypeFromString(const std::string& name)
    {
        const std::string lower = common_utils::StringUtils::toLower(common_utils::StringUtils::trim(name));
        if (lower == "uint8" || lower == "byte") return DataType::Byte;
        if (lower == "int8") return DataType::Int8;
        if (lower == "uint16") return DataType::UInt16;
        if (lower == "int16") return DataType::Int16;
        if (lower == "uint32") return DataType::UInt32;
        if (lower == "int32") return DataType::Int32;
        if (lower == "float32") return DataType::Float32;
        if (lower == "float64" || lower == "double") return DataType::Float64;
        return DataType::Unknown;
    }

    CRSInfo CRSInfo::fromEpsg(int code, const std::string& wktText)
    {
        CRSInfo info;
        info.epsgCode = code;
        info.wkt = wktText;
        return info;
    }

    std::string CRSInfo::identifier() const
    {
        if (epsgCode)
        {
            return "EPSG:" + std::to_string(*epsgCode);
        }
        return wkt;
    }

    bool CRSInfo::operator==(const CRSInfo& other) const
    {
        if (epsgCode.has_value() && other.epsgCode.has_value())
        {
            return *epsgCode == *other.epsgCode;
        }
        if (epsgCode.has_value() != other.epsgCode.has_value() && !wkt.empty() && !other.wkt.empty())
        {
            return wkt == other.wkt;
        }
        return epsgCode == other.epsgCode && wkt == other.wkt;
    }

    std::vector<double> GridGeometry::yCoordinates() const
    {
        std::vector<double> values(rows);
        for (size_t row = 0; row < rows; ++row)
        {
            values[row] = geoTransform[3] + 0.5 * geoTransform[4] +
                          (static_cast<double>(row) + 0.5) * geoTransform[5];
        }
        return values;
    }

    std::vector<double> GridGeometry::xCoordinates() const
    {
        std::vector<double> values(cols);
        for (size_t col = 0; col < cols; ++col)
        {
            values[col] = geoTransform[0] + (static_cast<double>(col) + 0.5) * geoTransform[1] +
                          0.5 * geoTransform[2];
        }
        return values;
    }

    bool GridGeometry::operator==(const GridGeometry& other) const
    {
        return sameShape(other) && geoTransform == other.geoTransform && crs == other.crs;
    }

    std::string GridGeometry::toString() const
    {
        std::ostringstream oss;
        oss << "Grid[" << rows << "x" << cols << " origin=(" << geoTransform[0] << ", "
            << geoTransform[3] << ") res=(" << geoTransform[1] << ", " << geoTransform[5] << ")";
        if (!crs.empty())
        {
            const std::string id = crs.identifier();
            oss << " crs=" << (id.size() > 40 ? id.substr(0, 40) + "..." : id);
        }
        oss << "]";
        return oss.str();
    }

} // namespace rastercube::core_services
