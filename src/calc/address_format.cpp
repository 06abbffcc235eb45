#include "iochannel/calc/address_format.hpp"

namespace ioc {

std::string formatPlcAddress(DataType dataType, std::int64_t address) {
    if (dataType == DataType::Real) {
        return "%MD" + std::to_string(address);
    }
    return "%MX" + std::to_string(address / 8) + "." + std::to_string(address % 8);
}

std::int64_t hostCommAddress(DataType dataType, std::int64_t address) noexcept {
    if (dataType == DataType::Real) {
        return address / 2 + 43001;
    }
    return address + 3001;
}

} // namespace ioc
