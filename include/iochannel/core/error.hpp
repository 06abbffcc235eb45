/**
 * @file error.hpp
 * @brief iochannel source file.
 */

#pragma once

#include <string>

namespace ioc {

/**
 * @brief Failure categories reported by schema, catalog, calculator and generators.
 */
enum class ErrorKind {
    None,
    SchemaMismatch,
    UnknownModuleType,
    InvalidModuleModel,
    InvalidRequirement,
    EmptyAssignmentSet,
    MissingEngineeringRange,
    CapacityExhausted,
    AddressConflict,
    InvalidTemplate,
    ConfigIo,
};

/**
 * @brief Typed failure returned through `Error& outError` parameters.
 */
struct Error {
    ErrorKind kind = ErrorKind::None;
    /// Offending field, item, module type or template identifier.
    std::string subject;
    /// Human-readable detail.
    std::string message;

    bool ok() const noexcept { return kind == ErrorKind::None; }
    void clear();
    /// "<Kind> [<subject>]: <message>"
    std::string describe() const;
};

Error makeError(ErrorKind kind, std::string subject, std::string message);
const char* toString(ErrorKind kind);

} // namespace ioc
