/**
 * @file error.cpp
 * @brief iochannel source file.
 */

#include "iochannel/core/error.hpp"

#include <utility>

namespace ioc {

void Error::clear() {
    kind = ErrorKind::None;
    subject.clear();
    message.clear();
}

std::string Error::describe() const {
    std::string text = toString(kind);
    if (!subject.empty()) {
        text += " [" + subject + "]";
    }
    if (!message.empty()) {
        text += ": " + message;
    }
    return text;
}

Error makeError(ErrorKind kind, std::string subject, std::string message) {
    Error error;
    error.kind = kind;
    error.subject = std::move(subject);
    error.message = std::move(message);
    return error;
}

const char* toString(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::None:
        return "None";
    case ErrorKind::SchemaMismatch:
        return "SchemaMismatch";
    case ErrorKind::UnknownModuleType:
        return "UnknownModuleType";
    case ErrorKind::InvalidModuleModel:
        return "InvalidModuleModel";
    case ErrorKind::InvalidRequirement:
        return "InvalidRequirement";
    case ErrorKind::EmptyAssignmentSet:
        return "EmptyAssignmentSet";
    case ErrorKind::MissingEngineeringRange:
        return "MissingEngineeringRange";
    case ErrorKind::CapacityExhausted:
        return "CapacityExhausted";
    case ErrorKind::AddressConflict:
        return "AddressConflict";
    case ErrorKind::InvalidTemplate:
        return "InvalidTemplate";
    case ErrorKind::ConfigIo:
        return "ConfigIo";
    }
    return "Unknown";
}

} // namespace ioc
