/**
 * @file catalog_validator.hpp
 * @brief iochannel source file.
 */

#pragma once

#include <string>
#include <vector>

#include "iochannel/catalog/channel_model_catalog.hpp"

namespace ioc {

/**
 * @brief Severity level for catalog validation findings.
 */
enum class ValidationSeverity { Warning, Error };

/**
 * @brief One catalog validation finding.
 */
struct ValidationIssue {
    ValidationSeverity severity = ValidationSeverity::Error;
    std::string message;
};

/**
 * @brief Validates a channel model catalog definition before use.
 *
 * Checks include positive capacity and strides, unique module type identifiers,
 * instance-0 address overlap between models of one signal class, full-range overlap
 * between bounded models of one address area, and extension area sanity.
 */
class CatalogValidator {
public:
    /**
     * @brief Perform validation and return all findings.
     */
    static std::vector<ValidationIssue> validate(const ChannelModelCatalog::Definition& definition);
    /**
     * @brief Convenience predicate to detect if any issue is fatal.
     */
    static bool hasErrors(const std::vector<ValidationIssue>& issues);
};

} // namespace ioc
