/**
 * @file DesignErrors.hpp
 * @brief Error taxonomy shared by the calculator, the pipeline and the adapters.
 */

#pragma once
#include <stdexcept>
#include <string>

namespace beplanner::domain {

/** @brief Malformed or out-of-range calculator input. Never clamped. */
class InvalidDesignInput : public std::invalid_argument {
public:
    explicit InvalidDesignInput(const std::string& message) : std::invalid_argument(message) {}
};

/** @brief The calculator cannot produce a defensible design (e.g. no CV_intra). */
class DesignComputationFailed : public std::runtime_error {
public:
    explicit DesignComputationFailed(const std::string& message) : std::runtime_error(message) {}
};

/** @brief Search, extraction or rendering backend failed or timed out. */
class CollaboratorUnavailable : public std::runtime_error {
public:
    explicit CollaboratorUnavailable(const std::string& message) : std::runtime_error(message) {}
};

/** @brief A status change outside the transition table was requested. */
class InvalidStatusTransition : public std::logic_error {
public:
    explicit InvalidStatusTransition(const std::string& message) : std::logic_error(message) {}
};

/** @brief The project store could not read or persist a record. */
class ProjectStoreError : public std::runtime_error {
public:
    explicit ProjectStoreError(const std::string& message) : std::runtime_error(message) {}
};

/** @brief A report was requested for a project that has not completed. */
class ReportNotAvailable : public std::runtime_error {
public:
    explicit ReportNotAvailable(const std::string& message) : std::runtime_error(message) {}
};

} // namespace beplanner::domain
