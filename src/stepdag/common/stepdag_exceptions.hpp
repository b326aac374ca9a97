/**
 * @file stepdag_exceptions.hpp
 */
#pragma once
#include "stepdag/common/common.hpp"

namespace stepdag
{

/**
 * @brief Error codes for step declaration, graph building and finalization.
 */
enum class StepDagErrorCode
{
    InterfaceError,        ///< Malformed step signature or call arguments.
    InputValidation,       ///< A value does not match the declared input type.
    DuplicateInvocation,   ///< Invocation identifier already used in the pipeline.
    AmbiguousOrdering,     ///< Ordering hint on a template invoked more than once.
    UnknownUpstream,       ///< Explicit upstream identifier is not in the pipeline.
    MissingInput,          ///< An entrypoint input has no bound value.
    MissingParameter,      ///< A required parameter field has no value.
    UnknownSetting,        ///< Settings key outside the recognized namespace.
    MaterializerRequired,  ///< Output typed as Any without an explicit materializer.
    MaterializerNotFound,  ///< No materializer for a type or source.
    ArtifactStoreMismatch, ///< Referenced artifact lives in another artifact store.
    ArtifactUriExists,     ///< Freshly allocated artifact location already exists.
    InvalidArtifact,       ///< Artifact reference is malformed or foreign.
    InvalidSource,         ///< Import path cannot be parsed.
    InvalidState           ///< Operation not allowed in the current build state.
};

/**
 * @brief Get a short name for an error code.
 */
inline const char* to_string(StepDagErrorCode code) noexcept
{
    switch (code)
    {
    case StepDagErrorCode::InterfaceError: return "InterfaceError";
    case StepDagErrorCode::InputValidation: return "InputValidation";
    case StepDagErrorCode::DuplicateInvocation: return "DuplicateInvocation";
    case StepDagErrorCode::AmbiguousOrdering: return "AmbiguousOrdering";
    case StepDagErrorCode::UnknownUpstream: return "UnknownUpstream";
    case StepDagErrorCode::MissingInput: return "MissingInput";
    case StepDagErrorCode::MissingParameter: return "MissingParameter";
    case StepDagErrorCode::UnknownSetting: return "UnknownSetting";
    case StepDagErrorCode::MaterializerRequired: return "MaterializerRequired";
    case StepDagErrorCode::MaterializerNotFound: return "MaterializerNotFound";
    case StepDagErrorCode::ArtifactStoreMismatch: return "ArtifactStoreMismatch";
    case StepDagErrorCode::ArtifactUriExists: return "ArtifactUriExists";
    case StepDagErrorCode::InvalidArtifact: return "InvalidArtifact";
    case StepDagErrorCode::InvalidSource: return "InvalidSource";
    case StepDagErrorCode::InvalidState: return "InvalidState";
    }
    return "Unknown";
}

/**
 * @brief Exception class for all stepdag errors.
 *
 * @details
 * `StepDagError` is thrown synchronously to the caller performing step
 * declaration or pipeline construction. Each exception carries an error code
 * and a descriptive message naming the offending step, input or output.
 * Nothing inside the library catches and retries these errors.
 *
 * @par Thread safety
 * - The exception object itself follows standard exception semantics.
 * - Safe to copy and rethrow across threads.
 */
class StepDagError : public std::exception
{
public:
    /**
     * @brief Construct a StepDagError.
     * @param code The error code indicating the kind of error.
     * @param message A descriptive message explaining the error.
     */
    StepDagError(StepDagErrorCode code, std::string message)
        : m_code(code)
        , m_message(std::move(message))
    {
    }

    /**
     * @brief Get the error code.
     */
    StepDagErrorCode code() const noexcept
    {
        return m_code;
    }

    const char* what() const noexcept override
    {
        return m_message.c_str();
    }

private:
    StepDagErrorCode m_code;
    std::string m_message;
};

} // namespace stepdag
