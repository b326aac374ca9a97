/**
 * @file artifacts.hpp
 * @brief Artifact references passed between step invocations.
 */
#pragma once
#include "stepdag/common/common.hpp"
#include "stepdag/common/data_type.hpp"
#include "stepdag/common/payload.hpp"
#include "stepdag/config/source.hpp"
#include "stepdag/steps/finalization_context.hpp"
#include "stepdag/steps/materializer.hpp"

namespace stepdag
{

class Pipeline;

/// Artifact store scope under which external values are uploaded.
inline constexpr const char* kExternalArtifactScope = "external_artifacts";

/// Name prefix of uploaded external artifacts.
inline constexpr const char* kExternalArtifactPrefix = "external_";

enum class ArtifactKind
{
    Step,
    External
};

/**
 * @brief Typed handle to a value consumed by a step invocation.
 */
class Artifact
{
public:
    virtual ~Artifact() = 0;

    virtual ArtifactKind kind() const noexcept = 0;

protected:
    Artifact() = default;

private:
    Artifact(const Artifact&) = delete;
    Artifact& operator=(const Artifact&) = delete;
};

inline Artifact::~Artifact() = default;

/**
 * @brief Reference to a declared output of another invocation in a pipeline.
 *
 * @details
 * Returned by `StepTemplate::invoke()`. The pipeline pointer identifies the
 * build that produced the reference; it is only compared, never dereferenced
 * after the build ends.
 */
class StepArtifact : public Artifact
{
public:
    StepArtifact(InvocationId invocation_id, std::string output_name, DataType annotation, const Pipeline* pipeline)
        : m_invocation_id(std::move(invocation_id))
        , m_output_name(std::move(output_name))
        , m_annotation(std::move(annotation))
        , m_pipeline(pipeline)
    {
    }

    ArtifactKind kind() const noexcept override
    {
        return ArtifactKind::Step;
    }

    const InvocationId& invocation_id() const noexcept { return m_invocation_id; }
    const std::string& output_name() const noexcept { return m_output_name; }
    const DataType& annotation() const noexcept { return m_annotation; }
    const Pipeline* pipeline() const noexcept { return m_pipeline; }

private:
    InvocationId m_invocation_id;
    std::string m_output_name;
    DataType m_annotation;
    const Pipeline* m_pipeline;
};

using StepArtifactPtr = std::shared_ptr<StepArtifact>;

/**
 * @brief Optional behavior of an external artifact.
 *
 * @details
 * `materializer` takes precedence over `materializer_source`; with neither,
 * the materializer is looked up by the value's data type.
 */
struct ExternalArtifactOptions
{
    MaterializerPtr materializer;
    std::optional<Source> materializer_source;
    bool store_artifact_metadata{true};
    bool skip_type_checking{false};
};

/**
 * @brief Reference to a value or persisted artifact not produced in the graph.
 *
 * @details
 * An external artifact holds exactly one of a raw value or an artifact id.
 *
 * @par State machine
 * - `Pending`: holds a raw value. Resolution uploads it and captures the id
 *   returned by the metadata store.
 * - `Unverified`: holds a caller-supplied id. Resolution checks that the
 *   artifact belongs to the active artifact store.
 * - `Resolved`: holds a usable id. Resolution returns it without touching
 *   any collaborator.
 *
 * @par Thread safety
 * - `upload_or_verify()` is internally synchronized; concurrent callers
 *   observe a single upload.
 */
class ExternalArtifact : public Artifact
{
public:
    enum class State
    {
        Pending,
        Unverified,
        Resolved
    };

    /**
     * @throws StepDagError with `InvalidArtifact` unless exactly one of a
     *         non-empty value and an id is given.
     */
    ExternalArtifact(std::optional<Payload> value, std::optional<ArtifactId> id, ExternalArtifactOptions options = {});

    static std::shared_ptr<ExternalArtifact> from_value(Payload value, ExternalArtifactOptions options = {});
    static std::shared_ptr<ExternalArtifact> from_id(ArtifactId id, ExternalArtifactOptions options = {});

    ArtifactKind kind() const noexcept override
    {
        return ArtifactKind::External;
    }

    State state() const;

    /**
     * @brief Whether the reference was created from a raw value.
     */
    bool has_value() const noexcept
    {
        return m_value.has_value();
    }

    /**
     * @brief The artifact id, once known.
     */
    std::optional<ArtifactId> id() const;

    const ExternalArtifactOptions& options() const noexcept
    {
        return m_options;
    }

    /**
     * @brief Data type of the referenced value.
     *
     * @details
     * `Any` when type checking is skipped. For ids the type is read from the
     * metadata store once and kept; without a store it is `Any`.
     */
    DataType type(IMetadataStore* metadata_store) const;

    /**
     * @brief Resolve the reference to an artifact id, uploading at most once.
     *
     * @throws StepDagError with `MaterializerNotFound` if no materializer
     *         applies to the value, `ArtifactUriExists` if the allocated
     *         location is already taken, `ArtifactStoreMismatch` if a
     *         referenced artifact lives in another store, and `InvalidState`
     *         if the context lacks a required store.
     */
    ArtifactId upload_or_verify(const FinalizationContext& context);

private:
    MaterializerPtr select_materializer(const MaterializerRegistry& registry) const;
    ArtifactId upload(const FinalizationContext& context);
    void verify(const FinalizationContext& context);

    mutable std::mutex m_mutex;
    State m_state;
    std::optional<Payload> m_value;
    std::optional<ArtifactId> m_id;
    mutable std::optional<DataType> m_record_type;
    ExternalArtifactOptions m_options;
};

using ExternalArtifactPtr = std::shared_ptr<ExternalArtifact>;

} // namespace stepdag
