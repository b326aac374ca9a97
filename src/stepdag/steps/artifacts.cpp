/**
 * @file artifacts.cpp
 */
#include "stepdag/steps/artifacts.hpp"
#include "stepdag/common/logging.hpp"
#include "stepdag/common/stepdag_exceptions.hpp"
#include "stepdag/common/uuid.hpp"

namespace stepdag
{

ExternalArtifact::ExternalArtifact(std::optional<Payload> value,
                                   std::optional<ArtifactId> id,
                                   ExternalArtifactOptions options)
    : m_state(State::Pending)
    , m_options(std::move(options))
{
    bool has_value = value && value->has_value();
    bool has_id = id && !id->empty();
    if (has_value && has_id)
    {
        throw StepDagError(StepDagErrorCode::InvalidArtifact, "Only value or ID allowed for an external artifact");
    }
    if (!has_value && !has_id)
    {
        throw StepDagError(StepDagErrorCode::InvalidArtifact, "Either value or ID required for an external artifact");
    }
    if (has_value)
    {
        m_value = std::move(value);
    }
    else
    {
        m_id = std::move(id);
        m_state = State::Unverified;
    }
}

std::shared_ptr<ExternalArtifact> ExternalArtifact::from_value(Payload value, ExternalArtifactOptions options)
{
    return std::make_shared<ExternalArtifact>(std::move(value), std::nullopt, std::move(options));
}

std::shared_ptr<ExternalArtifact> ExternalArtifact::from_id(ArtifactId id, ExternalArtifactOptions options)
{
    return std::make_shared<ExternalArtifact>(std::nullopt, std::move(id), std::move(options));
}

ExternalArtifact::State ExternalArtifact::state() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state;
}

std::optional<ArtifactId> ExternalArtifact::id() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_id;
}

DataType ExternalArtifact::type(IMetadataStore* metadata_store) const
{
    if (m_options.skip_type_checking)
    {
        return DataType::any();
    }
    if (m_value)
    {
        return m_value->data_type();
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_record_type)
    {
        return *m_record_type;
    }
    if (metadata_store == nullptr)
    {
        return DataType::any();
    }
    m_record_type = metadata_store->get_artifact(*m_id).data_type;
    return *m_record_type;
}

ArtifactId ExternalArtifact::upload_or_verify(const FinalizationContext& context)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    switch (m_state)
    {
    case State::Resolved:
        break;
    case State::Unverified:
        verify(context);
        m_state = State::Resolved;
        break;
    case State::Pending:
        m_id = upload(context);
        m_state = State::Resolved;
        break;
    }
    return *m_id;
}

MaterializerPtr ExternalArtifact::select_materializer(const MaterializerRegistry& registry) const
{
    if (m_options.materializer)
    {
        return m_options.materializer;
    }
    if (m_options.materializer_source)
    {
        return registry.load(*m_options.materializer_source);
    }
    const DataType& value_type = m_value->data_type();
    if (!registry.is_registered(value_type))
    {
        throw StepDagError(
            StepDagErrorCode::MaterializerNotFound,
            "Unable to find materializer for type `" + value_type.to_string() +
                "`. Either set a materializer for the external artifact explicitly or register a "
                "default materializer for the type.");
    }
    return registry.lookup(value_type);
}

ArtifactId ExternalArtifact::upload(const FinalizationContext& context)
{
    if (!context.artifact_store || !context.metadata_store)
    {
        throw StepDagError(
            StepDagErrorCode::InvalidState,
            "Uploading an external artifact requires an artifact store and a metadata store");
    }

    MaterializerPtr materializer = select_materializer(context.registry());

    STEPDAG_LOG_INFO("Uploading external artifact.");
    std::string name = kExternalArtifactPrefix + generate_uuid();
    std::string uri = context.artifact_store->allocate_location(kExternalArtifactScope, name);
    if (context.artifact_store->exists(uri))
    {
        throw StepDagError(StepDagErrorCode::ArtifactUriExists, "Artifact URI already exists: " + uri);
    }
    context.artifact_store->make_directory(uri);
    materializer->save(uri, *m_value);

    ArtifactRecord record;
    record.name = name;
    record.artifact_type = materializer->artifact_type();
    record.uri = uri;
    record.materializer = materializer->source();
    record.data_type = m_value->data_type();
    record.user = context.run.user_id;
    record.workspace = context.run.workspace_id;
    record.artifact_store_id = context.run.artifact_store_id;
    if (m_options.store_artifact_metadata)
    {
        record.metadata = materializer->extract_metadata(*m_value);
    }
    return context.metadata_store->create_artifact(record);
}

void ExternalArtifact::verify(const FinalizationContext& context)
{
    if (!context.metadata_store)
    {
        throw StepDagError(
            StepDagErrorCode::InvalidState,
            "Verifying an external artifact requires a metadata store");
    }
    ArtifactRecord record = context.metadata_store->get_artifact(*m_id);
    m_record_type = record.data_type;
    if (record.artifact_store_id != context.run.artifact_store_id)
    {
        throw StepDagError(
            StepDagErrorCode::ArtifactStoreMismatch,
            "Artifact '" + *m_id + "' belongs to artifact store '" + record.artifact_store_id +
                "', not the active artifact store '" + context.run.artifact_store_id + "'");
    }
}

} // namespace stepdag
