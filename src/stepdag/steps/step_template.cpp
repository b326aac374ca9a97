/**
 * @file step_template.cpp
 */
#include "stepdag/steps/step_template.hpp"
#include "stepdag/common/logging.hpp"
#include "stepdag/common/payload.inline.hpp"
#include "stepdag/common/stepdag_exceptions.hpp"
#include "stepdag/config/settings_keys.hpp"
#include "stepdag/pipeline/pipeline.hpp"
#include "stepdag/steps/caching.hpp"
#include "stepdag/steps/materializer_resolver.hpp"

#include <algorithm>

namespace stepdag
{

namespace
{

StepConfigurationUpdate update_from_options(const StepOptions& options)
{
    StepConfigurationUpdate update;
    update.enable_cache = options.enable_cache;
    update.enable_artifact_metadata = options.enable_artifact_metadata;
    update.enable_artifact_visualization = options.enable_artifact_visualization;
    update.experiment_tracker = options.experiment_tracker;
    update.step_operator = options.step_operator;
    if (!options.parameters.empty())
    {
        update.parameters = options.parameters;
    }
    if (!options.settings.empty())
    {
        update.settings = options.settings;
    }
    if (!options.output_materializers.empty())
    {
        update.outputs = options.output_materializers;
    }
    if (!options.extra.empty())
    {
        update.extra = options.extra;
    }
    update.failure_hook_source = options.on_failure;
    update.success_hook_source = options.on_success;
    return update;
}

std::string join(const std::vector<std::string>& items)
{
    std::string result;
    for (const auto& item : items)
    {
        if (!result.empty())
        {
            result += ", ";
        }
        result += item;
    }
    return result;
}

} // namespace

// ============================================================================
// Construction and configuration
// ============================================================================

StepTemplate::StepTemplate(const EntrypointSignature& signature, StepOptions options)
    : m_interface(analyze_step_signature(signature))
    , m_registry(options.materializer_registry ? options.materializer_registry
                                               : MaterializerRegistry::default_registry())
{
    m_configuration.name = options.name ? *options.name : signature.function_name;

    if (m_interface.has_context() && !options.enable_cache)
    {
        STEPDAG_LOG_DEBUG("Step '" << m_configuration.name
                          << "' has a context parameter and caching was not set explicitly; "
                             "disabling caching.");
        options.enable_cache = false;
    }

    configure(update_from_options(options));
}

StepTemplate& StepTemplate::configure(const StepConfigurationUpdate& update, bool merge)
{
    if (update.name)
    {
        STEPDAG_LOG_WARNING("Configuring the name of a step is deprecated.");
    }
    if (update.settings)
    {
        std::vector<std::string> keys;
        for (const auto& [key, value] : *update.settings)
        {
            if (!value.is_object())
            {
                throw StepDagError(
                    StepDagErrorCode::InputValidation,
                    "Settings for key '" + key + "' of step '" + name() + "' must be a JSON object");
            }
            keys.push_back(key);
        }
        validate_setting_keys(keys);
    }
    if (update.parameters)
    {
        validate_parameters(*update.parameters);
    }
    if (update.outputs)
    {
        validate_outputs(*update.outputs);
    }

    m_configuration = update_configuration(m_configuration, update, merge);
    STEPDAG_LOG_DEBUG("Updated configuration of step '" << name() << "': " << Json(m_configuration).dump());
    return *this;
}

StepTemplate& StepTemplate::set_output_materializers(const std::vector<Source>& sources)
{
    OutputConfigurations outputs;
    for (const auto& output : m_interface.outputs())
    {
        outputs[output.name].materializer_source = sources;
    }
    StepConfigurationUpdate update;
    update.outputs = std::move(outputs);
    return configure(update);
}

void StepTemplate::after(const std::shared_ptr<StepTemplate>& step)
{
    if (!step)
    {
        throw std::invalid_argument("StepTemplate::after requires a step");
    }
    m_upstream_steps.push_back(step);
}

void StepTemplate::validate_parameters(const Json& parameters) const
{
    if (!parameters.is_object())
    {
        throw StepDagError(
            StepDagErrorCode::InputValidation,
            "Parameters of step '" + name() + "' must be a JSON object");
    }
    const auto& params = m_interface.params();
    for (auto it = parameters.begin(); it != parameters.end(); ++it)
    {
        const std::string& key = it.key();
        if (m_interface.find_input(key) != nullptr || (params && params->name == key))
        {
            m_interface.validate_input(key, it.value());
        }
        else if (!params)
        {
            throw StepDagError(
                StepDagErrorCode::InterfaceError,
                "Can't set parameter '" + key + "' of step '" + name() + "' without a parameter object.");
        }
    }
}

void StepTemplate::validate_outputs(const OutputConfigurations& outputs) const
{
    for (const auto& [output_name, output] : outputs)
    {
        if (m_interface.find_output(output_name) == nullptr)
        {
            throw StepDagError(
                StepDagErrorCode::InterfaceError,
                "Got unexpected materializers for non-existent output '" + output_name + "' in step '" +
                    name() + "'. Only materializers for the outputs [" + join(m_interface.output_names()) +
                    "] of this step can be registered.");
        }
        for (const auto& source : output.materializer_source)
        {
            if (!m_registry->is_materializer_source(source))
            {
                throw StepDagError(
                    StepDagErrorCode::MaterializerNotFound,
                    "Materializer source `" + source.import_path() + "` for output '" + output_name +
                        "' of step '" + name() + "' does not resolve to a materializer.");
            }
        }
    }
}

// ============================================================================
// Calls
// ============================================================================

std::map<std::string, StepArgument> StepTemplate::bind_arguments(const StepCallArguments& args,
                                                                 bool apply_defaults) const
{
    const auto& call_order = m_interface.call_order();
    if (args.positional.size() > call_order.size())
    {
        throw StepDagError(
            StepDagErrorCode::InterfaceError,
            "Wrong arguments when calling step '" + name() + "': too many positional arguments");
    }

    std::map<std::string, StepArgument> bound;
    for (size_t i = 0; i < args.positional.size(); ++i)
    {
        bound.emplace(call_order[i], args.positional[i]);
    }
    for (const auto& [key, value] : args.named)
    {
        if (std::find(call_order.begin(), call_order.end(), key) == call_order.end())
        {
            throw StepDagError(
                StepDagErrorCode::InterfaceError,
                "Wrong arguments when calling step '" + name() + "': unexpected argument '" + key + "'");
        }
        if (!bound.emplace(key, value).second)
        {
            throw StepDagError(
                StepDagErrorCode::InterfaceError,
                "Wrong arguments when calling step '" + name() + "': multiple values for argument '" + key + "'");
        }
    }

    if (!apply_defaults)
    {
        return bound;
    }

    auto apply_default = [&bound](const InterfaceSlot& slot) {
        if (slot.default_value && bound.find(slot.name) == bound.end())
        {
            bound.emplace(slot.name, *slot.default_value);
        }
    };
    for (const auto& input : m_interface.inputs())
    {
        apply_default(input);
    }
    if (m_interface.params())
    {
        apply_default(*m_interface.params());
    }
    return bound;
}

std::vector<StepArtifactPtr> StepTemplate::invoke(Pipeline& pipeline,
                                                  const StepCallArguments& args,
                                                  const InvocationOptions& options)
{
    std::shared_ptr<StepTemplate> self = weak_from_this().lock();
    if (!self)
    {
        throw StepDagError(
            StepDagErrorCode::InvalidState,
            "Step '" + name() + "' must be owned by a shared_ptr to be used in a pipeline");
    }

    std::map<std::string, StepArtifactPtr> artifacts;
    std::map<std::string, ExternalArtifactPtr> external_artifacts;
    Json parameters = Json::object();

    for (const auto& [key, value] : bind_arguments(args, false))
    {
        if (const auto* artifact = std::get_if<StepArtifactPtr>(&value))
        {
            if (!*artifact || (*artifact)->pipeline() != &pipeline)
            {
                throw StepDagError(
                    StepDagErrorCode::InvalidArtifact,
                    "Argument '" + key + "' of step '" + name() + "' is not an artifact of pipeline '" +
                        pipeline.name() + "'");
            }
            m_interface.validate_artifact_input(key, (*artifact)->annotation());
            if (m_configuration.parameters.contains(key))
            {
                STEPDAG_LOG_WARNING("Got duplicate value for step input " << key
                                    << ", using value provided as artifact.");
            }
            artifacts.emplace(key, *artifact);
        }
        else if (const auto* external = std::get_if<ExternalArtifactPtr>(&value))
        {
            if (!*external)
            {
                throw StepDagError(
                    StepDagErrorCode::InvalidArtifact,
                    "Argument '" + key + "' of step '" + name() + "' is a null external artifact");
            }
            if (m_interface.find_input(key) == nullptr)
            {
                throw StepDagError(
                    StepDagErrorCode::InterfaceError,
                    "External artifact given for '" + key + "', which is not an input of step '" + name() + "'");
            }
            if ((*external)->has_value())
            {
                STEPDAG_LOG_WARNING("Using an external artifact as step input currently invalidates caching "
                                    "for the step and all downstream steps.");
            }
            external_artifacts.emplace(key, *external);
        }
        else if (const auto* json = std::get_if<Json>(&value))
        {
            m_interface.validate_input(key, *json);
            parameters[key] = *json;
        }
        else
        {
            const Payload& payload = std::get<Payload>(value);
            const Json* payload_json = payload.try_as<Json>();
            if (payload_json == nullptr)
            {
                throw StepDagError(
                    StepDagErrorCode::InputValidation,
                    "Value for '" + key + "' of step '" + name() + "' (`" + payload.data_type().to_string() +
                        "`) is not JSON-representable; pass it as an external artifact instead.");
            }
            m_interface.validate_input(key, *payload_json);
            parameters[key] = *payload_json;
        }
    }

    std::set<InvocationId> upstream(options.after.begin(), options.after.end());
    for (const auto& [key, artifact] : artifacts)
    {
        upstream.insert(artifact->invocation_id());
    }

    bool allow_suffix = !options.id.has_value();
    InvocationId invocation_id = pipeline.add_invocation(
        self, std::move(artifacts), std::move(external_artifacts), std::move(parameters), std::move(upstream),
        options.id, allow_suffix);

    std::vector<StepArtifactPtr> outputs;
    outputs.reserve(m_interface.outputs().size());
    for (const auto& output : m_interface.outputs())
    {
        outputs.push_back(std::make_shared<StepArtifact>(invocation_id, output.name, output.type, &pipeline));
    }
    return outputs;
}

std::map<std::string, Payload> StepTemplate::call_entrypoint(const StepCallArguments& args)
{
    std::map<std::string, StepArgument> bound = bind_arguments(args, true);
    std::map<std::string, Payload> inputs;

    for (const auto& key : m_interface.call_order())
    {
        auto it = bound.find(key);
        if (it == bound.end())
        {
            if (!m_configuration.parameters.contains(key))
            {
                throw StepDagError(
                    StepDagErrorCode::MissingInput,
                    "Missing entrypoint input '" + key + "' when calling step '" + name() + "'.");
            }
            it = bound.emplace(key, m_configuration.parameters.at(key)).first;
        }

        Payload payload;
        if (const auto* json = std::get_if<Json>(&it->second))
        {
            payload = Payload::from_json(*json);
        }
        else if (const auto* value = std::get_if<Payload>(&it->second))
        {
            payload = *value;
        }
        else
        {
            throw StepDagError(
                StepDagErrorCode::InvalidArtifact,
                "Artifact given for '" + key + "' while calling step '" + name() +
                    "' outside of a pipeline build.");
        }

        const InterfaceSlot* slot = m_interface.find_input(key);
        const DataType& declared = slot != nullptr ? slot->type : m_interface.params()->type;
        const Json* payload_json = payload.try_as<Json>();
        bool ok = payload_json != nullptr ? json_matches(declared, *payload_json)
                                          : accepts(declared, payload.data_type());
        if (!ok)
        {
            throw StepDagError(
                StepDagErrorCode::InputValidation,
                "Wrong input type (`" + payload.data_type().to_string() + "`) for argument '" + key +
                    "' of step '" + name() + "'. The argument should be of type `" + declared.to_string() + "`.");
        }
        inputs.emplace(key, std::move(payload));
    }

    return entrypoint(inputs);
}

StepCallResult StepTemplate::operator()(const StepCallArguments& args, const InvocationOptions& options)
{
    StepCallResult result;
    if (Pipeline* active = Pipeline::active())
    {
        result.artifacts = invoke(*active, args, options);
        result.in_pipeline = true;
    }
    else
    {
        result.values = call_entrypoint(args);
    }
    return result;
}

// ============================================================================
// Finalization
// ============================================================================

Json StepTemplate::finalize_parameters(const PartialStepConfiguration& config) const
{
    Json params = Json::object();
    for (auto it = config.parameters.begin(); it != config.parameters.end(); ++it)
    {
        const InterfaceSlot* input = m_interface.find_input(it.key());
        if (input == nullptr)
        {
            continue;
        }
        if (input->type.is_model() && input->type.named_type().schema)
        {
            std::vector<std::string> missing;
            Json value = apply_schema_defaults(*input->type.named_type().schema, it.value(), missing);
            if (!missing.empty())
            {
                throw StepDagError(
                    StepDagErrorCode::MissingParameter,
                    "Missing values for fields [" + join(missing) + "] of parameter '" + it.key() + "' of step '" +
                        name() + "'.");
            }
            params[it.key()] = std::move(value);
        }
        else
        {
            params[it.key()] = it.value();
        }
    }

    if (m_interface.params())
    {
        params[m_interface.params()->name] = finalize_legacy_parameters(config);
    }
    return params;
}

Json StepTemplate::finalize_legacy_parameters(const PartialStepConfiguration& config) const
{
    const InterfaceSlot& slot = *m_interface.params();
    const NamedType& params_type = slot.type.named_type();

    Json nested = Json::object();
    auto nested_it = config.parameters.find(slot.name);
    if (nested_it != config.parameters.end() && nested_it->is_object())
    {
        nested = *nested_it;
    }

    Json values = Json::object();
    std::vector<std::string> missing;
    if (params_type.schema)
    {
        for (const auto& field : params_type.schema->fields)
        {
            if (config.parameters.contains(field.name))
            {
                values[field.name] = config.parameters.at(field.name);
            }
            else if (nested.contains(field.name))
            {
                values[field.name] = nested.at(field.name);
            }
            else if (field.default_value)
            {
                values[field.name] = *field.default_value;
            }
            else
            {
                missing.push_back(field.name);
            }
        }
    }

    if (!missing.empty())
    {
        throw StepDagError(
            StepDagErrorCode::MissingParameter,
            "Missing values for parameters [" + join(missing) + "] of `" + params_type.identifier +
                "` in step '" + name() + "'.");
    }

    if (params_type.schema && params_type.schema->allow_extra)
    {
        for (auto it = config.parameters.begin(); it != config.parameters.end(); ++it)
        {
            if (it.key() != slot.name)
            {
                values[it.key()] = it.value();
            }
        }
    }

    if (params_type.schema && !json_matches(slot.type, values))
    {
        throw StepDagError(
            StepDagErrorCode::InterfaceError,
            "Failed to validate function parameters of step '" + name() + "'.");
    }
    return values;
}

StepConfiguration StepTemplate::finalize_configuration(
    PartialStepConfiguration config,
    const std::map<std::string, StepArtifactPtr>& input_artifacts,
    const std::map<std::string, ArtifactId>& external_artifacts) const
{
    for (const auto& output : m_interface.outputs())
    {
        std::vector<Source> explicit_sources;
        auto configured = config.outputs.find(output.name);
        if (configured != config.outputs.end())
        {
            explicit_sources = configured->second.materializer_source;
        }
        config.outputs[output.name].materializer_source =
            resolve_output_materializers(config.name, output.name, output.type, explicit_sources, *m_registry);
    }

    config.parameters = finalize_parameters(config);

    for (const auto& key : m_interface.call_order())
    {
        if (input_artifacts.count(key) > 0 || external_artifacts.count(key) > 0 ||
            config.parameters.contains(key))
        {
            continue;
        }
        const InterfaceSlot* input = m_interface.find_input(key);
        if (input != nullptr && input->default_value)
        {
            config.parameters[key] = *input->default_value;
            continue;
        }
        throw StepDagError(
            StepDagErrorCode::MissingInput,
            "Missing entrypoint input '" + key + "' of step '" + config.name + "'.");
    }

    config.caching_parameters = compute_caching_parameters(source_code(), config.outputs, *m_registry);
    config.external_input_artifacts = external_artifacts;
    return StepConfiguration(std::move(config));
}

// ============================================================================
// FunctionStep
// ============================================================================

FunctionStep::FunctionStep(const EntrypointSignature& signature,
                           std::string source_code,
                           EntrypointFunction function,
                           StepOptions options)
    : StepTemplate(signature, std::move(options))
    , m_source_code(std::move(source_code))
    , m_function(std::move(function))
{
}

std::map<std::string, Payload> FunctionStep::entrypoint(const std::map<std::string, Payload>& inputs)
{
    if (!m_function)
    {
        throw StepDagError(StepDagErrorCode::InvalidState, "Step '" + name() + "' has no entrypoint function");
    }
    return m_function(inputs);
}

std::shared_ptr<FunctionStep> make_step(const EntrypointSignature& signature,
                                        std::string source_code,
                                        EntrypointFunction function,
                                        StepOptions options)
{
    return std::make_shared<FunctionStep>(signature, std::move(source_code), std::move(function), std::move(options));
}

} // namespace stepdag
