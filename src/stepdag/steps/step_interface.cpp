/**
 * @file step_interface.cpp
 */
#include "stepdag/steps/step_interface.hpp"
#include "stepdag/common/stepdag_exceptions.hpp"

#include <algorithm>
#include <unordered_set>

namespace stepdag
{

// ============================================================================
// ReturnAnnotation
// ============================================================================

ReturnAnnotation ReturnAnnotation::none()
{
    return ReturnAnnotation({});
}

ReturnAnnotation ReturnAnnotation::single(TypeExpr type)
{
    std::vector<std::pair<std::string, TypeExpr>> outputs;
    outputs.emplace_back(kSingleReturnOutputName, std::move(type));
    return ReturnAnnotation(std::move(outputs));
}

ReturnAnnotation ReturnAnnotation::named(std::vector<std::pair<std::string, TypeExpr>> outputs)
{
    return ReturnAnnotation(std::move(outputs));
}

// ============================================================================
// StepInterface queries
// ============================================================================

namespace
{

const InterfaceSlot* find_slot(const std::vector<InterfaceSlot>& slots, const std::string& name) noexcept
{
    for (const auto& slot : slots)
    {
        if (slot.name == name)
        {
            return &slot;
        }
    }
    return nullptr;
}

} // namespace

const InterfaceSlot* StepInterface::find_input(const std::string& name) const noexcept
{
    return find_slot(m_inputs, name);
}

const InterfaceSlot* StepInterface::find_output(const std::string& name) const noexcept
{
    return find_slot(m_outputs, name);
}

std::vector<std::string> StepInterface::output_names() const
{
    std::vector<std::string> names;
    names.reserve(m_outputs.size());
    for (const auto& output : m_outputs)
    {
        names.push_back(output.name);
    }
    return names;
}

void StepInterface::validate_input(const std::string& key, const Json& value) const
{
    if (m_params && m_params->name == key)
    {
        if (!value.is_object())
        {
            throw StepDagError(
                StepDagErrorCode::InputValidation,
                "Value for parameter object '" + key + "' must be a JSON object");
        }
        return;
    }

    const InterfaceSlot* input = find_input(key);
    if (input == nullptr)
    {
        throw StepDagError(StepDagErrorCode::InterfaceError, "No input for key '" + key + "'");
    }

    if (input->type.is_named() && input->type.named_type().kind == NamedKind::Object)
    {
        throw StepDagError(
            StepDagErrorCode::InputValidation,
            "Passing a parameter for input '" + key + "' of type `" + input->type.to_string() +
                "` is not allowed; this input only accepts artifacts.");
    }

    if (!json_matches(input->type, value))
    {
        throw StepDagError(
            StepDagErrorCode::InputValidation,
            "Input validation failed for '" + key + "': expected `" + input->type.to_string() +
                "`, got " + value.dump());
    }
}

void StepInterface::validate_artifact_input(const std::string& key, const DataType& artifact_type) const
{
    const InterfaceSlot* input = find_input(key);
    if (input == nullptr)
    {
        throw StepDagError(StepDagErrorCode::InterfaceError, "No artifact input for key '" + key + "'");
    }
    if (!accepts(input->type, artifact_type))
    {
        throw StepDagError(
            StepDagErrorCode::InputValidation,
            "Wrong input type (`" + artifact_type.to_string() + "`) for argument '" + key +
                "'. The argument should be of type `" + input->type.to_string() + "`.");
    }
}

// ============================================================================
// Signature analysis
// ============================================================================

const std::vector<std::string>& default_reserved_arguments()
{
    static const std::vector<std::string> s_reserved = {"id", "after"};
    return s_reserved;
}

StepInterface analyze_step_signature(const EntrypointSignature& signature,
                                     const std::vector<std::string>& reserved_arguments)
{
    const std::string& func = signature.function_name;
    StepInterface result;
    std::unordered_set<std::string> seen;

    for (const auto& parameter : signature.parameters)
    {
        const std::string& key = parameter.name;

        if (!seen.insert(key).second)
        {
            throw StepDagError(
                StepDagErrorCode::InterfaceError,
                "Duplicate argument '" + key + "' in function " + func + ".");
        }

        if (std::find(reserved_arguments.begin(), reserved_arguments.end(), key) != reserved_arguments.end())
        {
            throw StepDagError(
                StepDagErrorCode::InterfaceError,
                "Reserved argument name '" + key + "' in function " + func + ".");
        }

        if (parameter.kind == ParameterKind::VarPositional || parameter.kind == ParameterKind::VarKeyword)
        {
            throw StepDagError(
                StepDagErrorCode::InterfaceError,
                "Variable args or kwargs not allowed for function " + func + ".");
        }

        if (!parameter.annotation)
        {
            throw StepDagError(
                StepDagErrorCode::InterfaceError,
                "Missing type annotation for argument '" + key +
                    "'. Please make sure to include type annotations for all your step inputs and outputs.");
        }

        DataType type = resolve_type_annotation(*parameter.annotation);

        if (type.is_parameters())
        {
            if (result.m_params)
            {
                throw StepDagError(
                    StepDagErrorCode::InterfaceError,
                    "Found multiple parameter arguments ('" + result.m_params->name + "' and '" + key +
                        "') for function " + func + ".");
            }
            result.m_params = InterfaceSlot{key, type, parameter.default_value};
            result.m_call_order.push_back(key);
        }
        else if (type.is_context())
        {
            if (result.m_context)
            {
                throw StepDagError(
                    StepDagErrorCode::InterfaceError,
                    "Found multiple context arguments ('" + *result.m_context + "' and '" + key +
                        "') for function " + func + ".");
            }
            result.m_context = key;
        }
        else
        {
            result.m_inputs.push_back(InterfaceSlot{key, type, parameter.default_value});
            result.m_call_order.push_back(key);
        }
    }

    if (!signature.return_annotation)
    {
        throw StepDagError(
            StepDagErrorCode::InterfaceError,
            "Missing return type annotation for function " + func + ".");
    }

    std::unordered_set<std::string> output_names;
    for (const auto& [output_name, output_type] : signature.return_annotation->outputs())
    {
        if (output_name.empty() || !output_names.insert(output_name).second)
        {
            throw StepDagError(
                StepDagErrorCode::InterfaceError,
                "Invalid or duplicate output name '" + output_name + "' in function " + func + ".");
        }
        result.m_outputs.push_back(InterfaceSlot{output_name, resolve_type_annotation(output_type), std::nullopt});
    }

    return result;
}

} // namespace stepdag
