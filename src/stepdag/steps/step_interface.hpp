/**
 * @file step_interface.hpp
 * @brief Step signatures and the typed interface derived from them.
 */
#pragma once
#include "stepdag/common/common.hpp"
#include "stepdag/common/data_type.hpp"

namespace stepdag
{

/// Output name used when a step returns a single unnamed value.
inline constexpr const char* kSingleReturnOutputName = "output";

/**
 * @brief How a signature parameter binds arguments.
 */
enum class ParameterKind
{
    PositionalOrKeyword,
    KeywordOnly,
    VarPositional,
    VarKeyword
};

/**
 * @brief One parameter of a step entrypoint as declared by the user.
 */
struct SignatureParameter
{
    std::string name;
    std::optional<TypeExpr> annotation;
    ParameterKind kind{ParameterKind::PositionalOrKeyword};
    std::optional<Json> default_value;

    SignatureParameter(std::string name_, std::optional<TypeExpr> annotation_,
                       std::optional<Json> default_value_ = std::nullopt,
                       ParameterKind kind_ = ParameterKind::PositionalOrKeyword)
        : name(std::move(name_))
        , annotation(std::move(annotation_))
        , kind(kind_)
        , default_value(std::move(default_value_))
    {
    }
};

/**
 * @brief Declared return type of a step entrypoint.
 *
 * @details
 * Either nothing (`None`), a single type that becomes the output named
 * `output`, or an explicit list of named outputs.
 */
class ReturnAnnotation
{
public:
    static ReturnAnnotation none();
    static ReturnAnnotation single(TypeExpr type);
    static ReturnAnnotation named(std::vector<std::pair<std::string, TypeExpr>> outputs);

    const std::vector<std::pair<std::string, TypeExpr>>& outputs() const noexcept
    {
        return m_outputs;
    }

private:
    explicit ReturnAnnotation(std::vector<std::pair<std::string, TypeExpr>> outputs)
        : m_outputs(std::move(outputs))
    {
    }

    std::vector<std::pair<std::string, TypeExpr>> m_outputs;
};

/**
 * @brief The declared callable interface of a step: parameters and return.
 *
 * @details
 * A missing `return_annotation` is a missing return type, which is rejected;
 * `ReturnAnnotation::none()` declares a step without outputs.
 */
struct EntrypointSignature
{
    std::string function_name;
    std::vector<SignatureParameter> parameters;
    std::optional<ReturnAnnotation> return_annotation;
};

/**
 * @brief A typed entrypoint input or output.
 */
struct InterfaceSlot
{
    std::string name;
    DataType type;
    std::optional<Json> default_value;
};

class StepInterface;

/**
 * @brief Names that a step entrypoint may not declare (`id`, `after`).
 */
const std::vector<std::string>& default_reserved_arguments();

/**
 * @brief Derive the typed interface of a step from its signature.
 *
 * @details
 * Fails, without partial results, if a parameter captures variadic
 * positional or keyword arguments, if a parameter lacks a type annotation,
 * if more than one parameter is a legacy parameter object or a context, if a
 * parameter uses a reserved name, or if the return annotation is missing.
 * Annotations are collapsed with `resolve_type_annotation()`.
 *
 * @throws StepDagError with `InterfaceError`.
 */
StepInterface analyze_step_signature(const EntrypointSignature& signature,
                                     const std::vector<std::string>& reserved_arguments = default_reserved_arguments());

/**
 * @brief Typed interface descriptor of a step, derived once per template.
 *
 * @details
 * - `inputs()` excludes the context and the legacy parameter object.
 * - `call_order()` lists every bindable parameter (inputs and the legacy
 *   parameter object, but not the context) in signature order.
 *
 * @par Thread safety
 * - Immutable after construction; concurrent reads are safe.
 */
class StepInterface
{
public:
    const std::vector<InterfaceSlot>& inputs() const noexcept { return m_inputs; }
    const std::vector<InterfaceSlot>& outputs() const noexcept { return m_outputs; }
    const std::vector<std::string>& call_order() const noexcept { return m_call_order; }

    bool has_context() const noexcept { return m_context.has_value(); }
    const std::optional<std::string>& context_name() const noexcept { return m_context; }

    /// The legacy parameter-object parameter, if declared.
    const std::optional<InterfaceSlot>& params() const noexcept { return m_params; }

    const InterfaceSlot* find_input(const std::string& name) const noexcept;
    const InterfaceSlot* find_output(const std::string& name) const noexcept;

    std::vector<std::string> output_names() const;

    /**
     * @brief Validate a JSON parameter value supplied for an input.
     * @throws StepDagError with `InterfaceError` if `key` is not bindable, or
     *         `InputValidation` if the input only accepts artifacts or the
     *         value does not match the declared type.
     */
    void validate_input(const std::string& key, const Json& value) const;

    /**
     * @brief Validate an artifact of the given type supplied for an input.
     * @throws StepDagError with `InterfaceError` if `key` is not an input, or
     *         `InputValidation` if the artifact type is not accepted.
     */
    void validate_artifact_input(const std::string& key, const DataType& artifact_type) const;

    friend StepInterface analyze_step_signature(const EntrypointSignature& signature,
                                                const std::vector<std::string>& reserved_arguments);

private:
    std::vector<InterfaceSlot> m_inputs;
    std::vector<InterfaceSlot> m_outputs;
    std::vector<std::string> m_call_order;
    std::optional<std::string> m_context;
    std::optional<InterfaceSlot> m_params;
};

} // namespace stepdag
