/**
 * @file data_type.hpp
 * @brief Closed model of declared data types for step inputs and outputs.
 */
#pragma once
#include "stepdag/common/common.hpp"

namespace stepdag
{

class DataType;
struct ParametersSchema;

/**
 * @brief Built-in scalar and container kinds.
 *
 * @details
 * `Any` is the unconstrained type. `None` is the null placeholder used for
 * explicit `None` members of unions.
 */
enum class ScalarKind
{
    Any,
    None,
    Bool,
    Int,
    Float,
    String,
    List,
    Dict
};

/**
 * @brief Role of a named (user-registered) type.
 *
 * @details
 * - `Object`: arbitrary class; only reachable through artifacts.
 * - `Model`: JSON model with a field schema; accepts JSON objects.
 * - `Parameters`: legacy parameter object; at most one per signature.
 * - `Context`: step context; at most one per signature, never an input.
 */
enum class NamedKind
{
    Object,
    Model,
    Parameters,
    Context
};

struct ScalarType
{
    ScalarKind kind;
};

struct UnionType
{
    std::vector<DataType> members;
};

struct NamedType
{
    std::string identifier;
    NamedKind kind;
    std::shared_ptr<const ParametersSchema> schema;
};

/**
 * @brief A declared data type: `Scalar(kind)`, `Union(members)` or
 * `Named(identifier)`.
 *
 * @details
 * Data types are built once during signature analysis and are immutable
 * afterwards. They have value semantics; copies share the schema of named
 * model types.
 *
 * @par Union normalization
 * `union_of()` flattens nested unions and removes duplicate members while
 * keeping the first occurrence, so member order is the declaration order.
 * A union of a single member collapses to that member.
 */
class DataType
{
public:
    /**
     * @brief Default constructed type is `Any`.
     */
    DataType();

    static DataType any();
    static DataType none();
    static DataType boolean();
    static DataType integer();
    static DataType floating();
    static DataType string();
    static DataType list();
    static DataType dict();
    static DataType scalar(ScalarKind kind);

    static DataType union_of(const std::vector<DataType>& members);

    /**
     * @brief Named arbitrary object type.
     * @param identifier Import path or other unique name of the type.
     */
    static DataType named(std::string identifier);

    /**
     * @brief Named JSON model type with a field schema.
     */
    static DataType model(std::string identifier, std::shared_ptr<const ParametersSchema> schema);

    /**
     * @brief Named legacy parameter object type with a field schema.
     */
    static DataType parameters(std::string identifier, std::shared_ptr<const ParametersSchema> schema);

    /**
     * @brief The step context type.
     */
    static DataType context(std::string identifier = "StepContext");

    bool is_scalar() const noexcept;
    bool is_union() const noexcept;
    bool is_named() const noexcept;

    bool is_any() const noexcept;
    bool is_none() const noexcept;
    bool is_context() const noexcept;
    bool is_parameters() const noexcept;
    bool is_model() const noexcept;

    /**
     * @brief Scalar kind.
     * @throws std::logic_error if this is not a scalar type.
     */
    ScalarKind scalar_kind() const;

    /**
     * @brief Union members in declaration order.
     * @throws std::logic_error if this is not a union type.
     */
    const std::vector<DataType>& members() const;

    /**
     * @brief Named type description.
     * @throws std::logic_error if this is not a named type.
     */
    const NamedType& named_type() const;

    /**
     * @brief Human readable and registry key form, e.g. `Union[int, None]`.
     */
    std::string to_string() const;

    friend bool operator==(const DataType& lhs, const DataType& rhs);
    friend bool operator!=(const DataType& lhs, const DataType& rhs)
    {
        return !(lhs == rhs);
    }

private:
    explicit DataType(std::variant<ScalarType, UnionType, NamedType> value);

    std::variant<ScalarType, UnionType, NamedType> m_value;
};

std::ostream& operator<<(std::ostream& os, const DataType& type);

/**
 * @brief A single field of a model or parameter object schema.
 */
struct ParameterField
{
    std::string name;
    DataType type;
    std::optional<Json> default_value;

    bool required() const noexcept
    {
        return !default_value.has_value();
    }
};

/**
 * @brief Field schema of a model or legacy parameter object type.
 */
struct ParametersSchema
{
    std::vector<ParameterField> fields;

    /// Whether values for keys outside `fields` are accepted and kept.
    bool allow_extra{false};

    /**
     * @brief Find a field by name.
     * @return Pointer to the field, or nullptr.
     */
    const ParameterField* find(const std::string& name) const noexcept;
};

/**
 * @brief Raw type annotation as written on a step signature.
 *
 * @details
 * A `TypeExpr` is what the user declares; `resolve_type_annotation()` turns it
 * into a `DataType`. Generic aliases such as `Dict[str, int]` are written as
 * `generic(dict(), {...})` and collapse to their origin type. Unions are kept,
 * with each member collapsed to its origin.
 */
class TypeExpr
{
public:
    enum class Form
    {
        Plain,
        Generic,
        Union,
        Optional
    };

    /**
     * @brief Implicit conversion from a plain data type.
     */
    TypeExpr(DataType type); // NOLINT(google-explicit-constructor)

    static TypeExpr plain(DataType type);
    static TypeExpr generic(DataType origin, std::vector<TypeExpr> args);
    static TypeExpr union_of(std::vector<TypeExpr> args);
    static TypeExpr optional(TypeExpr arg);

    Form form() const noexcept
    {
        return m_form;
    }

    /// Origin type for `Plain` and `Generic` forms.
    const DataType& origin() const noexcept
    {
        return m_origin;
    }

    /// Type arguments for `Generic`, `Union` and `Optional` forms.
    const std::vector<TypeExpr>& args() const noexcept
    {
        return m_args;
    }

private:
    TypeExpr(Form form, DataType origin, std::vector<TypeExpr> args);

    Form m_form;
    DataType m_origin;
    std::vector<TypeExpr> m_args;
};

/**
 * @brief Collapse a raw annotation to a data type.
 *
 * @details
 * - `Plain(T)` and `Generic(T, ...)` resolve to `T`.
 * - `Union(a, b, ...)` resolves to `Union(resolve(a), resolve(b), ...)`.
 * - `Optional(T)` resolves to `Union(resolve(T), None)`.
 */
DataType resolve_type_annotation(const TypeExpr& expr);

/**
 * @brief Check whether a value of type `actual` may be bound to `declared`.
 *
 * @details
 * `Any` on either side is accepted. A declared union accepts anything one of
 * its members accepts; an actual union is accepted only if every member is.
 * `Float` accepts `Int`, and model types accept `Dict`. Named types otherwise
 * match by identifier.
 */
bool accepts(const DataType& declared, const DataType& actual);

/**
 * @brief Check whether a JSON value conforms to a declared type.
 *
 * @details
 * Arbitrary object and context types never match: such inputs can only be
 * fed by artifacts. Model and parameter types require a JSON object whose
 * fields match the schema; required fields must be present and unknown keys
 * are rejected unless the schema allows extra keys.
 */
bool json_matches(const DataType& declared, const Json& value);

/**
 * @brief The data type a JSON value would be reported as.
 */
DataType json_type_of(const Json& value);

/**
 * @brief Complete a JSON object with the schema's field defaults.
 * @param schema The schema to apply.
 * @param value A JSON object (null is treated as an empty object).
 * @param missing_fields Receives the names of required fields without value.
 * @return The completed object. Extra keys are kept only if allowed.
 */
Json apply_schema_defaults(const ParametersSchema& schema,
                           const Json& value,
                           std::vector<std::string>& missing_fields);

} // namespace stepdag
