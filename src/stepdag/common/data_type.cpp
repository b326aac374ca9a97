/**
 * @file data_type.cpp
 */
#include "stepdag/common/data_type.hpp"

#include <algorithm>

namespace stepdag
{

// ============================================================================
// DataType construction
// ============================================================================

DataType::DataType()
    : m_value(ScalarType{ScalarKind::Any})
{
}

DataType::DataType(std::variant<ScalarType, UnionType, NamedType> value)
    : m_value(std::move(value))
{
}

DataType DataType::any()
{
    return scalar(ScalarKind::Any);
}

DataType DataType::none()
{
    return scalar(ScalarKind::None);
}

DataType DataType::boolean()
{
    return scalar(ScalarKind::Bool);
}

DataType DataType::integer()
{
    return scalar(ScalarKind::Int);
}

DataType DataType::floating()
{
    return scalar(ScalarKind::Float);
}

DataType DataType::string()
{
    return scalar(ScalarKind::String);
}

DataType DataType::list()
{
    return scalar(ScalarKind::List);
}

DataType DataType::dict()
{
    return scalar(ScalarKind::Dict);
}

DataType DataType::scalar(ScalarKind kind)
{
    return DataType(ScalarType{kind});
}

DataType DataType::union_of(const std::vector<DataType>& members)
{
    std::vector<DataType> flat;
    auto push_unique = [&flat](const DataType& member) {
        if (std::find(flat.begin(), flat.end(), member) == flat.end())
        {
            flat.push_back(member);
        }
    };

    for (const auto& member : members)
    {
        if (member.is_union())
        {
            for (const auto& nested : member.members())
            {
                push_unique(nested);
            }
        }
        else
        {
            push_unique(member);
        }
    }

    if (flat.empty())
    {
        throw std::invalid_argument("DataType::union_of requires at least one member");
    }
    if (flat.size() == 1)
    {
        return flat.front();
    }
    return DataType(UnionType{std::move(flat)});
}

DataType DataType::named(std::string identifier)
{
    return DataType(NamedType{std::move(identifier), NamedKind::Object, nullptr});
}

DataType DataType::model(std::string identifier, std::shared_ptr<const ParametersSchema> schema)
{
    return DataType(NamedType{std::move(identifier), NamedKind::Model, std::move(schema)});
}

DataType DataType::parameters(std::string identifier, std::shared_ptr<const ParametersSchema> schema)
{
    return DataType(NamedType{std::move(identifier), NamedKind::Parameters, std::move(schema)});
}

DataType DataType::context(std::string identifier)
{
    return DataType(NamedType{std::move(identifier), NamedKind::Context, nullptr});
}

// ============================================================================
// DataType queries
// ============================================================================

bool DataType::is_scalar() const noexcept
{
    return std::holds_alternative<ScalarType>(m_value);
}

bool DataType::is_union() const noexcept
{
    return std::holds_alternative<UnionType>(m_value);
}

bool DataType::is_named() const noexcept
{
    return std::holds_alternative<NamedType>(m_value);
}

bool DataType::is_any() const noexcept
{
    const auto* scalar = std::get_if<ScalarType>(&m_value);
    return scalar != nullptr && scalar->kind == ScalarKind::Any;
}

bool DataType::is_none() const noexcept
{
    const auto* scalar = std::get_if<ScalarType>(&m_value);
    return scalar != nullptr && scalar->kind == ScalarKind::None;
}

bool DataType::is_context() const noexcept
{
    const auto* named = std::get_if<NamedType>(&m_value);
    return named != nullptr && named->kind == NamedKind::Context;
}

bool DataType::is_parameters() const noexcept
{
    const auto* named = std::get_if<NamedType>(&m_value);
    return named != nullptr && named->kind == NamedKind::Parameters;
}

bool DataType::is_model() const noexcept
{
    const auto* named = std::get_if<NamedType>(&m_value);
    return named != nullptr && named->kind == NamedKind::Model;
}

ScalarKind DataType::scalar_kind() const
{
    const auto* scalar = std::get_if<ScalarType>(&m_value);
    if (scalar == nullptr)
    {
        throw std::logic_error("DataType " + to_string() + " is not a scalar type");
    }
    return scalar->kind;
}

const std::vector<DataType>& DataType::members() const
{
    const auto* u = std::get_if<UnionType>(&m_value);
    if (u == nullptr)
    {
        throw std::logic_error("DataType " + to_string() + " is not a union type");
    }
    return u->members;
}

const NamedType& DataType::named_type() const
{
    const auto* named = std::get_if<NamedType>(&m_value);
    if (named == nullptr)
    {
        throw std::logic_error("DataType " + to_string() + " is not a named type");
    }
    return *named;
}

std::string DataType::to_string() const
{
    if (const auto* scalar = std::get_if<ScalarType>(&m_value))
    {
        switch (scalar->kind)
        {
        case ScalarKind::Any: return "Any";
        case ScalarKind::None: return "None";
        case ScalarKind::Bool: return "bool";
        case ScalarKind::Int: return "int";
        case ScalarKind::Float: return "float";
        case ScalarKind::String: return "str";
        case ScalarKind::List: return "list";
        case ScalarKind::Dict: return "dict";
        }
        return "?";
    }
    if (const auto* u = std::get_if<UnionType>(&m_value))
    {
        std::string result = "Union[";
        for (size_t i = 0; i < u->members.size(); ++i)
        {
            if (i > 0)
            {
                result += ", ";
            }
            result += u->members[i].to_string();
        }
        result += "]";
        return result;
    }
    return std::get<NamedType>(m_value).identifier;
}

bool operator==(const DataType& lhs, const DataType& rhs)
{
    if (lhs.m_value.index() != rhs.m_value.index())
    {
        return false;
    }
    if (lhs.is_scalar())
    {
        return lhs.scalar_kind() == rhs.scalar_kind();
    }
    if (lhs.is_union())
    {
        return lhs.members() == rhs.members();
    }
    const auto& a = lhs.named_type();
    const auto& b = rhs.named_type();
    return a.identifier == b.identifier && a.kind == b.kind;
}

std::ostream& operator<<(std::ostream& os, const DataType& type)
{
    return os << type.to_string();
}

// ============================================================================
// ParametersSchema
// ============================================================================

const ParameterField* ParametersSchema::find(const std::string& name) const noexcept
{
    for (const auto& field : fields)
    {
        if (field.name == name)
        {
            return &field;
        }
    }
    return nullptr;
}

// ============================================================================
// TypeExpr
// ============================================================================

TypeExpr::TypeExpr(DataType type)
    : m_form(Form::Plain)
    , m_origin(std::move(type))
{
}

TypeExpr::TypeExpr(Form form, DataType origin, std::vector<TypeExpr> args)
    : m_form(form)
    , m_origin(std::move(origin))
    , m_args(std::move(args))
{
}

TypeExpr TypeExpr::plain(DataType type)
{
    return TypeExpr(Form::Plain, std::move(type), {});
}

TypeExpr TypeExpr::generic(DataType origin, std::vector<TypeExpr> args)
{
    return TypeExpr(Form::Generic, std::move(origin), std::move(args));
}

TypeExpr TypeExpr::union_of(std::vector<TypeExpr> args)
{
    if (args.empty())
    {
        throw std::invalid_argument("TypeExpr::union_of requires at least one argument");
    }
    return TypeExpr(Form::Union, DataType::any(), std::move(args));
}

TypeExpr TypeExpr::optional(TypeExpr arg)
{
    std::vector<TypeExpr> args;
    args.push_back(std::move(arg));
    return TypeExpr(Form::Optional, DataType::any(), std::move(args));
}

DataType resolve_type_annotation(const TypeExpr& expr)
{
    switch (expr.form())
    {
    case TypeExpr::Form::Plain:
    case TypeExpr::Form::Generic:
        return expr.origin();
    case TypeExpr::Form::Union:
    {
        std::vector<DataType> members;
        members.reserve(expr.args().size());
        for (const auto& arg : expr.args())
        {
            members.push_back(resolve_type_annotation(arg));
        }
        return DataType::union_of(members);
    }
    case TypeExpr::Form::Optional:
        return DataType::union_of({resolve_type_annotation(expr.args().front()), DataType::none()});
    }
    return DataType::any();
}

// ============================================================================
// Type checking
// ============================================================================

bool accepts(const DataType& declared, const DataType& actual)
{
    if (declared.is_any() || actual.is_any())
    {
        return true;
    }
    if (actual.is_union())
    {
        for (const auto& member : actual.members())
        {
            if (!accepts(declared, member))
            {
                return false;
            }
        }
        return true;
    }
    if (declared.is_union())
    {
        for (const auto& member : declared.members())
        {
            if (accepts(member, actual))
            {
                return true;
            }
        }
        return false;
    }
    if (declared.is_scalar() && actual.is_scalar())
    {
        ScalarKind d = declared.scalar_kind();
        ScalarKind a = actual.scalar_kind();
        return d == a || (d == ScalarKind::Float && a == ScalarKind::Int);
    }
    if (declared.is_model() && actual.is_scalar())
    {
        return actual.scalar_kind() == ScalarKind::Dict;
    }
    return declared == actual;
}

namespace
{

bool json_matches_schema(const ParametersSchema& schema, const Json& value)
{
    if (!value.is_object())
    {
        return false;
    }
    for (const auto& field : schema.fields)
    {
        auto it = value.find(field.name);
        if (it == value.end())
        {
            if (field.required())
            {
                return false;
            }
            continue;
        }
        if (!json_matches(field.type, *it))
        {
            return false;
        }
    }
    if (!schema.allow_extra)
    {
        for (auto it = value.begin(); it != value.end(); ++it)
        {
            if (schema.find(it.key()) == nullptr)
            {
                return false;
            }
        }
    }
    return true;
}

} // namespace

bool json_matches(const DataType& declared, const Json& value)
{
    if (declared.is_union())
    {
        for (const auto& member : declared.members())
        {
            if (json_matches(member, value))
            {
                return true;
            }
        }
        return false;
    }
    if (declared.is_named())
    {
        const NamedType& named = declared.named_type();
        if ((named.kind == NamedKind::Model || named.kind == NamedKind::Parameters) && named.schema)
        {
            return json_matches_schema(*named.schema, value);
        }
        return false;
    }
    switch (declared.scalar_kind())
    {
    case ScalarKind::Any: return true;
    case ScalarKind::None: return value.is_null();
    case ScalarKind::Bool: return value.is_boolean();
    case ScalarKind::Int: return value.is_number_integer();
    case ScalarKind::Float: return value.is_number();
    case ScalarKind::String: return value.is_string();
    case ScalarKind::List: return value.is_array();
    case ScalarKind::Dict: return value.is_object();
    }
    return false;
}

DataType json_type_of(const Json& value)
{
    switch (value.type())
    {
    case Json::value_t::null: return DataType::none();
    case Json::value_t::boolean: return DataType::boolean();
    case Json::value_t::number_integer:
    case Json::value_t::number_unsigned: return DataType::integer();
    case Json::value_t::number_float: return DataType::floating();
    case Json::value_t::string: return DataType::string();
    case Json::value_t::array: return DataType::list();
    case Json::value_t::object: return DataType::dict();
    default: break;
    }
    return DataType::any();
}

Json apply_schema_defaults(const ParametersSchema& schema,
                           const Json& value,
                           std::vector<std::string>& missing_fields)
{
    Json source = value.is_null() ? Json::object() : value;
    Json result = Json::object();
    for (const auto& field : schema.fields)
    {
        auto it = source.find(field.name);
        if (it != source.end())
        {
            result[field.name] = *it;
        }
        else if (field.default_value)
        {
            result[field.name] = *field.default_value;
        }
        else
        {
            missing_fields.push_back(field.name);
        }
    }
    if (schema.allow_extra && source.is_object())
    {
        for (auto it = source.begin(); it != source.end(); ++it)
        {
            if (!result.contains(it.key()))
            {
                result[it.key()] = it.value();
            }
        }
    }
    return result;
}

} // namespace stepdag
