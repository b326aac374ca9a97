/**
 * @file materializer.cpp
 */
#include "stepdag/steps/materializer.hpp"
#include "stepdag/common/logging.hpp"
#include "stepdag/common/stepdag_exceptions.hpp"

namespace stepdag
{

MaterializerRegistry::TypeKey MaterializerRegistry::type_key(const DataType& type)
{
    if (type.is_scalar())
    {
        return TypeKey(0, static_cast<int>(type.scalar_kind()), std::string());
    }
    if (type.is_named())
    {
        const NamedType& named = type.named_type();
        return TypeKey(2, static_cast<int>(named.kind), named.identifier);
    }
    return TypeKey(1, 0, type.to_string());
}

void MaterializerRegistry::register_materializer(const MaterializerPtr& materializer)
{
    if (!materializer)
    {
        throw std::invalid_argument("Cannot register a null materializer");
    }
    m_by_source[materializer->source().import_path()] = materializer;
    for (const auto& type : materializer->associated_types())
    {
        register_materializer_type(type, materializer);
    }
}

void MaterializerRegistry::register_materializer_type(const DataType& type, const MaterializerPtr& materializer)
{
    if (type.is_any() || type.is_union())
    {
        throw std::invalid_argument("Cannot register a materializer for type " + type.to_string());
    }
    m_by_source.emplace(materializer->source().import_path(), materializer);

    auto inserted = m_by_type.emplace(type_key(type), materializer);
    if (!inserted.second)
    {
        STEPDAG_LOG_DEBUG("Type " << type << " already has materializer "
                          << inserted.first->second->source() << "; ignoring "
                          << materializer->source());
    }
}

bool MaterializerRegistry::is_registered(const DataType& type) const
{
    return m_by_type.find(type_key(type)) != m_by_type.end();
}

MaterializerPtr MaterializerRegistry::lookup(const DataType& type) const
{
    auto it = m_by_type.find(type_key(type));
    if (it == m_by_type.end())
    {
        throw StepDagError(
            StepDagErrorCode::MaterializerNotFound,
            "No materializer registered for type `" + type.to_string() + "`");
    }
    return it->second;
}

bool MaterializerRegistry::is_materializer_source(const Source& source) const
{
    return m_by_source.find(source.import_path()) != m_by_source.end();
}

MaterializerPtr MaterializerRegistry::load(const Source& source) const
{
    auto it = m_by_source.find(source.import_path());
    if (it == m_by_source.end())
    {
        throw StepDagError(
            StepDagErrorCode::MaterializerNotFound,
            "Source `" + source.import_path() + "` does not resolve to a materializer");
    }
    return it->second;
}

const std::shared_ptr<MaterializerRegistry>& MaterializerRegistry::default_registry()
{
    static const std::shared_ptr<MaterializerRegistry> s_registry = std::make_shared<MaterializerRegistry>();
    return s_registry;
}

} // namespace stepdag
