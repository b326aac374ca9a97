/**
 * @file source.cpp
 */
#include "stepdag/config/source.hpp"
#include "stepdag/common/stepdag_exceptions.hpp"

#include <cctype>

namespace stepdag
{

namespace
{

bool is_identifier(const std::string& segment)
{
    if (segment.empty())
    {
        return false;
    }
    if (std::isdigit(static_cast<unsigned char>(segment.front())))
    {
        return false;
    }
    for (char c : segment)
    {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_')
        {
            return false;
        }
    }
    return true;
}

bool is_module_path(const std::string& module)
{
    size_t start = 0;
    while (true)
    {
        size_t dot = module.find('.', start);
        std::string segment = module.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
        if (!is_identifier(segment))
        {
            return false;
        }
        if (dot == std::string::npos)
        {
            return true;
        }
        start = dot + 1;
    }
}

} // namespace

Source::Source(std::string module, std::string attribute)
    : m_module(std::move(module))
    , m_attribute(std::move(attribute))
{
    if (!is_module_path(m_module) || !is_identifier(m_attribute))
    {
        throw StepDagError(
            StepDagErrorCode::InvalidSource,
            "Invalid source '" + m_module + "." + m_attribute + "'");
    }
}

Source Source::from_import_path(const std::string& import_path)
{
    size_t dot = import_path.rfind('.');
    if (dot == std::string::npos)
    {
        throw StepDagError(
            StepDagErrorCode::InvalidSource,
            "Invalid source '" + import_path + "': expected 'module.Attribute'");
    }
    return Source(import_path.substr(0, dot), import_path.substr(dot + 1));
}

std::string Source::import_path() const
{
    if (m_module.empty())
    {
        return m_attribute;
    }
    return m_module + "." + m_attribute;
}

std::ostream& operator<<(std::ostream& os, const Source& source)
{
    return os << source.import_path();
}

void to_json(Json& j, const Source& source)
{
    j = source.import_path();
}

} // namespace stepdag
