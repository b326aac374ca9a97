/**
 * @file source.hpp
 * @brief Import-path identifiers for materializers and hooks.
 */
#pragma once
#include "stepdag/common/common.hpp"

namespace stepdag
{

/**
 * @brief Identifier of a loadable code object, as `module.path.Attribute`.
 *
 * @details
 * Sources name materializers and hooks in configurations. They are plain
 * values; resolving a source to a concrete object is the job of the
 * registry that owns such objects.
 */
class Source
{
public:
    Source() = default;

    /**
     * @brief Construct from module and attribute parts.
     * @throws StepDagError with `InvalidSource` if either part is invalid.
     */
    Source(std::string module, std::string attribute);

    /**
     * @brief Parse an import path such as `pkg.module.Name`.
     * @throws StepDagError with `InvalidSource` if the path has no module
     *         part or contains an empty or non-identifier segment.
     */
    static Source from_import_path(const std::string& import_path);

    const std::string& module() const noexcept
    {
        return m_module;
    }

    const std::string& attribute() const noexcept
    {
        return m_attribute;
    }

    /**
     * @brief The `module.attribute` form.
     */
    std::string import_path() const;

    bool empty() const noexcept
    {
        return m_attribute.empty();
    }

    friend bool operator==(const Source& lhs, const Source& rhs)
    {
        return lhs.m_module == rhs.m_module && lhs.m_attribute == rhs.m_attribute;
    }

    friend bool operator!=(const Source& lhs, const Source& rhs)
    {
        return !(lhs == rhs);
    }

    friend bool operator<(const Source& lhs, const Source& rhs)
    {
        return lhs.import_path() < rhs.import_path();
    }

private:
    std::string m_module;
    std::string m_attribute;
};

std::ostream& operator<<(std::ostream& os, const Source& source);

void to_json(Json& j, const Source& source);

} // namespace stepdag
