/**
 * @file materializer.hpp
 * @brief Materializer interface and the type-to-materializer registry.
 */
#pragma once
#include "stepdag/common/common.hpp"
#include "stepdag/common/data_type.hpp"
#include "stepdag/common/payload.hpp"
#include "stepdag/config/source.hpp"
#include <tuple>

namespace stepdag
{

/**
 * @brief A type-specific serialization strategy.
 *
 * @details
 * Materializer implementations live outside this library. The core only
 * needs their identity (source and source code, for caching), the types
 * they handle, and the ability to persist an external artifact value.
 */
class IMaterializer
{
public:
    virtual ~IMaterializer() = 0;

    /**
     * @brief Import path identifying this materializer.
     */
    virtual Source source() const = 0;

    /**
     * @brief Data types this materializer handles by default.
     */
    virtual std::vector<DataType> associated_types() const = 0;

    /**
     * @brief Artifact type recorded for values written by this materializer.
     */
    virtual std::string artifact_type() const = 0;

    /**
     * @brief Implementation source text, hashed for caching.
     */
    virtual std::string source_code() const = 0;

    /**
     * @brief Persist a value at the given location.
     */
    virtual void save(const std::string& uri, const Payload& value) = 0;

    /**
     * @brief Metadata describing a saved value. Defaults to an empty object.
     */
    virtual Json extract_metadata(const Payload& value) const
    {
        (void)value;
        return Json::object();
    }

protected:
    IMaterializer() = default;

private:
    IMaterializer(const IMaterializer&) = delete;
    IMaterializer& operator=(const IMaterializer&) = delete;
};

using MaterializerPtr = std::shared_ptr<IMaterializer>;

inline IMaterializer::~IMaterializer() = default;

/**
 * @brief Maps data types and sources to materializers.
 *
 * @details
 * A materializer is registered under its source and under each of its
 * associated types. When two materializers claim the same type, the first
 * registration is kept.
 *
 * @par Thread Safety
 * - No internal synchronization. Registration is expected to happen before
 *   pipelines are built; afterwards the registry is read-only.
 */
class MaterializerRegistry
{
public:
    MaterializerRegistry() = default;

    /**
     * @brief Register a materializer under its source and associated types.
     */
    void register_materializer(const MaterializerPtr& materializer);

    /**
     * @brief Register a materializer as the default for one data type.
     * @throws std::invalid_argument for `Any` and union types.
     */
    void register_materializer_type(const DataType& type, const MaterializerPtr& materializer);

    /**
     * @brief Check whether a default materializer exists for a type.
     */
    bool is_registered(const DataType& type) const;

    /**
     * @brief Default materializer for a type.
     * @throws StepDagError with `MaterializerNotFound` if none is registered.
     */
    MaterializerPtr lookup(const DataType& type) const;

    /**
     * @brief Check whether a source denotes a known materializer.
     */
    bool is_materializer_source(const Source& source) const;

    /**
     * @brief Load the materializer denoted by a source.
     * @throws StepDagError with `MaterializerNotFound` if the source is unknown.
     */
    MaterializerPtr load(const Source& source) const;

    /**
     * @brief Process-wide registry used when no registry is supplied.
     */
    static const std::shared_ptr<MaterializerRegistry>& default_registry();

private:
    /// Variant alternative, scalar or named kind, and identifier of a type.
    using TypeKey = std::tuple<int, int, std::string>;

    static TypeKey type_key(const DataType& type);

    std::map<TypeKey, MaterializerPtr> m_by_type;
    std::map<std::string, MaterializerPtr> m_by_source;
};

} // namespace stepdag
