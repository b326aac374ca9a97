/**
 * @file payload.hpp
 * @brief Definition of Payload, a type-erased value tagged with its DataType.
 * @see payload.inline.hpp for implementations of type-parameterized methods.
 */

#pragma once
#include "stepdag/common/common.hpp"
#include "stepdag/common/data_type.hpp"
#include <typeindex>
#include <typeinfo>

namespace stepdag
{

/**
 * @brief Exception thrown when Payload type access fails.
 */
class PayloadTypeError : public std::runtime_error
{
public:
    explicit PayloadTypeError(const std::string& msg)
        : std::runtime_error(msg)
    {}
};

/**
 * @brief Exception thrown when accessing an empty Payload.
 */
class PayloadEmptyError : public std::runtime_error
{
public:
    PayloadEmptyError()
        : std::runtime_error("Payload is empty")
    {}
};

/**
 * @brief A type-erased value carrying the declared DataType it represents.
 *
 * @details
 * Payloads hold the raw values of external artifacts and the inputs and
 * outputs of steps invoked directly. The C++ type is used for access checks
 * and the `DataType` for materializer lookup and input type checking.
 *
 * @par Invariants
 * - `(m_ti == typeid(void))` if and only if `m_pvoid == nullptr`
 * - An empty payload reports `DataType::none()`.
 *
 * @par Ownership
 * - Value-like semantics with shared ownership of the underlying value.
 */
class Payload
{
public:
    /**
     * @brief Default constructor creates an empty Payload.
     */
    Payload() = default;

    /**
     * @brief Wrap a value with an explicit data type.
     * @tparam T The value type (will be decayed).
     */
    template <typename T>
    static Payload of(T&& value, DataType type);

    /**
     * @brief Wrap a JSON value; its data type is derived from the JSON kind.
     */
    static Payload from_json(Json value);

    [[nodiscard]] bool has_value() const noexcept
    {
        return m_pvoid != nullptr;
    }

    /**
     * @brief The data type this payload represents.
     */
    [[nodiscard]] const DataType& data_type() const noexcept
    {
        return m_type;
    }

    /**
     * @brief The stored C++ type, or typeid(void) if empty.
     */
    [[nodiscard]] std::type_index cpp_type() const noexcept
    {
        return m_ti;
    }

    /**
     * @brief Check if the stored C++ type matches T.
     */
    template <typename T>
    [[nodiscard]] bool has_type() const noexcept;

    void reset() noexcept
    {
        m_pvoid.reset();
        m_ti = std::type_index{typeid(void)};
        m_type = DataType::none();
    }

    /**
     * @brief Access stored value as const reference.
     * @throws PayloadEmptyError if empty.
     * @throws PayloadTypeError if type mismatch.
     */
    template <typename T>
    [[nodiscard]] const T& as() const;

    /**
     * @brief Try to access stored value as const pointer.
     * @return nullptr if empty or type mismatch.
     */
    template <typename T>
    [[nodiscard]] const T* try_as() const noexcept;

    /**
     * @brief Get a shared_ptr to the stored value, or nullptr on mismatch.
     */
    template <typename T>
    [[nodiscard]] std::shared_ptr<const T> get() const noexcept;

private:
    std::shared_ptr<void> m_pvoid{};
    std::type_index m_ti{typeid(void)};
    DataType m_type{DataType::none()};
};

} // namespace stepdag
