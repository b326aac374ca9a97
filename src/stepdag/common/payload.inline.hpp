/**
 * @file payload.inline.hpp
 * @brief Implementations for type-parameterized member methods in the Payload class.
 */
#pragma once
#include "stepdag/common/payload.hpp"

namespace stepdag
{

namespace detail
{

template <typename T>
using payload_storage_t = std::decay_t<T>;

} // namespace detail

template <typename T>
Payload Payload::of(T&& value, DataType type)
{
    using StorageT = detail::payload_storage_t<T>;
    static_assert(!std::is_void_v<StorageT>, "Payload: T cannot be void");
    static_assert(!std::is_array_v<StorageT>, "Payload: T cannot be an array type");

    Payload payload;
    payload.m_pvoid = std::static_pointer_cast<void>(std::make_shared<StorageT>(std::forward<T>(value)));
    payload.m_ti = std::type_index{typeid(StorageT)};
    payload.m_type = std::move(type);
    return payload;
}

inline Payload Payload::from_json(Json value)
{
    DataType type = json_type_of(value);
    return of(std::move(value), std::move(type));
}

template <typename T>
bool Payload::has_type() const noexcept
{
    using StorageT = detail::payload_storage_t<T>;
    return m_ti == std::type_index{typeid(StorageT)};
}

template <typename T>
const T& Payload::as() const
{
    using StorageT = detail::payload_storage_t<T>;
    if (!m_pvoid)
    {
        throw PayloadEmptyError{};
    }
    if (m_ti != std::type_index{typeid(StorageT)})
    {
        throw PayloadTypeError{
            "Payload type mismatch: expected " + std::string{typeid(StorageT).name()} +
            ", got " + std::string{m_ti.name()} + " (" + m_type.to_string() + ")"
        };
    }
    return *static_cast<const StorageT*>(m_pvoid.get());
}

template <typename T>
const T* Payload::try_as() const noexcept
{
    using StorageT = detail::payload_storage_t<T>;
    if (!m_pvoid || m_ti != std::type_index{typeid(StorageT)})
    {
        return nullptr;
    }
    return static_cast<const StorageT*>(m_pvoid.get());
}

template <typename T>
std::shared_ptr<const T> Payload::get() const noexcept
{
    using StorageT = detail::payload_storage_t<T>;
    if (!m_pvoid || m_ti != std::type_index{typeid(StorageT)})
    {
        return nullptr;
    }
    return std::static_pointer_cast<const StorageT>(m_pvoid);
}

} // namespace stepdag
