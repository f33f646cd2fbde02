////////////////////////////////////////////////////////////////////////////////
// FILE: RegExpected.hpp
// DESC: Class template storing the result of an operation on success,
//       or a RegResult (wrapping LSTATUS code used by Registry APIs) on error.
// AUTHOR: Giovanni Dicanio
////////////////////////////////////////////////////////////////////////////////

#ifndef REGBIND_REGEXPECTED_HPP_INCLUDED
#define REGBIND_REGEXPECTED_HPP_INCLUDED


#include <crtdbg.h>                 // _ASSERTE

#include <utility>                  // std::move
#include <variant>                  // std::variant

#include "RegBind/RegException.hpp"
#include "RegBind/RegResult.hpp"


namespace regbind
{


//------------------------------------------------------------------------------
// A class template that stores a value of type T (e.g. DWORD, std::wstring,
// RegValue) on success, or a RegResult on error.
//
// Returned by the RegKeyT::TryXxx() methods and by the value codec
// as an alternative to exception-throwing methods.
//------------------------------------------------------------------------------
template <typename T>
class RegExpected
{
public:
    // Initialize the object with an error code
    explicit RegExpected(const RegResult& errorCode) noexcept;

    // Initialize the object with a value (the success case)
    explicit RegExpected(const T& value);

    // Initialize the object with a value (the success case),
    // optimized for move semantics
    RegExpected(T&& value);

    // Does this object contain a valid value?
    [[nodiscard]] explicit operator bool() const noexcept;

    // Does this object contain a valid value?
    [[nodiscard]] bool IsValid() const noexcept;

    // Access the value (if the object contains a valid value).
    // Throws std::bad_variant_access if the object stores an error.
    [[nodiscard]] const T& GetValue() const;

    // Move the value out of this object (if the object contains a valid value).
    // Throws std::bad_variant_access if the object stores an error.
    [[nodiscard]] T TakeValue();

    // Return the value, or throw a RegException carrying the stored error code
    [[nodiscard]] T ValueOrThrow(const char* message) &&;

    // Access the error code (if the object contains an error status).
    // Throws std::bad_variant_access if the object stores a value.
    [[nodiscard]] RegResult GetError() const;


private:
    std::variant<RegResult, T> m_var;
};



//------------------------------------------------------------------------------
//                          RegExpected Inline Methods
//------------------------------------------------------------------------------

template <typename T>
inline RegExpected<T>::RegExpected(const RegResult& errorCode) noexcept
    : m_var{ errorCode }
{}


template <typename T>
inline RegExpected<T>::RegExpected(const T& value)
    : m_var{ value }
{}


template <typename T>
inline RegExpected<T>::RegExpected(T&& value)
    : m_var{ std::move(value) }
{}


template <typename T>
inline RegExpected<T>::operator bool() const noexcept
{
    return IsValid();
}


template <typename T>
inline bool RegExpected<T>::IsValid() const noexcept
{
    return std::holds_alternative<T>(m_var);
}


template <typename T>
inline const T& RegExpected<T>::GetValue() const
{
    _ASSERTE(IsValid());
    return std::get<T>(m_var);
}


template <typename T>
inline T RegExpected<T>::TakeValue()
{
    _ASSERTE(IsValid());
    return std::move(std::get<T>(m_var));
}


template <typename T>
inline T RegExpected<T>::ValueOrThrow(const char* const message) &&
{
    if (!IsValid())
    {
        throw RegException{ std::get<RegResult>(m_var).Code(), message };
    }

    return std::move(std::get<T>(m_var));
}


template <typename T>
inline RegResult RegExpected<T>::GetError() const
{
    _ASSERTE(!IsValid());
    return std::get<RegResult>(m_var);
}


} // namespace regbind

#endif // REGBIND_REGEXPECTED_HPP_INCLUDED
