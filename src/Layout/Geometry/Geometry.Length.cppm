module;

#include <compare>
#include <cstddef>
#include <format>
#include <functional>
#include <ostream>

export module Layout.Geometry.Length;

import Core.Hash;
export import Layout.Geometry.Units;

export namespace Layout::Geometry
{
    // -------------------------------------------------------------------------
    // Length - A scalar tagged with a compile-time unit
    // -------------------------------------------------------------------------
    // The Unit tag is never stored (sizeof(Length<T, U>) == sizeof(T)), but
    // lengths of different units are distinct types:
    //
    //   Length<float, CssPixel> a(4.0f);
    //   Length<float, Millimeter> b(2.0f);
    //   // a + b; // Compile error - different units!
    //
    // The constructor is explicit so raw scalars never turn into a unit by
    // accident.
    // -------------------------------------------------------------------------
    template <typename T, typename Unit = UnknownUnit>
    class Length
    {
    public:
        using ValueType = T;
        using UnitType = Unit;

        constexpr Length() = default;

        constexpr explicit Length(T value) : m_Value(value)
        {
        }

        [[nodiscard]] constexpr T Get() const
        {
            return m_Value;
        }

        [[nodiscard]] static constexpr Length Zero() requires HasZero<T>
        {
            return Length(ZeroTraits<T>::Value());
        }

        [[nodiscard]] constexpr Length operator+(const Length& other) const requires Addable<T>
        {
            return Length(static_cast<T>(m_Value + other.m_Value));
        }

        [[nodiscard]] constexpr Length operator-(const Length& other) const requires Subtractable<T>
        {
            return Length(static_cast<T>(m_Value - other.m_Value));
        }

        constexpr bool operator==(const Length&) const = default;
        constexpr auto operator<=>(const Length&) const = default;

        friend std::ostream& operator<<(std::ostream& os, const Length& length) requires FormattableScalar<T>
        {
            return os << std::format("{}", length.m_Value);
        }

    private:
        T m_Value{};
    };
}

// Format specs apply to the wrapped scalar, e.g. std::format("{:.2f}", length).
template <typename T, typename Unit>
struct std::formatter<Layout::Geometry::Length<T, Unit>, char> : std::formatter<T, char>
{
    template <typename FormatContext>
    auto format(const Layout::Geometry::Length<T, Unit>& length, FormatContext& ctx) const
    {
        return std::formatter<T, char>::format(length.Get(), ctx);
    }
};

template <typename T, typename Unit>
struct std::hash<Layout::Geometry::Length<T, Unit>>
{
    std::size_t operator()(const Layout::Geometry::Length<T, Unit>& length) const noexcept
    {
        return Core::Hash::HashValues(length.Get());
    }
};
