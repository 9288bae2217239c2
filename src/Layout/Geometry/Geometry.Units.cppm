module;

#include <cmath>
#include <concepts>
#include <format>
#include <limits>
#include <optional>
#include <type_traits>

export module Layout.Geometry.Units;

export namespace Layout::Geometry
{
    // Unit tag for values whose unit is not known or not relevant.
    // Unit tags are never stored; they only participate in the type system.
    struct UnknownUnit {};

    // -------------------------------------------------------------------------
    // ZeroTraits - additive identity of a scalar type
    // -------------------------------------------------------------------------
    // Provided for arithmetic types. Specialize it for scalar types that are
    // not constructible from a literal 0:
    //
    //   template <> struct Layout::Geometry::ZeroTraits<Fixed16>
    //   {
    //       static constexpr Fixed16 Value() noexcept { return Fixed16::FromRaw(0); }
    //   };
    // -------------------------------------------------------------------------
    template <typename T>
    struct ZeroTraits {};

    template <typename T>
        requires std::is_arithmetic_v<T>
    struct ZeroTraits<T>
    {
        static constexpr T Value() noexcept { return T(0); }
    };

    template <typename T>
    concept HasZero = std::copy_constructible<T> && requires
    {
        { ZeroTraits<T>::Value() } -> std::convertible_to<T>;
    };

    template <typename T>
    concept Addable = std::copy_constructible<T> && requires(const T& a, const T& b)
    {
        { a + b } -> std::convertible_to<T>;
    };

    template <typename T>
    concept Subtractable = std::copy_constructible<T> && requires(const T& a, const T& b)
    {
        { a - b } -> std::convertible_to<T>;
    };

    // Disabled std::formatter specializations are not default constructible.
    template <typename T>
    concept FormattableScalar = std::semiregular<std::formatter<std::remove_cvref_t<T>, char>>;

    // Value-preserving scalar conversion. Returns nullopt when the value is not
    // representable in To: integer overflow, float -> integer out of range or
    // non-finite, finite float overflowing a narrower float. Float -> integer
    // truncates toward zero; integer -> float may round.
    template <typename To, typename From>
        requires std::constructible_from<To, From>
    [[nodiscard]] std::optional<To> TryNumericCast(From value)
    {
        if constexpr (std::is_same_v<To, From>)
        {
            return value;
        }
        else if constexpr (std::is_integral_v<To> && std::is_integral_v<From>)
        {
            const To converted = static_cast<To>(value);
            if (static_cast<From>(converted) != value || ((value < From{}) != (converted < To{})))
                return std::nullopt;
            return converted;
        }
        else if constexpr (std::is_integral_v<To> && std::is_floating_point_v<From>)
        {
            if (!std::isfinite(value))
                return std::nullopt;

            // [lower, 2^digits) in To's value range, exact in any floating type
            const From truncated = std::trunc(value);
            const From upper = std::ldexp(From(1), std::numeric_limits<To>::digits);
            const From lower = std::numeric_limits<To>::is_signed ? -upper : From(0);
            if (truncated < lower || truncated >= upper)
                return std::nullopt;
            return static_cast<To>(truncated);
        }
        else if constexpr (std::is_floating_point_v<To> && std::is_floating_point_v<From>)
        {
            if constexpr (std::numeric_limits<To>::max() < std::numeric_limits<From>::max())
            {
                if (std::isfinite(value) && std::fabs(value) > static_cast<From>(std::numeric_limits<To>::max()))
                    return std::nullopt;
            }
            return static_cast<To>(value);
        }
        else
        {
            return static_cast<To>(value);
        }
    }
}
