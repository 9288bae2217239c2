module;

#include <glm/glm.hpp>

#include <cstddef>
#include <format>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <type_traits>

export module Layout.Geometry.SideOffsets;

import Core.Error;
import Core.Hash;
export import Layout.Geometry.Units;
export import Layout.Geometry.Length;

export namespace Layout::Geometry
{
    // -------------------------------------------------------------------------
    // SideOffsets - Top/right/bottom/left distances of a box edge
    // -------------------------------------------------------------------------
    // The shape of CSS borders, padding and margins. The four sides are
    // independent: there is no ordering or sign requirement between them.
    //
    // Sides are stored as raw scalars. The *Typed() accessors re-attach the
    // Unit tag at the API boundary, so the unit costs nothing at runtime:
    //
    //   struct CssPixel {};
    //   struct Millimeter {};
    //
    //   SideOffsets<float, CssPixel> padding(4, 8, 4, 8);
    //   auto bleed = SideOffsets<float, Millimeter>::AllSame(3);
    //   // padding + bleed; // Compile error - different units!
    //
    // Arithmetic is delegated to T unchanged: overflow in integer sides is
    // whatever T's operator+ does.
    // -------------------------------------------------------------------------
    template <typename T, typename Unit = UnknownUnit>
    struct SideOffsets
    {
        using ValueType = T;
        using UnitType = Unit;
        using LengthType = Length<T, Unit>;

        T Top{};
        T Right{};
        T Bottom{};
        T Left{};

        constexpr SideOffsets() = default;

        constexpr SideOffsets(T top, T right, T bottom, T left)
            : Top(top), Right(right), Bottom(bottom), Left(left)
        {
        }

        constexpr SideOffsets(LengthType top, LengthType right, LengthType bottom, LengthType left)
            : Top(top.Get()), Right(right.Get()), Bottom(bottom.Get()), Left(left.Get())
        {
        }

        [[nodiscard]] static constexpr SideOffsets AllSame(T all)
        {
            return SideOffsets(all, all, all, all);
        }

        [[nodiscard]] static constexpr SideOffsets AllSame(LengthType all)
        {
            return AllSame(all.Get());
        }

        [[nodiscard]] static constexpr SideOffsets Zero() requires HasZero<T>
        {
            const T zero = ZeroTraits<T>::Value();
            return SideOffsets(zero, zero, zero, zero);
        }

        [[nodiscard]] constexpr LengthType TopTyped() const { return LengthType(Top); }
        [[nodiscard]] constexpr LengthType RightTyped() const { return LengthType(Right); }
        [[nodiscard]] constexpr LengthType BottomTyped() const { return LengthType(Bottom); }
        [[nodiscard]] constexpr LengthType LeftTyped() const { return LengthType(Left); }

        // Left + Right
        [[nodiscard]] constexpr T Horizontal() const requires Addable<T>
        {
            return static_cast<T>(Left + Right);
        }

        // Top + Bottom
        [[nodiscard]] constexpr T Vertical() const requires Addable<T>
        {
            return static_cast<T>(Top + Bottom);
        }

        [[nodiscard]] constexpr LengthType HorizontalTyped() const requires Addable<T>
        {
            return LengthType(Horizontal());
        }

        [[nodiscard]] constexpr LengthType VerticalTyped() const requires Addable<T>
        {
            return LengthType(Vertical());
        }

        // Unchecked per-side static_cast. The unit tag is kept.
        template <typename NewT>
        [[nodiscard]] constexpr SideOffsets<NewT, Unit> Cast() const
        {
            return SideOffsets<NewT, Unit>(static_cast<NewT>(Top), static_cast<NewT>(Right),
                                           static_cast<NewT>(Bottom), static_cast<NewT>(Left));
        }

        // Fails with OutOfRange if any side is not representable in NewT.
        template <typename NewT>
        [[nodiscard]] Core::Expected<SideOffsets<NewT, Unit>> TryCast() const
        {
            const std::optional<NewT> top = TryNumericCast<NewT>(Top);
            const std::optional<NewT> right = TryNumericCast<NewT>(Right);
            const std::optional<NewT> bottom = TryNumericCast<NewT>(Bottom);
            const std::optional<NewT> left = TryNumericCast<NewT>(Left);

            if (!top || !right || !bottom || !left)
                return Core::Err<SideOffsets<NewT, Unit>>(Core::ErrorCode::OutOfRange);

            return SideOffsets<NewT, Unit>(*top, *right, *bottom, *left);
        }

        // "(top,right,bottom,left)"
        [[nodiscard]] std::string ToString() const requires FormattableScalar<T>
        {
            return std::format("{}", *this);
        }

        constexpr bool operator==(const SideOffsets&) const = default;

        friend constexpr SideOffsets operator+(const SideOffsets& lhs, const SideOffsets& rhs) requires Addable<T>
        {
            return SideOffsets(static_cast<T>(lhs.Top + rhs.Top),
                               static_cast<T>(lhs.Right + rhs.Right),
                               static_cast<T>(lhs.Bottom + rhs.Bottom),
                               static_cast<T>(lhs.Left + rhs.Left));
        }

        friend std::ostream& operator<<(std::ostream& os, const SideOffsets& offsets) requires FormattableScalar<T>
        {
            return os << offsets.ToString();
        }
    };

    // Packs (Top, Right, Bottom, Left) into x, y, z, w for uniform upload.
    template <typename T, typename Unit>
        requires std::is_arithmetic_v<T>
    [[nodiscard]] glm::vec<4, T> ToVec4(const SideOffsets<T, Unit>& offsets)
    {
        return glm::vec<4, T>(offsets.Top, offsets.Right, offsets.Bottom, offsets.Left);
    }

    template <typename Unit = UnknownUnit, typename T, glm::qualifier Q>
        requires std::is_arithmetic_v<T>
    [[nodiscard]] SideOffsets<T, Unit> FromVec4(const glm::vec<4, T, Q>& v)
    {
        return SideOffsets<T, Unit>(v.x, v.y, v.z, v.w);
    }
}

// Format specs apply to every side, e.g. std::format("{:.1f}", offsets).
template <typename T, typename Unit>
struct std::formatter<Layout::Geometry::SideOffsets<T, Unit>, char> : std::formatter<T, char>
{
    template <typename FormatContext>
    auto format(const Layout::Geometry::SideOffsets<T, Unit>& offsets, FormatContext& ctx) const
    {
        const auto side = [&](const T& value, char terminator)
        {
            auto out = std::formatter<T, char>::format(value, ctx);
            *out++ = terminator;
            ctx.advance_to(out);
        };

        auto out = ctx.out();
        *out++ = '(';
        ctx.advance_to(out);
        side(offsets.Top, ',');
        side(offsets.Right, ',');
        side(offsets.Bottom, ',');
        side(offsets.Left, ')');
        return ctx.out();
    }
};

// Allow SideOffsets to be used in unordered containers
template <typename T, typename Unit>
struct std::hash<Layout::Geometry::SideOffsets<T, Unit>>
{
    std::size_t operator()(const Layout::Geometry::SideOffsets<T, Unit>& offsets) const noexcept
    {
        return Core::Hash::HashValues(offsets.Top, offsets.Right, offsets.Bottom, offsets.Left);
    }
};
