#include <array>
#include <charconv>
#include <cstddef>
#include <span>
#include <string_view>
#include <system_error>
#include <vector>

import Core.Error;
import Core.Logging;
import Layout.Geometry;

using namespace Core;
using namespace Layout::Geometry;

namespace
{
    struct CssPixel {};

    using CssOffsets = SideOffsets<double, CssPixel>;

    struct SandboxOptions
    {
        Log::Level LogLevel = Log::Level::Info;
        bool Verbose = false;
        std::array<double, 4> Sides{};
    };

    Expected<double> ParseSide(std::string_view text)
    {
        double value = 0.0;
        const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec != std::errc{} || end != text.data() + text.size())
            return Err<double>(ErrorCode::InvalidArgument);
        return value;
    }

    Expected<SandboxOptions> ParseArguments(std::span<char* const> args)
    {
        SandboxOptions options;
        std::vector<std::string_view> sides;

        for (std::string_view arg : args)
        {
            if (arg == "--verbose")
            {
                options.LogLevel = Log::Level::Debug;
                options.Verbose = true;
            }
            else if (arg == "--quiet")
            {
                options.LogLevel = Log::Level::Error;
                options.Verbose = false;
            }
            else
                sides.push_back(arg);
        }

        if (sides.size() != options.Sides.size())
        {
            Log::Error("Expected 4 sides (top right bottom left), got {}", sides.size());
            return Err<SandboxOptions>(ErrorCode::InvalidArgument);
        }

        for (size_t i = 0; i < sides.size(); ++i)
        {
            auto side = ParseSide(sides[i]);
            if (!side)
            {
                Log::Error("'{}' is not a number ({})", sides[i], ErrorCodeToString(side.error()));
                return Err<SandboxOptions>(side.error());
            }
            options.Sides[i] = *side;
        }

        return options;
    }
}

int main(int argc, char** argv)
{
    auto options = ParseArguments(std::span<char* const>(argv + 1, static_cast<size_t>(argc > 0 ? argc - 1 : 0)));
    if (!options)
    {
        Log::Error("Usage: Sandbox [--verbose] [--quiet] <top> <right> <bottom> <left>");
        return 1;
    }

    Log::SetLevel(options->LogLevel);

    const auto& s = options->Sides;
    const CssOffsets offsets(s[0], s[1], s[2], s[3]);
    // Info, not Debug: Log::Debug is compiled out in NDEBUG builds
    if (options->Verbose)
        Log::Info("Parsed sides top={} right={} bottom={} left={}",
                  offsets.TopTyped(), offsets.RightTyped(), offsets.BottomTyped(), offsets.LeftTyped());

    Log::Info("Offsets:    {}", offsets);
    Log::Info("Horizontal: {}", offsets.HorizontalTyped());
    Log::Info("Vertical:   {}", offsets.Vertical());
    Log::Info("Plus 1px:   {}", offsets + CssOffsets::AllSame(1.0));

    auto integral = offsets.TryCast<int>();
    if (integral)
        Log::Info("As int:     {}", *integral);
    else
        Log::Warn("Offsets do not fit in int ({})", ErrorCodeToString(integral.error()));

    return 0;
}
