#include <charconv>
#include <cstdint>
#include <iostream>
#include <string_view>
#include <system_error>

#include "tilejump/level/LevelGenerator.hpp"
#include "tilejump/level/LevelPrinter.hpp"

int main(int argc, char** argv)
{
    using namespace tilejump::level;

    if (argc < 2)
    {
        std::cout << "Usage: tilejump_print <level_number> [--color] [--path]\n";
        return 2;
    }

    const std::string_view levelArg = argv[1];
    std::uint32_t levelNum = 0;
    const char* end = levelArg.data() + levelArg.size();
    const auto [ptr, ec] = std::from_chars(levelArg.data(), end, levelNum);
    if (ec != std::errc{} || ptr != end || levelArg.empty())
    {
        std::cout << "Invalid level number: " << levelArg << "\n";
        return 2;
    }

    PrintOptions options;
    for (int i = 2; i < argc; ++i)
    {
        const std::string_view flag = argv[i];
        if (flag == "--color")
        {
            options.ansiColor = true;
        }
        else if (flag == "--path")
        {
            options.showPath = true;
        }
        else
        {
            std::cout << "Unknown argument: " << flag << "\n";
            return 2;
        }
    }

    std::cout << RenderLevelText(GenerateLevel(levelNum), options);
    return 0;
}
