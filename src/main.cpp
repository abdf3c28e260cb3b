#include <charconv>
#include <cstdio>
#include <filesystem>
#include <optional>
#include <print>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "AttributeConfig.h"
#include "BlobHeap.h"
#include "CustomAttributeParser.h"
#include "EnumClassifier.h"
#include "MappedFile.h"
#include "TypeRegistry.h"

namespace {

    constexpr auto kUsage =
        "usage: cilattr-dump [--config=FILE] [--heap] [--index=N] [--list] [--strict-utf8] FILE [PARAM...]\n"
        "\n"
        "Decodes a custom attribute value blob. Each PARAM names the type of one\n"
        "constructor parameter, e.g. i4, string, type, object, i4[], enum Contoso.Shade.\n"
        "\n"
        "  --config=FILE   load enum table and type declarations from an INI file\n"
        "  --heap          FILE is a #Blob heap instead of a single blob\n"
        "  --index=N       heap offset of the blob to decode (default 1)\n"
        "  --list          print every heap entry instead of decoding\n"
        "  --strict-utf8   reject malformed UTF-8 in strings";

    struct CommandLineOptions {
        std::string inputPath;
        std::vector<std::string> params;
        std::optional<std::string> configPath;
        uint32_t index = 1;
        bool heap = false;
        bool list = false;
        bool strictUtf8 = false;
        bool showHelp = false;
    };

    std::optional<CommandLineOptions> ParseCommandLine(int argc, char** argv) {
        CommandLineOptions options;

        for (int i = 1; i < argc; ++i) {
            std::string_view argument{argv[i]};

            if (argument == "--help" || argument == "-h") {
                options.showHelp = true;
                return options;
            }
            if (argument.starts_with("--config=")) {
                options.configPath = std::string(argument.substr(9));
                continue;
            }
            if (argument == "--heap") {
                options.heap = true;
                continue;
            }
            if (argument.starts_with("--index=")) {
                const auto text = argument.substr(8);
                const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), options.index);
                if (ec != std::errc() || ptr != text.data() + text.size()) {
                    std::println(stderr, "Invalid index '{}'", text);
                    return std::nullopt;
                }
                options.heap = true;
                continue;
            }
            if (argument == "--list") {
                options.list = true;
                options.heap = true;
                continue;
            }
            if (argument == "--strict-utf8") {
                options.strictUtf8 = true;
                continue;
            }
            if (argument.starts_with("--")) {
                std::println(stderr, "Unknown option '{}'", argument);
                return std::nullopt;
            }

            if (options.inputPath.empty()) {
                options.inputPath = std::string(argument);
            } else {
                options.params.emplace_back(argument);
            }
        }

        if (options.inputPath.empty()) {
            std::println(stderr, "No input file given");
            return std::nullopt;
        }
        return options;
    }

    void PrintError(std::string_view context, const ParseError& error) {
        std::println(stderr, "{}: [{}] {}", context, ToString(error.kind), error.message);
    }

    void PrintEntries(const Cil::BlobHeap& heap) {
        const auto entries = heap.Entries();
        for (const auto& entry : entries) {
            std::string preview;
            for (size_t i = 0; i < entry.data.size() && i < 16; ++i) {
                preview += std::format("{:02X} ", entry.data[i]);
            }
            if (entry.data.size() > 16) {
                preview += "...";
            }
            std::println("0x{:08X} {:>6} bytes  {}", entry.index, entry.data.size(), preview);
        }
        std::println("{} entries", entries.size());
    }

} // namespace

auto main(int argc, char** argv) -> int {
    const auto options = ParseCommandLine(argc, argv);
    if (!options) {
        std::println(stderr, "{}", kUsage);
        return 1;
    }
    if (options->showHelp) {
        std::println("{}", kUsage);
        return 0;
    }

    Cil::TypeRegistry registry;
    CustomAttribute::EnumClassifier classifier;
    bool strictUtf8 = options->strictUtf8;

    if (options->configPath) {
        auto settings = Config::Load(*options->configPath);
        if (!settings) {
            PrintError(*options->configPath, settings.error());
            return 1;
        }
        settings->ApplyTo(classifier);
        if (auto applied = settings->ApplyTo(registry); !applied) {
            PrintError(*options->configPath, applied.error());
            return 1;
        }
        strictUtf8 = strictUtf8 || settings->strictUtf8;
    }

    std::vector<Cil::ParamInfo> params;
    params.reserve(options->params.size());
    for (size_t i = 0; i < options->params.size(); ++i) {
        auto type = registry.Resolve(options->params[i]);
        if (!type) {
            PrintError(std::format("parameter {}", i + 1), type.error());
            return 1;
        }
        params.push_back(Cil::ParamInfo{static_cast<uint32_t>(i + 1), *type});
    }

    io::MappedFile file;
    if (auto opened = file.Open(options->inputPath); !opened) {
        PrintError(options->inputPath, opened.error());
        return 1;
    }

    const CustomAttribute::ParserOptions parserOptions{strictUtf8, &classifier};

    ParseExpected<CustomAttribute::Value> value;
    if (options->heap) {
        auto heap = Cil::BlobHeap::FromBytes(file.View());
        if (!heap) {
            PrintError(options->inputPath, heap.error());
            return 1;
        }
        if (options->list) {
            PrintEntries(*heap);
            return 0;
        }
        value = CustomAttribute::ParseBlob(*heap, options->index, params, registry, parserOptions);
    } else {
        value = CustomAttribute::ParseData(file.View(), params, registry, parserOptions);
    }

    if (!value) {
        PrintError(options->inputPath, value.error());
        return 1;
    }
    std::print("{}", value->ToString());
    return 0;
}
