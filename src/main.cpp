// SPDX-License-Identifier: MIT
// Program entry point: sprite sheet metadata inspector.
// Copyright (C) 2026 Artem Senichev <artemsen@gmail.com>

#include "buildconf.hpp"
#include "log.hpp"
#include "sheetjson.hpp"

#include <getopt.h>

#include <array>
#include <cstdio>
#include <cstdlib>
#include <format>
#include <fstream>
#include <iostream>
#include <string>
#include <tuple>
#include <vector>

/** Command line arguments. */
struct cmdarg {
    const char short_opt; ///< Short option character
    const char* long_opt; ///< Long option name
    const char* format;   ///< Format description
    const char* help;     ///< Help string
};
static constexpr std::array arguments = std::to_array<cmdarg>({
    { 'j', "json",     nullptr, "print re-encoded JSON instead of summary"   },
    { 'i', "indent",   "N",     "JSON indentation, -1 for single line"       },
    { 'c', "comments", nullptr, "allow comments in input"                    },
    { 's', "strict",   nullptr, "fail on unknown tag direction (default)"    },
    { 'l', "lenient",  nullptr, "use forward for unknown tag direction"      },
    { 'V', "verbose",  nullptr, "verbose output"                             },
    { 'v', "version",  nullptr, "print version info and exit"                },
    { 'h', "help",     nullptr, "print this help and exit"                   },
});

/**
 * Get short and long options in getopt format.
 * @return short and long options in getopt format.
 */
static std::tuple<std::string, std::vector<option>> get_opts()
{
    std::string short_opts;
    short_opts.reserve(arguments.size() * 2);
    std::vector<option> long_opts;
    long_opts.reserve(arguments.size() + 1);

    // fill options
    for (auto& it : arguments) {
        short_opts += it.short_opt;
        if (it.format) {
            short_opts += ':';
        }
        long_opts.push_back({
            it.long_opt,
            it.format ? required_argument : no_argument,
            nullptr,
            it.short_opt,
        });
    }
    long_opts.push_back({});

    return std::make_tuple(short_opts, long_opts);
}

/**
 * Print usage info.
 */
static void print_help()
{
    puts("Usage: asejson-info [OPTION]... FILE...");
    puts("Print description of Aseprite sprite sheet metadata (JSON export).");
    puts("If FILE is -, read standard input.\n");
    puts("Mandatory arguments to long options are mandatory for short options "
         "too.");

    for (auto& it : arguments) {
        std::string lopt;
        if (it.format) {
            lopt = std::format("{}={}", it.long_opt, it.format);
        } else {
            lopt = it.long_opt;
        }
        printf("  -%c, --%-16s %s\n", it.short_opt, lopt.c_str(), it.help);
    }
}

/**
 * Print version info.
 */
static void print_version()
{
    puts("asejson-info version " ASEJSON_VERSION ".");
}

/**
 * Print sprite sheet summary.
 * @param data sprite sheet description
 */
static void print_summary(const Aseprite::SpritesheetData& data)
{
    const Aseprite::Metadata& meta = data.meta;

    std::cout << std::format("{} {}x{}, {}, scale {} ({} {})\n", meta.image,
                             meta.size.w, meta.size.h, meta.format, meta.scale,
                             meta.app, meta.version);

    std::cout << std::format("Frames ({}, {}):\n",
                             data.is_hash() ? "hash" : "array",
                             data.frame_count());
    for (size_t i = 0; i < data.frame_count(); ++i) {
        const Aseprite::Frame* frame = data.frame_at(i);
        std::cout << std::format("  {:>3}: {} {},{} {}x{} {}ms{}{}\n", i,
                                 frame->filename, frame->frame.x,
                                 frame->frame.y, frame->frame.w,
                                 frame->frame.h, frame->duration,
                                 frame->rotated ? " rotated" : "",
                                 frame->trimmed ? " trimmed" : "");
    }

    if (meta.frame_tags) {
        std::cout << std::format("Tags ({}):\n", meta.frame_tags->size());
        for (const Aseprite::FrameTag& tag : *meta.frame_tags) {
            std::cout << std::format(
                "  {}: {}-{} {}{}\n", tag.name, tag.from, tag.to,
                Aseprite::direction_to_string(tag.direction),
                tag.valid() ? "" : " (invalid range)");
        }
    }

    if (meta.layers) {
        std::cout << std::format("Layers ({}):\n", meta.layers->size());
        for (const Aseprite::Layer& layer : *meta.layers) {
            if (layer.is_group()) {
                std::cout << std::format("  {} (group)\n", layer.name);
            } else {
                std::cout << std::format("  {}: {} opacity {}\n", layer.name,
                                         layer.blend_mode, layer.opacity);
            }
        }
    }

    if (meta.slices) {
        std::cout << std::format("Slices ({}):\n", meta.slices->size());
        for (const Aseprite::Slice& slice : *meta.slices) {
            std::cout << std::format("  {}: {} keys\n", slice.name,
                                     slice.keys.size());
        }
    }
}

/**
 * Load and print single file.
 * @param file path to the file, "-" for stdin
 * @param opts decoder options
 * @param json print JSON instead of summary
 * @return true if file was loaded
 */
static bool inspect(const std::string& file, const Aseprite::Options& opts,
                    const bool json)
{
    Aseprite::SpritesheetData data;

    try {
        if (file == "-") {
            data = Aseprite::parse(std::cin, opts);
        } else {
            std::ifstream stream(file, std::ios::in | std::ios::binary);
            if (!stream) {
                Log::error("Unable to open {}", file);
                return false;
            }
            data = Aseprite::parse(stream, opts);
        }
    } catch (const Aseprite::MalformedInput& e) {
        Log::error("Invalid sprite sheet {}: {}", file, e.what());
        return false;
    }

    if (json) {
        std::cout << Aseprite::serialize(data, opts) << '\n';
    } else {
        print_summary(data);
    }

    return true;
}

/**
 * Application entry point.
 */
int main(int argc, char* argv[])
{
    Aseprite::Options opts;
    opts.indent = 1;
    bool json = false;

    // parse options
    int opt;
    const auto [short_opts, long_opts] = get_opts();
    while ((opt = getopt_long(argc, argv, short_opts.c_str(), long_opts.data(),
                              nullptr)) != -1) {
        switch (opt) {
            case 'j':
                json = true;
                break;
            case 'i':
                try {
                    opts.indent = std::stoi(optarg);
                } catch (const std::exception&) {
                    Log::error("Invalid indentation: {}", optarg);
                    return EXIT_FAILURE;
                }
                break;
            case 'c':
                opts.allow_comments = true;
                break;
            case 's':
                opts.unknown_direction = Aseprite::DirectionPolicy::Error;
                break;
            case 'l':
                opts.unknown_direction = Aseprite::DirectionPolicy::Forward;
                break;
            case 'V':
                Log::level() = Log::Level::Debug;
                break;
            case 'v':
                print_version();
                return EXIT_SUCCESS;
            case 'h':
                print_help();
                return EXIT_SUCCESS;
            default:
                return EXIT_FAILURE;
        }
    }

    if (optind >= argc) {
        Log::error("No input files, see --help");
        return EXIT_FAILURE;
    }

    bool success = true;
    for (int i = optind; i < argc; ++i) {
        if (!inspect(argv[i], opts, json)) {
            success = false;
        }
    }

    return success ? EXIT_SUCCESS : EXIT_FAILURE;
}
