// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#include <dhash/core/assert.h>
#include <dhash/core/basic_formatter.hpp>
#include <dhash/core/byte_string.hpp>
#include <dhash/core/bytes.hpp>
#include <dhash/core/config.hpp>
#include <dhash/core/hex_literal.hpp>
#include <dhash/core/log_level_map.hpp>
#include <dhash/core/result.hpp>
#include <dhash/core/word.hpp>
#include <dhash/hash/digest.hpp>
#include <dhash/hash/double_hash.hpp>
#include <dhash/hash/fmt/digest_fmt.hpp>

#include <CLI/CLI.hpp>

#include <quill/LogLevel.h>
#include <quill/Quill.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

DHASH_ANONYMOUS_NAMESPACE_BEGIN

byte_string parse_hex(std::string const &s)
{
    auto bytes = try_from_hex(s);
    if (!bytes.has_value()) {
        throw std::invalid_argument("invalid hex '" + s + "'");
    }
    return std::move(bytes).value();
}

byte_string read_file(std::filesystem::path const &path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("unable to open " + path.string());
    }
    std::string const contents{
        std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
    return byte_string{to_byte_string_view(contents)};
}

std::vector<uint32_t> parse_words(std::vector<std::string> const &args)
{
    std::vector<uint32_t> words;
    words.reserve(args.size());
    for (auto const &arg : args) {
        auto const word = parse_word(arg);
        if (!word.has_value()) {
            throw std::invalid_argument("not a 32-bit word '" + arg + "'");
        }
        words.push_back(word.value());
    }
    return words;
}

Digest parse_digest(std::string const &s)
{
    auto const bytes = parse_hex(s);
    if (bytes.size() != sizeof(bytes32_t)) {
        throw std::invalid_argument(
            "digest must be 32 bytes, got " + std::to_string(bytes.size()));
    }
    bytes32_t b;
    std::copy(bytes.begin(), bytes.end(), b.bytes);
    return from_bytes(b);
}

Digest hash_aligned(byte_string_view const bytes)
{
    auto res = double_hash_word_bytes(bytes);
    if (res.has_error()) {
        throw std::invalid_argument(
            std::string{res.error().message().c_str()} + " (" +
            std::to_string(bytes.size()) + " bytes)");
    }
    return res.value();
}

DHASH_ANONYMOUS_NAMESPACE_END

int main(int const argc, char const *argv[])
{
    using namespace dhash;

    CLI::App cli{"dhash"};
    cli.option_defaults()->always_capture_default();

    std::string text{};
    std::string hex{};
    std::filesystem::path file{};
    std::vector<std::string> words{};
    std::vector<std::string> parent{};
    bool aligned = false;
    bool integer = false;
    auto log_level = quill::LogLevel::Warning;

    auto *const inputs = cli.add_option_group("input");
    auto *const has_text = inputs->add_option(
        "--text", text, "double hash the bytes of a string");
    auto *const has_hex =
        inputs->add_option("--hex", hex, "double hash hex encoded bytes");
    auto *const has_file =
        inputs
            ->add_option("--file", file, "double hash the contents of a file")
            ->check(CLI::ExistingFile);
    auto *const has_words = inputs->add_option(
        "--words", words, "double hash 32-bit words, decimal or 0x prefixed");
    auto *const has_parent =
        inputs
            ->add_option(
                "--parent", parent, "merkle parent of two 32 byte hex digests")
            ->expected(2);
    inputs->require_option(1);

    cli.add_flag(
        "--aligned",
        aligned,
        "read --hex or --file input as big endian words, failing on a "
        "partial trailing word")
        ->excludes(has_text)
        ->excludes(has_words)
        ->excludes(has_parent);
    cli.add_flag("--integer", integer, "also print the 256-bit integer");
    cli.add_option("--log_level", log_level, "level of logging")
        ->transform(CLI::CheckedTransformer(log_level_map, CLI::ignore_case));

    try {
        cli.parse(argc, argv);
    }
    catch (CLI::ParseError const &e) {
        return cli.exit(e);
    }

    // stdout carries only the digest
    auto stderr_handler = quill::stderr_handler();
    stderr_handler->set_pattern(
        "%(time) [%(thread_id)] %(file_name):%(line_number) LOG_%(log_level)\t"
        "%(message)",
        "%Y-%m-%d %H:%M:%S.%Qns",
        quill::Timezone::GmtTime);
    quill::Config cfg;
    cfg.default_handlers.emplace_back(stderr_handler);
    quill::configure(cfg);
    quill::start(true);
    quill::get_root_logger()->set_log_level(log_level);

    try {
        auto const start_time = std::chrono::steady_clock::now();

        Digest digest;
        if (*has_text) {
            LOG_DEBUG("hashing {} bytes of text", text.size());
            digest = double_hash(to_byte_string_view(text));
        }
        else if (*has_hex) {
            auto const bytes = parse_hex(hex);
            LOG_DEBUG("hashing {} hex decoded bytes", bytes.size());
            digest = aligned ? hash_aligned(bytes) : double_hash(bytes);
        }
        else if (*has_file) {
            auto const bytes = read_file(file);
            LOG_DEBUG("hashing {} bytes from {}", bytes.size(), file.string());
            digest = aligned ? hash_aligned(bytes) : double_hash(bytes);
        }
        else if (*has_words) {
            auto const parsed = parse_words(words);
            LOG_DEBUG("hashing {} words", parsed.size());
            digest = double_hash_words(parsed);
        }
        else {
            DHASH_ASSERT(parent.size() == 2);
            auto const left = parse_digest(parent[0]);
            auto const right = parse_digest(parent[1]);
            LOG_DEBUG("hashing merkle parent of {} and {}", left, right);
            digest = double_hash_parent(left, right);
        }

        auto const elapsed =
            std::chrono::duration_cast<std::chrono::microseconds>(
                std::chrono::steady_clock::now() - start_time);
        LOG_INFO(
            "digest = {}, time elapsed = {}us", digest, elapsed.count());

        std::cout << fmt::format("{}", digest) << std::endl;
        if (integer) {
            std::cout << fmt::format("{}", to_uint256(digest)) << std::endl;
        }
    }
    catch (std::exception const &e) {
        LOG_ERROR("{}", e.what());
        quill::flush();
        return EXIT_FAILURE;
    }

    quill::flush();
    return EXIT_SUCCESS;
}
