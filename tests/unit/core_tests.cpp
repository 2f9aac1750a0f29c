#include <algorithm>
#include <cassert>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <optional>
#include <random>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "binchain/chain.hpp"
#include "binchain/chain_reader.hpp"
#include "binchain/crypto.hpp"
#include "binchain/encoding/base64.hpp"
#include "binchain/errors.hpp"
#include "binchain/json.hpp"
#include "binchain/length_codec.hpp"
#include "binchain/streaming_parser.hpp"

using namespace binchain;
using namespace std::string_view_literals;

void run_cli_component_tests();

namespace
{

    constexpr std::uint64_t kMiB = 1024 * 1024;

    ReaderLimits generous_limits()
    {
        return ReaderLimits{
            .max_part_size = kMiB,
            .max_chain_size = kMiB,
            .max_chain_length = 10,
        };
    }

    std::span<const std::uint8_t> as_span(const Bytes &bytes)
    {
        return std::span<const std::uint8_t>(bytes.data(), bytes.size());
    }

    template <typename Exception, typename Fn>
    void expect_error(ErrorCode expected, Fn &&fn)
    {
        bool caught = false;
        try
        {
            fn();
        }
        catch (const Exception &ex)
        {
            caught = true;
            assert(ex.code() == expected);
        }
        assert(caught);
    }

    std::vector<Chain> sample_chains()
    {
        return {
            Chain{},
            make_chain("Hello", {to_bytes("World")}),
            make_chain("Empty Part", {Bytes{}}),
            make_chain("Empty Part with more", {Bytes{}, to_bytes("More Data")}),
        };
    }

    Bytes concatenate(const std::vector<Chain> &chains)
    {
        Bytes data;
        for (const auto &chain : chains)
        {
            const auto serialised = serialise(chain);
            data.insert(data.end(), serialised.begin(), serialised.end());
        }
        return data;
    }

    void test_error_code_labels()
    {
        assert(to_string(ErrorCode::Ok) == "ok");
        assert(to_string(ErrorCode::InvalidControlByte) == "invalid_control_byte");
        assert(to_string(ErrorCode::ChainTooLong) == "chain_too_long");

        const ParseError error(ErrorCode::PartTooLarge, "part length too long");
        const Error &base = error;
        assert(base.code() == ErrorCode::PartTooLarge);
        assert(std::string(base.what()) == "part length too long");
    }

    void test_length_widths()
    {
        assert(codec::encode_length(0) == Bytes{0x80});
        assert(codec::encode_length(1) == (Bytes{0x81, 0x01}));
        assert(codec::encode_length(5) == (Bytes{0x81, 0x05}));
        assert(codec::encode_length(255) == (Bytes{0x81, 0xFF}));
        assert(codec::encode_length(256) == (Bytes{0x82, 0x01, 0x00}));
        assert(codec::encode_length(65535) == (Bytes{0x82, 0xFF, 0xFF}));
        assert(codec::encode_length(65536) == (Bytes{0x83, 0x01, 0x00, 0x00}));

        std::uint64_t limit = 0;
        for (std::size_t width = 1; width <= codec::kMaxLengthWidth; ++width)
        {
            limit = (limit << 8) | 0xFF;
            assert(codec::length_width(limit) == width);
            const auto encoded = codec::encode_length(limit);
            assert(encoded.size() == width + 1);
            assert(encoded[0] == codec::kZeroLengthSop + width);
            assert(codec::decode_length(std::span<const std::uint8_t>(encoded).subspan(1)) == limit);
            if (width < codec::kMaxLengthWidth)
            {
                assert(codec::length_width(limit + 1) == width + 1);
            }
        }

        const auto largest = codec::encode_length(std::numeric_limits<std::uint64_t>::max());
        assert(largest == (Bytes{0x88, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF}));
    }

    void test_length_rejects_negative()
    {
        assert(codec::encode_length_checked(9) == (Bytes{0x81, 0x09}));
        expect_error<EncodingError>(ErrorCode::LengthOutOfRange, []
                                    { (void)codec::encode_length_checked(-1); });
    }

    void test_control_bytes()
    {
        assert(codec::classify_control_byte(0x80) == codec::ControlByte::StartOfPart);
        assert(codec::classify_control_byte(0x88) == codec::ControlByte::StartOfPart);
        assert(codec::classify_control_byte(0xFF) == codec::ControlByte::EndOfChain);
        for (unsigned byte = 0x89; byte < 0xFF; ++byte)
        {
            assert(codec::classify_control_byte(static_cast<std::uint8_t>(byte)) == codec::ControlByte::Invalid);
        }
        assert(codec::start_of_part_width(0x80) == 0u);
        assert(codec::start_of_part_width(0x83) == 3u);
        assert(!codec::start_of_part_width(0xFF).has_value());
        assert(!codec::is_control_byte(0x7F));
    }

    void test_serialise_samples()
    {
        const auto chains = sample_chains();
        assert(serialise(chains[0]) == Bytes{0xFF});
        assert(serialise(chains[1]) == to_bytes("Hello\x81\x05World\xFF"sv));
        assert(serialise(chains[2]) == to_bytes("Empty Part\x80\xFF"sv));
        assert(serialise(chains[3]) == to_bytes("Empty Part with more\x80\x81\x09More Data\xFF"sv));
        for (const auto &chain : chains)
        {
            assert(serialised_size(chain) == serialise(chain).size());
        }

        const auto wide = make_chain("", {Bytes(256, 0x2A)});
        const auto data = serialise(wide);
        assert(data.size() == 1 + 2 + 256 + 1);
        assert(data[0] == 0x82 && data[1] == 0x01 && data[2] == 0x00);
    }

    void test_non_ascii_prefix_rejected()
    {
        expect_error<EncodingError>(ErrorCode::NonAsciiPrefix, []
                                    { (void)make_chain("caf\xC3\xA9"); });

        Chain chain;
        chain.prefix = "bad\x80";
        expect_error<EncodingError>(ErrorCode::NonAsciiPrefix, [&]
                                    { (void)serialise(chain); });

        validate_prefix("plain ascii \x01\x7F");
    }

    void test_summarise()
    {
        assert(summarise(make_chain("Hello", {to_bytes("World")})) == "Chain<\"Hello\", [b\"World\"]>");
        assert(summarise(make_chain("", {Bytes{0x00, 0x41}})) == "Chain<\"\", [b\"\\x00A\"]>");

        std::vector<Bytes> parts(11, to_bytes("0123456789AB"));
        const auto summary = summarise(make_chain(std::string(150, 'p'), parts));
        assert(summary.find(std::string(100, 'p') + "...") != std::string::npos);
        assert(summary.find("b\"0123456789...\"") != std::string::npos);
        assert(summary.ends_with(", .....]>"));
    }

    void test_round_trip_single()
    {
        ChainReader reader(generous_limits());
        for (const auto &sample : sample_chains())
        {
            const auto chains = reader.read(serialise(sample));
            assert(chains.size() == 1);
            assert(chains.front() == sample);
            assert(reader.is_complete());
        }
    }

    void test_round_trip_any_chunk_size()
    {
        const auto chains = sample_chains();
        const auto data = concatenate(chains);

        ChainReader whole(generous_limits());
        assert(whole.read(data) == chains);

        std::vector<std::size_t> boundaries;
        std::size_t offset = 0;
        for (const auto &chain : chains)
        {
            offset += serialise(chain).size();
            boundaries.push_back(offset);
        }

        for (std::size_t chunk_size = 1; chunk_size <= data.size(); ++chunk_size)
        {
            ChainReader reader(generous_limits());
            std::vector<Chain> back;
            for (std::size_t pos = 0; pos < data.size(); pos += chunk_size)
            {
                const auto count = std::min(chunk_size, data.size() - pos);
                for (auto &chain : reader.read(as_span(data).subspan(pos, count)))
                {
                    back.push_back(std::move(chain));
                }
                const bool on_boundary =
                    std::find(boundaries.begin(), boundaries.end(), pos + count) != boundaries.end();
                assert(reader.is_complete() == on_boundary);
            }
            assert(back == chains);
        }
    }

    void test_round_trip_random_segmentation()
    {
        std::vector<Chain> chains = sample_chains();
        chains.push_back(make_chain("bulk", {Bytes(300, 0x01), Bytes(70000, 0xFE), Bytes{}}));
        chains.push_back(make_chain("", {Bytes{0xFF, 0x80, 0x88}}));
        const auto data = concatenate(chains);

        std::mt19937 rng(1234);
        for (int round = 0; round < 20; ++round)
        {
            std::uniform_int_distribution<std::size_t> piece(1, 1 + static_cast<std::size_t>(round) * 500);
            ChainReader reader(generous_limits());
            std::vector<Chain> back;
            std::size_t pos = 0;
            while (pos < data.size())
            {
                const auto count = std::min(piece(rng), data.size() - pos);
                for (auto &chain : reader.read(as_span(data).subspan(pos, count)))
                {
                    back.push_back(std::move(chain));
                }
                pos += count;
            }
            assert(back == chains);
            assert(reader.is_complete());
        }
    }

    void test_parts_around_width_boundaries()
    {
        const ReaderLimits limits{.max_part_size = 2 * kMiB, .max_chain_size = 2 * kMiB, .max_chain_length = 10};
        for (const std::uint64_t size : {255ULL, 65535ULL})
        {
            const auto width = codec::length_width(size);
            for (const auto length : {size - 1, size, size + 1})
            {
                const auto chain = make_chain(std::to_string(length), {Bytes(length, '=')});
                const auto data = serialise(chain);
                const auto sop = data[chain.prefix.size()];
                assert(sop - codec::kZeroLengthSop == (length > size ? width + 1 : width));

                ChainReader reader(limits);
                const auto back = reader.read(data);
                assert(back.size() == 1 && back.front() == chain);
            }
        }
    }

    void test_large_part_from_small_chunks()
    {
        Bytes payload(200000);
        for (std::size_t i = 0; i < payload.size(); ++i)
        {
            payload[i] = static_cast<std::uint8_t>(i * 7);
        }
        const auto chain = make_chain("big", {payload, to_bytes("tail")});
        const auto data = serialise(chain);

        ChainReader reader(generous_limits());
        std::vector<Chain> back;
        for (std::size_t pos = 0; pos < data.size(); pos += 7)
        {
            for (auto &item : reader.read(as_span(data).subspan(pos, std::min<std::size_t>(7, data.size() - pos))))
            {
                back.push_back(std::move(item));
            }
            assert(reader.parser().state().pending.size() <= payload.size() + 1);
        }
        assert(back.size() == 1 && back.front() == chain);
        assert(reader.is_complete());
    }

    void test_step_state_machine()
    {
        const auto limits = generous_limits();
        ParserState state;
        assert(is_complete(state));

        state.pending.append(as_span(to_bytes("Hel")));
        assert(!step(state, limits));
        assert(state.phase == ParserPhase::InPrefix);
        assert(state.prefix_scanned == 3);
        assert(!is_complete(state));

        state.pending.append(as_span(to_bytes("lo\x81"sv)));
        auto fragment = step(state, limits);
        assert(fragment && *fragment == Fragment{PrefixFragment{"Hello"}});
        assert(state.phase == ParserPhase::InPartLength);
        assert(state.length_width == 1);
        assert(state.chain_length == 0);
        assert(state.chain_size == 5);
        assert(to_string(state.phase) == "IN_PART_LENGTH");

        state.pending.append(as_span(to_bytes("\x05Wor"sv)));
        assert(!step(state, limits));
        assert(state.phase == ParserPhase::InBinaryPart);
        assert(state.part_length == 5);
        assert(state.pending.size() == 3);

        state.pending.append(as_span(to_bytes("ld\xFF"sv)));
        fragment = step(state, limits);
        assert(fragment && *fragment == Fragment{PartFragment{to_bytes("World")}});
        assert(state.end_of_chain_pending);
        assert(state.chain_length == 1);
        assert(state.chain_size == 10);
        assert(!is_complete(state));

        fragment = step(state, limits);
        assert(fragment && std::holds_alternative<EndOfChain>(*fragment));
        assert(state.chain_length == -1);
        assert(state.chain_size == 0);
        assert(is_complete(state));
        assert(!step(state, limits));
    }

    void test_fragment_stream()
    {
        StreamingParser parser(generous_limits());
        const auto fragments = parser.parse(to_bytes("Empty Part with more\x80\x81\x09More Data\xFF\xFF"sv));
        const std::vector<Fragment> expected{
            PrefixFragment{"Empty Part with more"},
            PartFragment{Bytes{}},
            PartFragment{to_bytes("More Data")},
            EndOfChain{},
            PrefixFragment{""},
            EndOfChain{},
        };
        assert(fragments == expected);
        assert(parser.is_complete());

        // Fragments not pulled yet stay available after the next feed.
        parser.feed(to_bytes("A\x80"sv));
        parser.feed(to_bytes("\xFF"sv));
        assert(parser.next() == Fragment{PrefixFragment{"A"}});
        assert(parser.next() == Fragment{PartFragment{Bytes{}}});
        assert(!parser.is_complete());
        assert(parser.next() == Fragment{EndOfChain{}});
        assert(!parser.next());
        assert(parser.is_complete());
    }

    void test_empty_chain()
    {
        ChainReader reader(generous_limits());
        const auto chains = reader.read(Bytes{0xFF});
        assert(chains.size() == 1);
        assert(chains.front().prefix.empty());
        assert(chains.front().parts.empty());
        assert(serialise(chains.front()) == Bytes{0xFF});
    }

    void test_usage_errors()
    {
        expect_error<ArgumentError>(ErrorCode::InvalidLimits, []
                                    { StreamingParser parser(ReaderLimits{}); });

        StreamingParser parser(generous_limits());
        expect_error<ArgumentError>(ErrorCode::EmptyInput, [&]
                                    { parser.feed(std::span<const std::uint8_t>{}); });
        assert(parser.is_complete());

        ChainReader reader(generous_limits());
        expect_error<ArgumentError>(ErrorCode::EmptyInput, [&]
                                    { (void)reader.read(Bytes{}); });
    }

    void test_invalid_control_bytes()
    {
        StreamingParser parser(generous_limits());
        expect_error<ParseError>(ErrorCode::InvalidControlByte, [&]
                                 { (void)parser.parse(to_bytes("abc\x89"sv)); });
        assert(!parser.is_complete());
        expect_error<ParseError>(ErrorCode::ParserFailed, [&]
                                 { parser.feed(Bytes{0xFF}); });

        ChainReader reader(generous_limits());
        expect_error<ParseError>(ErrorCode::InvalidControlByte, [&]
                                 { (void)reader.read(to_bytes("p\x81\x01X\xFE"sv)); });

        ChainReader after_empty_part(generous_limits());
        expect_error<ParseError>(ErrorCode::InvalidControlByte, [&]
                                 { (void)after_empty_part.read(to_bytes("\x80\x90"sv)); });
    }

    void test_part_size_limit()
    {
        const ReaderLimits limits{.max_part_size = 4};

        // Rejected from the length field alone, before any payload arrives.
        StreamingParser declared(limits);
        assert(declared.parse(to_bytes("x"sv)).empty());
        expect_error<ParseError>(ErrorCode::PartTooLarge, [&]
                                 { (void)declared.parse(to_bytes("\x81\x05"sv)); });

        StreamingParser huge(limits);
        expect_error<ParseError>(ErrorCode::PartTooLarge, [&]
                                 { (void)huge.parse(Bytes{0x88, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF}); });

        ChainReader reader(limits);
        const auto chains = reader.read(serialise(make_chain("", {to_bytes("four")})));
        assert(chains.size() == 1);

        // A part at the limit never buffers more than max_part_size bytes.
        const auto data = serialise(make_chain("p", {to_bytes("four"), to_bytes("abcd")}));
        ChainReader trickle(limits);
        std::vector<Chain> back;
        for (const auto byte : data)
        {
            for (auto &chain : trickle.read(Bytes{byte}))
            {
                back.push_back(std::move(chain));
            }
            assert(trickle.parser().state().pending.size() <= limits.max_part_size);
        }
        assert(back.size() == 1);
        assert(back.front().parts.size() == 2);
    }

    void test_prefix_size_limit()
    {
        const ReaderLimits limits{.max_part_size = 16, .max_prefix_size = 5};

        ChainReader exact(limits);
        const auto chains = exact.read(to_bytes("Hello\xFF"sv));
        assert(chains.size() == 1 && chains.front().prefix == "Hello");

        StreamingParser parser(limits);
        for (const char ch : std::string_view("Hello"))
        {
            assert(parser.parse(Bytes{static_cast<std::uint8_t>(ch)}).empty());
        }
        expect_error<ParseError>(ErrorCode::PrefixTooLarge, [&]
                                 { (void)parser.parse(to_bytes("!")); });
    }

    void test_chain_size_limit()
    {
        const ReaderLimits limits{.max_part_size = 64, .max_chain_size = 8};

        ChainReader fits(limits);
        assert(fits.read(serialise(make_chain("abc", {to_bytes("12345")}))).size() == 1);
        // The running total restarts with every chain.
        assert(fits.read(serialise(make_chain("abc", {to_bytes("12345")}))).size() == 1);

        StreamingParser parser(limits);
        parser.feed(serialise(make_chain("abc", {to_bytes("123456")})));
        assert(parser.next() == Fragment{PrefixFragment{"abc"}});
        expect_error<ParseError>(ErrorCode::ChainTooLarge, [&]
                                 { (void)parser.next(); });
    }

    void test_chain_length_limit()
    {
        const ReaderLimits limits{.max_part_size = 64, .max_chain_length = 2};

        ChainReader fits(limits);
        const auto two_parts = make_chain("p", {to_bytes("a"), to_bytes("b")});
        assert(fits.read(concatenate({two_parts, two_parts})).size() == 2);

        StreamingParser parser(limits);
        parser.feed(serialise(make_chain("p", {to_bytes("a"), to_bytes("b"), to_bytes("c")})));
        assert(parser.next() == Fragment{PrefixFragment{"p"}});
        assert(parser.next() == Fragment{PartFragment{to_bytes("a")}});
        assert(parser.next() == Fragment{PartFragment{to_bytes("b")}});
        expect_error<ParseError>(ErrorCode::ChainTooLong, [&]
                                 { (void)parser.next(); });
    }

    void test_assembler_progress()
    {
        ChainReader reader(generous_limits());
        assert(reader.read(to_bytes("Hello\x80\x81"sv)).empty());
        assert(reader.in_progress().prefix == "Hello");
        assert(reader.in_progress().parts.size() == 1);
        assert(!reader.is_complete());

        const auto chains = reader.read(to_bytes("\x02hi\xFF"sv));
        assert(chains.size() == 1);
        assert(chains.front() == make_chain("Hello", {Bytes{}, to_bytes("hi")}));
        assert(reader.in_progress() == Chain{});
    }

    void test_base64()
    {
        assert(encoding::encode_base64(to_bytes("Hello")) == "SGVsbG8=");
        assert(encoding::encode_base64(Bytes{}).empty());
        assert(encoding::decode_base64("SGVsbG8=") == to_bytes("Hello"));
        assert(encoding::decode_base64("SGVs\nbG8=") == to_bytes("Hello"));
        assert(!encoding::decode_base64("SGV@").has_value());

        const Bytes binary{0x00, 0xFF, 0x80, 0x7F};
        assert(encoding::decode_base64(encoding::encode_base64(binary)) == binary);
    }

    void test_crypto()
    {
        assert(crypto::hash_bytes(Bytes{}) == "0e5751c026e543b2e8ab2eb06099daa1d1e5df47778f7787faab45cdf12fe3a8");

        const Bytes chunk{0xDE, 0xAD, 0xBE, 0xEF};
        const auto chunk_hash = crypto::hash_bytes(chunk);
        assert(chunk_hash.size() == 64);
        assert(chunk_hash == crypto::hash_bytes(Bytes{0xDE, 0xAD, 0xBE, 0xEF}));
        assert(chunk_hash != crypto::hash_bytes(Bytes{0xDE, 0xAD, 0xBE, 0xEE}));
    }

    void test_chain_json()
    {
        const auto chain = make_chain("Hello", {to_bytes("World"), Bytes{}});
        const nlohmann::json json = chain;
        assert(json.at("prefix") == "Hello");
        assert(json.at("parts").size() == 2);
        assert(json.at("parts")[0] == "V29ybGQ=");
        assert(json.get<Chain>() == chain);

        const auto described = describe_chain(chain);
        assert(described.at("serialised_size") == serialise(chain).size());
        assert(described.at("parts")[0].at("size") == 5);
        assert(described.at("parts")[0].at("digest") == crypto::hash_bytes(to_bytes("World")));
        assert(described.get<Chain>() == chain);

        const auto bad = nlohmann::json{{"prefix", "x"}, {"parts", {"not base64!"}}};
        expect_error<ArgumentError>(ErrorCode::InvalidDocument, [&]
                                    { (void)bad.get<Chain>(); });
        const auto non_ascii = nlohmann::json{{"prefix", "caf\xC3\xA9"}};
        expect_error<EncodingError>(ErrorCode::NonAsciiPrefix, [&]
                                    { (void)non_ascii.get<Chain>(); });
    }

    void test_limits_json()
    {
        const ReaderLimits limits{.max_part_size = 100, .max_chain_length = 3};
        const nlohmann::json json = limits;
        assert(json.at("max_part_size") == 100);
        assert(json.at("max_chain_size").is_null());
        assert(json.at("max_chain_length") == 3);
        assert(json.get<ReaderLimits>() == limits);

        ReaderLimits merged{.max_part_size = 7, .max_chain_size = 70, .max_prefix_size = 5};
        from_json(nlohmann::json{{"max_chain_size", nullptr}, {"max_chain_length", 9}}, merged);
        assert(merged.max_part_size == 7);
        assert(!merged.max_chain_size);
        assert(merged.max_chain_length == 9u);
        assert(merged.max_prefix_size == 5u);

        const auto path = std::filesystem::temp_directory_path() / "binchain_limits_test.json";
        {
            std::ofstream file(path);
            file << R"({"max_part_size": 2048, "max_prefix_size": 64})";
        }
        const auto loaded = load_limits(path, ReaderLimits{.max_part_size = 1, .max_chain_length = 4});
        assert(loaded.max_part_size == 2048);
        assert(loaded.max_prefix_size == 64u);
        assert(loaded.max_chain_length == 4u);

        {
            std::ofstream file(path);
            file << R"({"max_part_size": 0})";
        }
        expect_error<ArgumentError>(ErrorCode::InvalidLimits, [&]
                                    { (void)load_limits(path); });
        {
            std::ofstream file(path);
            file << "{ not json";
        }
        expect_error<ArgumentError>(ErrorCode::InvalidDocument, [&]
                                    { (void)load_limits(path); });

        // Negative values must not wrap around to huge limits.
        {
            std::ofstream file(path);
            file << R"({"max_part_size": -5})";
        }
        expect_error<ArgumentError>(ErrorCode::InvalidLimits, [&]
                                    { (void)load_limits(path); });
        {
            std::ofstream file(path);
            file << R"({"max_part_size": 16, "max_chain_length": -1})";
        }
        expect_error<ArgumentError>(ErrorCode::InvalidLimits, [&]
                                    { (void)load_limits(path); });
        std::filesystem::remove(path);

        ReaderLimits target{.max_part_size = 8};
        expect_error<ArgumentError>(ErrorCode::InvalidLimits, [&]
                                    { from_json(nlohmann::json{{"max_prefix_size", -3}}, target); });
        expect_error<ArgumentError>(ErrorCode::InvalidLimits, [&]
                                    { from_json(nlohmann::json{{"max_chain_size", "100"}}, target); });
        expect_error<ArgumentError>(ErrorCode::InvalidLimits, [&]
                                    { from_json(nlohmann::json{{"max_part_size", 1.5}}, target); });
        assert(target == ReaderLimits{.max_part_size = 8});
    }

} // namespace

int main()
{
    try
    {
        test_error_code_labels();
        test_length_widths();
        test_length_rejects_negative();
        test_control_bytes();
        test_serialise_samples();
        test_non_ascii_prefix_rejected();
        test_summarise();
        test_round_trip_single();
        test_round_trip_any_chunk_size();
        test_round_trip_random_segmentation();
        test_parts_around_width_boundaries();
        test_large_part_from_small_chunks();
        test_step_state_machine();
        test_fragment_stream();
        test_empty_chain();
        test_usage_errors();
        test_invalid_control_bytes();
        test_part_size_limit();
        test_prefix_size_limit();
        test_chain_size_limit();
        test_chain_length_limit();
        test_assembler_progress();
        test_base64();
        test_crypto();
        test_chain_json();
        test_limits_json();
        run_cli_component_tests();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Test failure: " << ex.what() << '\n';
        return 1;
    }
    return 0;
}
