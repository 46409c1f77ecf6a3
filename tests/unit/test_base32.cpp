#include <catch2/catch_test_macros.hpp>
#include "core/base32.hpp"
#include "core/binary_codec.hpp"

using namespace sortid;

namespace {

std::string encode_time_block(const TimeBytes& in) {
    std::string out(TIME_TEXT_SIZE, '?');
    base32::encode_time(in, std::span<char, TIME_TEXT_SIZE>(out.data(), TIME_TEXT_SIZE));
    return out;
}

std::string encode_random_block(const RandomBytes& in) {
    std::string out(RANDOM_TEXT_SIZE, '?');
    base32::encode_random(in, std::span<char, RANDOM_TEXT_SIZE>(out.data(), RANDOM_TEXT_SIZE));
    return out;
}

} // namespace

TEST_CASE("Alphabet excludes ambiguous letters", "[base32]") {
    REQUIRE(base32::ALPHABET.size() == 32);
    for (char c : {'I', 'L', 'O', 'U'}) {
        REQUIRE(base32::ALPHABET.find(c) == std::string_view::npos);
    }
}

TEST_CASE("symbol_value maps symbols case-insensitively", "[base32]") {
    for (size_t i = 0; i < base32::ALPHABET.size(); ++i) {
        REQUIRE(base32::symbol_value(base32::ALPHABET[i]) == static_cast<int>(i));
    }
    REQUIRE(base32::symbol_value('a') == 10);
    REQUIRE(base32::symbol_value('z') == 31);
    REQUIRE(base32::symbol_value('i') == -1);
    REQUIRE(base32::symbol_value('L') == -1);
    REQUIRE(base32::symbol_value('o') == -1);
    REQUIRE(base32::symbol_value('U') == -1);
    REQUIRE(base32::symbol_value('!') == -1);
    REQUIRE(base32::symbol_value('\0') == -1);
    REQUIRE(base32::symbol_value(static_cast<char>(0xC9)) == -1);
}

TEST_CASE("Time block reference vector", "[base32]") {
    auto bytes = binary::encode_time(Timestamp(1469922850259));
    REQUIRE(encode_time_block(bytes) == "01ARZ3NDEK");

    auto decoded = base32::decode_time("01ARZ3NDEK");
    REQUIRE(decoded.is_ok());
    REQUIRE(decoded.unwrap() == bytes);
}

TEST_CASE("Random block reference vectors", "[base32]") {
    RandomBytes a{0x04, 0x15, 0x56, 0x9D, 0x5C, 0x2F, 0xA3, 0x10, 0xCF, 0x61};
    REQUIRE(encode_random_block(a) == "0GAND7AW5YHH1KV1");

    RandomBytes b{0xD6, 0x76, 0x4C, 0x61, 0xEF, 0xB9, 0x93, 0x02, 0xBD, 0x5B};
    REQUIRE(encode_random_block(b) == "TSV4RRFFQ69G5FAV");

    REQUIRE(base32::decode_random("TSV4RRFFQ69G5FAV").unwrap() == b);
    REQUIRE(base32::decode_random("0gand7aw5yhh1kv1").unwrap() == a);
}

TEST_CASE("Boundary blocks", "[base32]") {
    REQUIRE(encode_time_block(TimeBytes{}) == "0000000000");
    REQUIRE(encode_time_block(TimeBytes{0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF}) == "7ZZZZZZZZZ");
    REQUIRE(encode_time_block(TimeBytes{0, 0, 0, 0, 0, 1}) == "0000000001");

    RandomBytes ones{};
    ones.fill(0xFF);
    REQUIRE(encode_random_block(RandomBytes{}) == "0000000000000000");
    REQUIRE(encode_random_block(ones) == "ZZZZZZZZZZZZZZZZ");
}

TEST_CASE("Every bit position survives a block round trip", "[base32]") {
    for (size_t bit = 0; bit < TIME_SIZE * 8; ++bit) {
        TimeBytes in{};
        in[bit / 8] = static_cast<uint8_t>(0x80 >> (bit % 8));
        REQUIRE(base32::decode_time(encode_time_block(in)).unwrap() == in);
    }
    for (size_t bit = 0; bit < RANDOM_SIZE * 8; ++bit) {
        RandomBytes in{};
        in[bit / 8] = static_cast<uint8_t>(0x80 >> (bit % 8));
        REQUIRE(base32::decode_random(encode_random_block(in)).unwrap() == in);
    }
}

TEST_CASE("Decoding rejects bad input", "[base32]") {
    SECTION("wrong length") {
        REQUIRE(base32::decode_time("012345678").unwrap_err().code == ErrorCode::InvalidLength);
        REQUIRE(base32::decode_random("0123456789").unwrap_err().code == ErrorCode::InvalidLength);
        REQUIRE(base32::decode("0123").unwrap_err().code == ErrorCode::InvalidLength);
        REQUIRE(base32::decode("").unwrap_err().code == ErrorCode::InvalidLength);
    }

    SECTION("symbol outside the alphabet") {
        auto r = base32::decode_time("01ARZ3NDE!");
        REQUIRE(r.unwrap_err().code == ErrorCode::InvalidCharacter);
        REQUIRE(r.unwrap_err().message.find("position 9") != std::string::npos);

        REQUIRE(base32::decode_random("0GAND7AW5YHH1KVU").unwrap_err().code ==
                ErrorCode::InvalidCharacter);
        REQUIRE(base32::decode_random("0GAND7AW5YHH1KVi").unwrap_err().code ==
                ErrorCode::InvalidCharacter);
    }

    SECTION("time block beyond 48 bits") {
        REQUIRE(base32::decode_time("7ZZZZZZZZZ").is_ok());
        REQUIRE(base32::decode_time("8000000000").unwrap_err().code == ErrorCode::InvalidCharacter);
        REQUIRE(base32::decode_time("Z000000000").unwrap_err().code == ErrorCode::InvalidCharacter);
    }
}

TEST_CASE("Generic encode/decode accept only the two block sizes", "[base32]") {
    const std::vector<uint8_t> six{1, 2, 3, 4, 5, 6};
    const std::vector<uint8_t> ten{1, 2, 3, 4, 5, 6, 7, 8, 9, 10};

    auto t = base32::encode(six);
    REQUIRE(t.unwrap().size() == TIME_TEXT_SIZE);
    REQUIRE(base32::decode(t.unwrap()).unwrap() == six);

    auto r = base32::encode(ten);
    REQUIRE(r.unwrap().size() == RANDOM_TEXT_SIZE);
    REQUIRE(base32::decode(r.unwrap()).unwrap() == ten);

    REQUIRE(base32::encode(std::vector<uint8_t>(5)).unwrap_err().code == ErrorCode::InvalidLength);
    REQUIRE(base32::encode(std::vector<uint8_t>(16)).unwrap_err().code == ErrorCode::InvalidLength);
    REQUIRE(base32::encode(std::vector<uint8_t>{}).unwrap_err().code == ErrorCode::InvalidLength);
}
