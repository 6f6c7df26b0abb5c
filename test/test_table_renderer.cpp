#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest.h"

#include <string>

#include <byte_label.hpp>
#include <table_renderer.hpp>

static ByteHistogram histogram_of(std::string const& s) {
    ByteHistogram hist;
    for(char const c : s) hist.increment((unsigned char)c);
    return hist;
}

TEST_SUITE("table_renderer") {
    TEST_CASE("empty") {
        ByteHistogram const hist;
        REQUIRE(render(hist).empty());

        auto const text = render_text(hist);
        REQUIRE(text.size() == 1);
        REQUIRE(text[0].empty());
    }

    TEST_CASE("small") {
        auto const hist = histogram_of(std::string("\x00\x41\x41\x0A", 4));
        auto const lines = render(hist);
        REQUIRE(lines.size() == 3);

        REQUIRE(lines[0].hex == "00");
        REQUIRE(lines[0].count == 1);
        REQUIRE(lines[0].label == "<NULL>");

        REQUIRE(lines[1].hex == "0a");
        REQUIRE(lines[1].count == 1);
        REQUIRE(lines[1].label == "\\n");

        REQUIRE(lines[2].hex == "41");
        REQUIRE(lines[2].count == 2);
        REQUIRE(lines[2].label == "A");

        auto const text = render_text(hist);
        REQUIRE(text.size() == 4);
        REQUIRE(text[0] == "");
        REQUIRE(text[1] == "  00 : 1: <NULL>");
        REQUIRE(text[2] == "  0a : 1: \\n");
        REQUIRE(text[3] == "  41 : 2: A");
    }

    TEST_CASE("single byte value") {
        auto const lines = render(histogram_of(std::string(300'000, 'a')));
        REQUIRE(lines.size() == 1);
        REQUIRE(lines[0].str() == "  61 : 300000: a");
    }

    TEST_CASE("ascending order") {
        ByteHistogram hist;
        for(size_t c = 256; c > 0; c--) {
            for(size_t i = 0; i < c - 1; i++) hist.increment((unsigned char)(c - 1));
        }

        auto const lines = render(hist);
        REQUIRE(lines.size() == 255); // byte 0 was never counted
        for(size_t i = 0; i < lines.size(); i++) {
            REQUIRE(lines[i].hex == byte_hex(uint8_t(i + 1)));
            REQUIRE(lines[i].count == i + 1);
        }
        REQUIRE(lines.back().hex == "ff");
    }

    TEST_CASE("pure") {
        auto const hist = histogram_of("the quick brown fox jumps over the lazy dog\r\n");
        auto const copy = hist;

        auto const a = render_text(hist);
        auto const b = render_text(hist);
        REQUIRE(a == b);
        REQUIRE(hist == copy);
    }

    TEST_CASE("labels") {
        REQUIRE(byte_label(0x00) == "<NULL>");
        REQUIRE(byte_label(0x07) == "<BEL>");
        REQUIRE(byte_label(0x09) == "<TAB>");
        REQUIRE(byte_label(0x0D) == "\\r");
        REQUIRE(byte_label(0x18) == "<CAN>");
        REQUIRE(byte_label(0x19) == "<EM>");
        REQUIRE(byte_label(0x1A) == "<SUB>");
        REQUIRE(byte_label(0x1F) == "<US>");
        REQUIRE(byte_label(0x20) == "<space>");
        REQUIRE(byte_label(0x7F) == "<DEL>");
        REQUIRE(byte_label(0xA0) == "<non break space>");
        REQUIRE(byte_label(0xAD) == "<soft hyphen>");
    }

    TEST_CASE("label fallback") {
        REQUIRE(byte_label('!') == "!");
        REQUIRE(byte_label('~') == "~");
        REQUIRE(byte_label('A') == "A");
        REQUIRE(byte_label(0x80) == "<0x80>");
        REQUIRE(byte_label(0xE9) == "<0xE9>");
        REQUIRE(byte_label(0xFF) == "<0xFF>");
    }

    TEST_CASE("labeled bytes never render literally") {
        for(size_t c = 0; c < 256; c++) {
            auto const label = byte_label(uint8_t(c));
            REQUIRE(!label.empty());
            if(has_symbolic_label(uint8_t(c))) {
                REQUIRE(label != std::string(1, (char)c));
            } else if(c >= 0x21 && c < 0x7F) {
                REQUIRE(label == std::string(1, (char)c));
            }

            for(char const x : label) {
                REQUIRE((unsigned char)x >= 0x20);
                REQUIRE((unsigned char)x < 0x7F);
            }
        }
    }
}
