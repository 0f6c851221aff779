#include <doctest/doctest.h>
#include <pngsynth/fourcc.hh>
#include <pngsynth/chunk_types.hh>

#include <sstream>
#include <unordered_map>
#include <set>
#include <cstring>

using namespace pngsynth;

TEST_SUITE("FOURCC") {
    TEST_CASE("fourcc construction") {
        SUBCASE("default construction") {
            fourcc f;
            CHECK(f.to_string() == "    ");
            CHECK(f[0] == ' ');
            CHECK(f[3] == ' ');
        }

        SUBCASE("from characters") {
            constexpr fourcc f('I', 'H', 'D', 'R');
            CHECK(f.to_string() == "IHDR");
            CHECK(f == chunk_id::IHDR);
        }

        SUBCASE("from strings, padded with spaces") {
            CHECK(fourcc("IDAT").to_string() == "IDAT");
            CHECK(fourcc(std::string("tE")).to_string() == "tE  ");
            CHECK(fourcc(std::string_view("IENDxx")).to_string() == "IEND");
        }

        SUBCASE("from raw bytes") {
            const unsigned char raw[] = {'I', 'E', 'N', 'D', 0xFF};
            auto f = fourcc::from_bytes(raw);
            CHECK(f == chunk_id::IEND);

            char out[4];
            f.to_bytes(out);
            CHECK(std::memcmp(out, "IEND", 4) == 0);
            CHECK(std::memcmp(f.data(), "IEND", 4) == 0);
        }

        SUBCASE("literal") {
            constexpr auto f = "sRGB"_4cc;
            CHECK(f.to_string_view() == "sRGB");
            CHECK("ab"_4cc.to_string() == "ab  ");
        }
    }

    TEST_CASE("fourcc comparison and hashing") {
        CHECK("IDAT"_4cc == fourcc("IDAT"));
        CHECK("IDAT"_4cc != "IEND"_4cc);
        CHECK("IDAT"_4cc < "IEND"_4cc);

        std::set<fourcc> ordered{"IEND"_4cc, "IDAT"_4cc, "IHDR"_4cc, "IDAT"_4cc};
        CHECK(ordered.size() == 3);
        CHECK(*ordered.begin() == "IDAT"_4cc);

        std::unordered_map<fourcc, int> counts;
        counts["IDAT"_4cc]++;
        counts["IDAT"_4cc]++;
        counts["IEND"_4cc]++;
        CHECK(counts["IDAT"_4cc] == 2);
        CHECK(counts.size() == 2);

        std::unordered_map<fourcc, int, fourcc_hash> custom;
        custom[chunk_id::IHDR] = 13;
        CHECK(custom.at("IHDR"_4cc) == 13);
    }

    TEST_CASE("chunk property bits") {
        SUBCASE("critical chunks") {
            for (const auto& f : {chunk_id::IHDR, chunk_id::IDAT, chunk_id::IEND}) {
                CHECK(f.is_critical());
                CHECK_FALSE(f.is_ancillary());
                CHECK_FALSE(f.is_private());
                CHECK_FALSE(f.is_reserved_set());
                CHECK_FALSE(f.is_safe_to_copy());
            }
        }

        SUBCASE("ancillary chunks") {
            auto text = "tEXt"_4cc;
            CHECK(text.is_ancillary());
            CHECK_FALSE(text.is_private());
            CHECK(text.is_safe_to_copy());

            auto priv = "prIV"_4cc;
            CHECK(priv.is_private());
            CHECK_FALSE(priv.is_safe_to_copy());

            CHECK("abcd"_4cc.is_reserved_set());
        }

        SUBCASE("valid type codes") {
            CHECK(chunk_id::IDAT.is_valid_chunk_type());
            CHECK("tEXt"_4cc.is_valid_chunk_type());
            CHECK_FALSE("ab1d"_4cc.is_valid_chunk_type());
            CHECK_FALSE("ab"_4cc.is_valid_chunk_type());
            CHECK("ab"_4cc.is_printable());
            CHECK_FALSE(fourcc('a', '\0', 'c', 'd').is_printable());
        }
    }

    TEST_CASE("fourcc stream output") {
        SUBCASE("quoted") {
            std::ostringstream os;
            os << chunk_id::IHDR;
            CHECK(os.str() == "'IHDR'");
        }

        SUBCASE("non-printable bytes are escaped") {
            std::ostringstream os;
            os << fourcc('a', '\x01', 'c', 'd') << ' ' << 10;
            CHECK(os.str() == "'a\\x01cd' 10");
        }

        SUBCASE("hex mode") {
            std::ostringstream os;
            os << std::hex << chunk_id::IEND;
            CHECK(os.str() == "0x49454e44");
        }
    }

    TEST_CASE("PNG constants") {
        CHECK(png_signature.size() == 8);
        CHECK(png_signature[0] == 0x89);
        CHECK(png_signature[1] == 'P');
        CHECK(png_signature[7] == '\n');
        CHECK(ihdr_size == 13);
    }
}
