#include <ccwc/filesystem.h>
#include <fstream>
#include <sstream>
#include <vector>
#include "temp_file.h"

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>


using std::string;
using std::stringstream;
using std::vector;
using namespace ccwc;


TEST_CASE("read_using_buffer", "[read_using_buffer]") {
    // Records every chunk so we can see how the input was cut up.
    vector<string> chunks;
    auto record = [&chunks](const char * begin, const char * end) {
        chunks.push_back(string(begin, end));
    };

    stringstream input;

    SECTION("Input is handed over in buffer sized chunks.") {
        input << "a taco taco!";
        read_using_buffer<5>(input, record);
        REQUIRE(3 == chunks.size());
        CHECK(chunks[0] == "a tac");
        CHECK(chunks[1] == "o tac");
        CHECK(chunks[2] == "o!");
    }

    SECTION("Input that fills the buffer exactly ends with an empty chunk.") {
        input << "tacos";
        read_using_buffer<5>(input, record);
        REQUIRE(2 == chunks.size());
        CHECK(chunks[0] == "tacos");
        CHECK(chunks[1] == "");
    }

    SECTION("Empty input gives one empty chunk.") {
        read_using_buffer<5>(input, record);
        REQUIRE(1 == chunks.size());
        CHECK(chunks[0] == "");
    }
}


TEST_CASE("read_stream", "[read_stream]") {

    SECTION("Reads everything.") {
        string text(3 * buffer_size + 17, 'x');
        text[buffer_size] = '\n';
        stringstream input(text);
        const auto content = read_stream(input, "test");
        REQUIRE(!is_error(content));
        CHECK(get_value(content) == text);
    }

    SECTION("Binary content survives.") {
        const string text("a\0b\r\n\xFF", 6);
        stringstream input(text);
        const auto content = read_stream(input, "test");
        REQUIRE(!is_error(content));
        CHECK(get_value(content) == text);
    }

    SECTION("A broken stream is an I/O error naming the source.") {
        stringstream input("data");
        input.setstate(std::ios_base::badbit);
        const auto content = read_stream(input, "standard input");
        REQUIRE(is_error(content));
        CHECK(get_error(content).kind == error_kind::io_error);
        CHECK(get_error(content).message
              == "Failed to read from standard input");
    }

    SECTION("The exception mask is put back after reading.") {
        stringstream input("some words\n");
        const auto content = read_stream(input, "test");
        REQUIRE(!is_error(content));
        CHECK(input.exceptions() == std::ios_base::goodbit);
        CHECK(input.eof());
    }

    SECTION("The exception mask is put back after a failure.") {
        stringstream input("data");
        input.setstate(std::ios_base::badbit);
        const auto content = read_stream(input, "test");
        REQUIRE(is_error(content));
        CHECK(input.exceptions() == std::ios_base::goodbit);
        CHECK(input.bad());
    }

    SECTION("A caller's own mask survives.") {
        stringstream input("some words\n");
        input.exceptions(std::ios_base::failbit);
        const auto content = read_stream(input, "test");
        REQUIRE(!is_error(content));
        CHECK(get_value(content) == "some words\n");
        CHECK(input.exceptions() == std::ios_base::failbit);
    }
}


TEST_CASE("read_all", "[read_all]") {

    SECTION("Reads a file.") {
        temp_file file("line1\nline2\n");
        const auto content = read_all(file_source(file.name()));
        REQUIRE(!is_error(content));
        CHECK(get_value(content) == "line1\nline2\n");
    }

    SECTION("Missing file.") {
        const auto content = read_all(file_source("/non/existent/file.txt"));
        REQUIRE(is_error(content));
        CHECK(get_error(content).message
              == "File not found: /non/existent/file.txt");
    }

    SECTION("Directories aren't regular files.") {
        const string dir = boost::filesystem::temp_directory_path().string();
        const auto content = read_all(file_source(dir));
        REQUIRE(is_error(content));
        CHECK(get_error(content).kind == error_kind::io_error);
        CHECK(get_error(content).message == "Not a regular file: " + dir);
    }

    SECTION("A file in a directory we can't search is a read failure.") {
        temp_directory dir;
        const string inside = (dir.path / "inside.txt").string();
        {
            std::ofstream out(inside, std::ofstream::binary);
            out << "hidden";
        }
        boost::filesystem::permissions(dir.path, boost::filesystem::no_perms);
        const bool readable = can_open(inside);
        const auto content = read_all(file_source(inside));
        CHECK(is_error(content) == !readable);
        if (!readable) {
            CHECK(get_error(content).kind == error_kind::io_error);
            CHECK(get_error(content).message
                  == "Failed to read from " + inside);
        }
    }
}


TEST_CASE("file_size", "[file_size]") {

    SECTION("Matches the number of bytes written.") {
        temp_file file("Hello \xF0\x9F\x8C\x8D!");
        const auto size = file_size(file.name());
        REQUIRE(!is_error(size));
        CHECK(11 == get_value(size));
    }

    SECTION("Empty file.") {
        temp_file file("");
        const auto size = file_size(file.name());
        REQUIRE(!is_error(size));
        CHECK(0 == get_value(size));
    }

    SECTION("An unreadable file is a read failure, not a size.") {
        temp_file file("Hello, World");
        boost::filesystem::permissions(file.path,
                                       boost::filesystem::no_perms);
        const bool readable = can_open(file.name());
        const auto size = file_size(file.name());
        CHECK(is_error(size) == !readable);
        if (readable) {
            CHECK(12 == get_value(size));
        } else {
            CHECK(get_error(size).kind == error_kind::io_error);
            CHECK(get_error(size).message
                  == "Failed to read from " + file.name());
        }
    }

    SECTION("Missing file.") {
        const auto size = file_size("/non/existent/file.txt");
        REQUIRE(is_error(size));
        CHECK(get_error(size).kind == error_kind::io_error);
    }
}
