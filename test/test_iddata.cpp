#include <cmath>
#include <filesystem>
#include <fstream>
#include <string>

#include "control.hpp"
#include "doctest.h"

using namespace ctrlkit;

namespace {
    std::string tempPath(const std::string& name) {
        return (std::filesystem::temp_directory_path() / ("ctrlkit_" + name)).string();
    }

    void writeText(const std::string& path, const std::string& text) {
        std::ofstream out(path);
        out << text;
    }
}  // namespace

TEST_CASE("IdData Construction") {
    SUBCASE("Valid data") {
        IdData data{{1.0, 2.0, 3.0}, {0.0, 1.0, 0.0}, 0.1, 2.0};
        CHECK(data.size() == 3);
        CHECK(data.sampleTime() == doctest::Approx(0.1));
        const auto t = data.time();
        CHECK(t[0] == doctest::Approx(2.0));
        CHECK(t[2] == doctest::Approx(2.2));
    }

    SUBCASE("Invalid data throws") {
        CHECK_THROWS_AS(IdData({}, {}, 0.1), std::invalid_argument);
        CHECK_THROWS_AS(IdData({1.0, 2.0}, {1.0}, 0.1), std::invalid_argument);
        CHECK_THROWS_AS(IdData({1.0}, {1.0}, 0.0), std::invalid_argument);
        CHECK_THROWS_AS(IdData({1.0}, {1.0}, -1.0), std::invalid_argument);
    }
}

TEST_CASE("IdData Segments and Splits") {
    IdData data{{0.0, 1.0, 2.0, 3.0, 4.0, 5.0, 6.0, 7.0, 8.0, 9.0},
                {9.0, 8.0, 7.0, 6.0, 5.0, 4.0, 3.0, 2.0, 1.0, 0.0},
                0.5};

    SUBCASE("Segment keeps the absolute time") {
        const IdData seg = data.segment(2, 5);
        CHECK(seg.size() == 3);
        CHECK(seg.output()[0] == doctest::Approx(2.0));
        CHECK(seg.input()[2] == doctest::Approx(5.0));
        CHECK(seg.startTime() == doctest::Approx(1.0));
    }

    SUBCASE("Invalid segments throw") {
        CHECK_THROWS_AS(data.segment(5, 5), std::invalid_argument);
        CHECK_THROWS_AS(data.segment(3, 11), std::invalid_argument);
    }

    SUBCASE("Split partitions the samples") {
        const auto parts = data.split(0.7);
        CHECK(parts.identification.size() == 7);
        CHECK(parts.validation.size() == 3);
        CHECK(parts.validation.output()[0] == doctest::Approx(7.0));
        CHECK(parts.validation.startTime() == doctest::Approx(3.5));
    }

    SUBCASE("Degenerate splits throw") {
        CHECK_THROWS_AS(data.split(0.0), std::invalid_argument);
        CHECK_THROWS_AS(data.split(1.0), std::invalid_argument);
        CHECK_THROWS_AS(data.split(0.01), std::invalid_argument);
    }

    SUBCASE("Detrend removes the means") {
        const auto d = data.detrend();
        CHECK(d.outputMean == doctest::Approx(4.5));
        CHECK(d.inputMean == doctest::Approx(4.5));
        CHECK(mean(d.data.output()) == doctest::Approx(0.0));
        CHECK(mean(d.data.input()) == doctest::Approx(0.0));
        CHECK(d.data.output()[0] == doctest::Approx(-4.5));
    }

    SUBCASE("Replacing the output keeps input and timing") {
        const IdData other = data.withOutput(std::vector<double>(10, 1.0));
        CHECK(other.output()[3] == doctest::Approx(1.0));
        CHECK(other.input() == data.input());
        CHECK_THROWS_AS(data.withOutput({1.0}), std::invalid_argument);
    }
}

TEST_CASE("CSV Input and Output") {
    SUBCASE("Written data reads back unchanged") {
        const auto   path = tempPath("roundtrip.csv");
        const IdData data{{0.1, -0.2, 1.0 / 3.0, 4.0}, {1.0, 1.0, -1.0, 0.5}, 0.01, 1.0};
        writeCsv(path, data);

        const IdData back = readCsv(path);
        CHECK(back.size() == 4);
        CHECK(back.sampleTime() == doctest::Approx(0.01));
        CHECK(back.startTime() == doctest::Approx(1.0));
        CHECK(back.output() == data.output());
        CHECK(back.input() == data.input());
        std::filesystem::remove(path);
    }

    SUBCASE("Comments, blank lines and a header are skipped") {
        const auto path = tempPath("comments.csv");
        writeText(path, "# motor run\nt,u,y\n\n0.0, 1.0, 2.0\n0.5,1.0,2.5\n# note\n1.0,0.0,3.0\n");
        const IdData data = readCsv(path);
        CHECK(data.size() == 3);
        CHECK(data.sampleTime() == doctest::Approx(0.5));
        CHECK(data.output()[2] == doctest::Approx(3.0));
        std::filesystem::remove(path);
    }

    SUBCASE("Malformed files throw") {
        const auto path = tempPath("bad.csv");

        writeText(path, "0.0,1.0\n0.1,1.0\n");
        CHECK_THROWS_AS(readCsv(path), std::runtime_error);

        writeText(path, "0.0,1.0,2.0\n0.1,abc,2.0\n");
        CHECK_THROWS_AS(readCsv(path), std::runtime_error);

        writeText(path, "time,input,output\n0.0,1.0,2.0\n");
        CHECK_THROWS_AS(readCsv(path), std::runtime_error);

        writeText(path, "0.0,1.0,2.0\n0.1,1.0,2.0\n0.3,1.0,2.0\n");
        CHECK_THROWS_AS(readCsv(path), std::runtime_error);

        std::filesystem::remove(path);
        CHECK_THROWS_AS(readCsv(path), std::runtime_error);
    }
}
