#include <catch2/catch.hpp>

#include <filesystem>
#include <fstream>
#include <string>

#include "logging_test_fixture.hpp"
#include "rover_sim/logging.hpp"

using namespace rover_sim;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    rover_sim::test::ensure_logger_initialized();
    return true;
}();
}  // namespace

TEST_CASE("JSON escaping handles quotes, backslashes and control characters") {
    REQUIRE(escape_json("plain text") == "plain text");
    REQUIRE(escape_json(R"(say "hi")") == R"(say \"hi\")");
    REQUIRE(escape_json(R"(C:\rovers)") == R"(C:\\rovers)");
    REQUIRE(escape_json("line\nbreak\ttab") == R"(line\nbreak\ttab)");
    REQUIRE(escape_json(std::string{"bell\x07"}) == R"(bell\u0007)");
}

TEST_CASE("File log lines keep user text inside the message string") {
    const auto log_file = std::filesystem::temp_directory_path() / "rover_sim_tests_logs" / "rover_sim.log";
    get_logger()->info(R"(Task "dig \ here" accepted)");
    get_logger()->flush();

    std::ifstream stream{log_file};
    REQUIRE(stream.is_open());
    std::string line;
    std::string matched_line;
    while (std::getline(stream, line)) {
        if (line.find("accepted") != std::string::npos) {
            matched_line = line;
        }
    }

    REQUIRE_FALSE(matched_line.empty());
    REQUIRE(matched_line.find(R"("msg":"Task \"dig \\ here\" accepted"})") != std::string::npos);
}
