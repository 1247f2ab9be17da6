#include <catch2/catch.hpp>

#include "test_support.h"
#include <algorithm>
#include <core/progress/progress_file_writer.h>
#include <core/progress/progress_watcher.h>
#include <thread>
#include <vector>

namespace progress_watcher_tests {

using namespace depotprogress::core;
using depotprogress::test::TempDir;
using depotprogress::test::WriteFile;
using namespace std::chrono_literals;

TEST_CASE("Poll tolerates files that are not ready", "[progress][watcher]") {
    TempDir dir;
    auto file = dir / "progress.json";
    ProgressWatcher watcher(file, 1ms);

    CHECK_FALSE(watcher.Poll().has_value());

    WriteFile(file, "");
    CHECK_FALSE(watcher.Poll().has_value());

    WriteFile(file, R"({"downloaded":420,"tot)");
    CHECK_FALSE(watcher.Poll().has_value());

    WriteFile(file, "[1,2,3]");
    CHECK_FALSE(watcher.Poll().has_value());

    WriteFile(file, R"({"downloaded":"many","total":1,"percentage":1})");
    CHECK_FALSE(watcher.Poll().has_value());
}

TEST_CASE("Poll reads the published snapshot", "[progress][watcher]") {
    TempDir dir;
    auto file = dir / "progress.json";
    ProgressWatcher watcher(file, 1ms);

    WriteFile(file, R"({"downloaded":420,"total":1000,"percentage":42})");
    auto snapshot = watcher.Poll();
    REQUIRE(snapshot.has_value());
    CHECK(*snapshot == ProgressSnapshot{.downloaded = 420, .total = 1000, .percentage = 42});

    WriteFile(file, R"({"percentage":7})");
    snapshot = watcher.Poll();
    REQUIRE(snapshot.has_value());
    CHECK(*snapshot == ProgressSnapshot{.downloaded = 0, .total = 0, .percentage = 7});
}

TEST_CASE("Poll rejects percentages outside a byte", "[progress][watcher]") {
    TempDir dir;
    auto file = dir / "progress.json";
    ProgressWatcher watcher(file, 1ms);

    WriteFile(file, R"({"downloaded":1,"total":10,"percentage":-1})");
    CHECK_FALSE(watcher.Poll().has_value());

    WriteFile(file, R"({"downloaded":1,"total":10,"percentage":300})");
    CHECK_FALSE(watcher.Poll().has_value());

    WriteFile(file, R"({"downloaded":1,"total":10,"percentage":255})");
    auto snapshot = watcher.Poll();
    REQUIRE(snapshot.has_value());
    CHECK(snapshot->percentage == 255);

    std::atomic<bool> stop{false};
    WriteFile(file, R"({"downloaded":1,"total":10,"percentage":-1})");
    int calls = 0;
    CHECK_FALSE(watcher.Run([&calls](const ProgressSnapshot&) { ++calls; }, stop, 10ms).has_value());
    CHECK(calls == 0);
}

TEST_CASE("Run stops once the download is complete", "[progress][watcher]") {
    TempDir dir;
    auto file = dir / "progress.json";
    WriteFile(file, R"({"downloaded":10,"total":10,"percentage":100})");

    ProgressWatcher watcher(file, 1ms);
    std::atomic<bool> stop{false};
    std::vector<ProgressSnapshot> seen;
    auto last = watcher.Run([&seen](const ProgressSnapshot& s) { seen.push_back(s); }, stop);

    REQUIRE(last.has_value());
    CHECK(last->percentage == 100);
    REQUIRE(seen.size() == 1);
    CHECK(seen.front().downloaded == 10);
}

TEST_CASE("Run honours the stop flag and timeout", "[progress][watcher]") {
    TempDir dir;
    auto file = dir / "progress.json";
    ProgressWatcher watcher(file, 1ms);
    int calls = 0;
    auto count = [&calls](const ProgressSnapshot&) { ++calls; };

    SECTION("stop requested") {
        std::atomic<bool> stop{true};
        CHECK_FALSE(watcher.Run(count, stop).has_value());
        CHECK(calls == 0);
    }

    SECTION("timeout with an unfinished download") {
        WriteFile(file, R"({"downloaded":5,"total":10,"percentage":50})");
        std::atomic<bool> stop{false};
        auto last = watcher.Run(count, stop, 20ms);
        REQUIRE(last.has_value());
        CHECK(last->percentage == 50);
        CHECK(calls == 1);
    }
}

TEST_CASE("Run follows a file updated by a reporter", "[progress][watcher]") {
    TempDir dir;
    auto file = dir / "progress.json";

    std::thread producer([&file] {
        ProgressFileWriter writer;
        for (std::uint64_t downloaded : {10, 50, 90, 100}) {
            writer.Write(file,
                         {.downloaded = downloaded,
                          .total = 100,
                          .percentage = static_cast<std::uint8_t>(downloaded)});
            std::this_thread::sleep_for(10ms);
        }
    });

    ProgressWatcher watcher(file, 1ms);
    std::atomic<bool> stop{false};
    std::vector<int> percentages;
    auto last = watcher.Run(
        [&percentages](const ProgressSnapshot& s) { percentages.push_back(s.percentage); },
        stop,
        5s);
    producer.join();

    REQUIRE(last.has_value());
    CHECK(last->percentage == 100);
    REQUIRE_FALSE(percentages.empty());
    CHECK(percentages.back() == 100);
    CHECK(std::is_sorted(percentages.begin(), percentages.end()));
}

} // namespace progress_watcher_tests
