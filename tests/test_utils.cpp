#include "raw_view/core/events.hpp"
#include "raw_view/core/utils.hpp"

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include <sstream>
#include <string>
#include <thread>
#include <vector>

TEST_CASE("worker_count_is_bounded_by_tasks_and_never_zero") {
  REQUIRE(raw_view::core::compute_worker_count(0, 10) == 1);
  REQUIRE(raw_view::core::compute_worker_count(-3, 10) == 1);
  REQUIRE(raw_view::core::compute_worker_count(64, 2) <= 2);
  REQUIRE(raw_view::core::compute_worker_count(4, 0) >= 1);

  const unsigned cores = std::thread::hardware_concurrency();
  if (cores > 0) {
    REQUIRE(raw_view::core::compute_worker_count(100000, 100000) <= static_cast<int>(cores));
  }
}

TEST_CASE("extension_of_is_lower_case_without_dot") {
  REQUIRE(raw_view::core::extension_of("/photos/DSC_0001.NEF") == "nef");
  REQUIRE(raw_view::core::extension_of("a.tar.Gz") == "gz");
  REQUIRE(raw_view::core::extension_of("README").empty());
}

TEST_CASE("split_keeps_empty_inner_fields") {
  const auto parts = raw_view::core::split("1,,3", ',');
  REQUIRE(parts == std::vector<std::string>{"1", "", "3"});
  REQUIRE(raw_view::core::split("1920x1080", 'x') == std::vector<std::string>{"1920", "1080"});
}

TEST_CASE("memory_footprint_rounds_down_to_mib") {
  REQUIRE(raw_view::core::memory_footprint_mib(1024, 1024, 3) == 3);
  REQUIRE(raw_view::core::memory_footprint_mib(6000, 4000, 3) == 68);
  REQUIRE(raw_view::core::memory_footprint_mib(0, 4000, 3) == 0);
}

TEST_CASE("events_are_json_lines_with_type_generation_and_timestamp") {
  std::ostringstream out;
  raw_view::core::EventEmitter events(out);
  events.load_start(3, "x.nef");
  events.reconstruct_progress(3, 5, 10);
  events.load_end(3, true, {{"load_time_ms", 12}});

  std::istringstream lines(out.str());
  std::vector<nlohmann::json> parsed;
  std::string line;
  while (std::getline(lines, line)) {
    parsed.push_back(nlohmann::json::parse(line));
  }

  REQUIRE(parsed.size() == 3);
  for (const auto& ev : parsed) {
    REQUIRE(ev.at("generation") == 3);
    REQUIRE(ev.at("ts").get<std::string>().back() == 'Z');
  }
  REQUIRE(parsed[0].at("type") == "load_start");
  REQUIRE(parsed[0].at("source") == "x.nef");
  REQUIRE(parsed[1].at("total") == 10);
  REQUIRE(parsed[2].at("success") == true);
  REQUIRE(parsed[2].at("load_time_ms") == 12);
}

TEST_CASE("disabled_emitter_writes_nothing") {
  std::ostringstream out;
  raw_view::core::EventEmitter events(out, false);
  events.error(1, "boom");
  events.warning(1, "careful");
  REQUIRE(out.str().empty());
  REQUIRE_FALSE(events.enabled());
}
