// Labrun headers
#include "core/ConfigLoader.hpp"
#include "core/DeviceFactory.hpp"
#include "core/Engine.hpp"
#include "core/Logger.hpp"
#include "devices/Builtins.hpp"
#include "devices/Device.hpp"

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

// Third-party headers
#include <nlohmann/json.hpp>

// STL headers
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace labrun::test {

  using labrun::core::ConfigLoader;
  using labrun::core::DeviceFactory;
  using labrun::core::Engine;
  using labrun::core::Logger;
  using labrun::core::LogLevel;
  using nlohmann::json;
  namespace fs = std::filesystem;

  namespace {

    // Unique scratch path per test, removed on destruction.
    class TempFile {
    public:
      explicit TempFile(const std::string& stem) {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        path_ = fs::temp_directory_path() /
                ("labrun_" + std::string(info->name()) + "_" + stem);
        fs::remove(path_);
      }
      ~TempFile() {
        std::error_code ec;
        fs::remove(path_, ec);
      }

      std::string path() const { return path_.string(); }

      void write(const std::string& text) const {
        std::ofstream out(path_);
        out << text;
      }

      std::string read() const {
        std::ifstream in(path_);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
      }

    private:
      fs::path path_;
    };

  } // namespace

  //---ConfigLoader--------------------------------------------------------------

  TEST(config_loader, parses_a_json_file) {
    TempFile file("config.json");
    file.write(R"({ "measurement": { "steps": 3 } })");

    ConfigLoader loader(file.path());
    auto j = loader.load();
    EXPECT_EQ(j.at("measurement").at("steps").get<int>(), 3);
    EXPECT_EQ(loader.path(), file.path());
  }

  TEST(config_loader, missing_file_throws) {
    ConfigLoader loader("/nonexistent/labrun/config.json");
    EXPECT_THROW(loader.load(), std::runtime_error);
  }

  TEST(config_loader, malformed_json_throws_runtime_error_naming_the_file) {
    TempFile file("broken.json");
    file.write("{ \"log\": ");

    try {
      ConfigLoader(file.path()).load();
      FAIL() << "malformed JSON must not parse";
    } catch (const std::runtime_error& e) {
      EXPECT_THAT(e.what(), testing::HasSubstr(file.path()));
    }
  }

  //---Engine::Config------------------------------------------------------------

  TEST(engine_config, empty_object_gives_defaults) {
    auto cfg = Engine::Config::fromJson(json::object());
    EXPECT_EQ(cfg.logLevel, LogLevel::Info);
    EXPECT_TRUE(cfg.logPath.empty());
    EXPECT_EQ(cfg.dispatcherCapacity, core::Dispatcher::kDefaultCapacity);
    EXPECT_EQ(cfg.finalizeWarnAfter.count(), 5000);
    EXPECT_EQ(cfg.steps, 1u);
    EXPECT_EQ(cfg.stepDuration.count(), 1000);
    EXPECT_TRUE(cfg.devices.empty());
  }

  TEST(engine_config, default_engine_uses_the_default_config) {
    Engine engine;
    EXPECT_EQ(engine.config().logLevel, LogLevel::Info);
    EXPECT_EQ(engine.config().steps, 1u);
    EXPECT_EQ(engine.runtimeOptions().finalizeWarnAfter.count(), 5000);
    EXPECT_TRUE(engine.measurement().canStart());
  }

  TEST(engine_config, reads_every_section) {
    auto cfg = Engine::Config::fromJson(json::parse(R"({
      "log": { "level": "debug", "path": "/tmp/run.csv" },
      "dispatcher": { "capacity": 32 },
      "runtime": { "finalize_warn_ms": 250 },
      "measurement": { "steps": 4, "step_ms": 200 },
      "devices": [
        { "name": "counter", "type": "sampler", "args": { "interval_ms": 100 } },
        { "name": "psu", "type": "serial" }
      ]
    })"));

    EXPECT_EQ(cfg.logLevel, LogLevel::Debug);
    EXPECT_EQ(cfg.logPath, "/tmp/run.csv");
    EXPECT_EQ(cfg.dispatcherCapacity, 32u);
    EXPECT_EQ(cfg.finalizeWarnAfter.count(), 250);
    EXPECT_EQ(cfg.steps, 4u);
    EXPECT_EQ(cfg.stepDuration.count(), 200);
    ASSERT_EQ(cfg.devices.size(), 2u);
    EXPECT_EQ(cfg.devices[0].name, "counter");
    EXPECT_EQ(cfg.devices[0].args.at("interval_ms").get<int>(), 100);
    EXPECT_EQ(cfg.devices[1].type, "serial");
    EXPECT_TRUE(cfg.devices[1].args.is_object());
  }

  TEST(engine_config, rejects_invalid_values) {
    EXPECT_THROW(Engine::Config::fromJson(json::array()), std::runtime_error);
    EXPECT_THROW(Engine::Config::fromJson(json::parse(R"({"log":{"level":"loud"}})")),
                 std::runtime_error);
    EXPECT_THROW(Engine::Config::fromJson(json::parse(R"({"measurement":{"steps":0}})")),
                 std::runtime_error);
    EXPECT_THROW(Engine::Config::fromJson(json::parse(R"({"dispatcher":{"capacity":-1}})")),
                 std::runtime_error);
    EXPECT_THROW(Engine::Config::fromJson(json::parse(R"({"devices":{}})")), std::runtime_error);
    EXPECT_THROW(Engine::Config::fromJson(json::parse(R"({"devices":[{"name":"x"}]})")),
                 std::runtime_error);
  }

  TEST(engine_config, rejects_duplicate_device_names) {
    const auto j = json::parse(R"({"devices":[
      {"name":"a","type":"sampler"},
      {"name":"a","type":"serial"}]})");
    try {
      Engine::Config::fromJson(j);
      FAIL() << "duplicate names must be rejected";
    } catch (const std::runtime_error& e) {
      EXPECT_THAT(e.what(), testing::HasSubstr("duplicate device name: a"));
    }
  }

  //---Logger--------------------------------------------------------------------

  TEST(logger, parses_level_names) {
    EXPECT_EQ(core::parseLogLevel("warn"), LogLevel::Warn);
    EXPECT_FALSE(core::parseLogLevel("WARN").has_value());
    EXPECT_STREQ(core::toString(LogLevel::Error), "error");
  }

  TEST(logger, writes_a_csv_run_log) {
    TempFile file("run.csv");
    {
      Logger logger(LogLevel::Info);
      logger.startNewRun(file.path());
      logger.debug("psu", "filtered out");
      logger.info("psu", "connected");
      logger.info("psu", "reply was \"1,5\"");
      logger.finishRun();
      EXPECT_EQ(logger.dropped(), 0u);
    }

    const auto text = file.read();
    EXPECT_THAT(text, testing::StartsWith("timestamp_ms,level,component,message\n"));
    EXPECT_THAT(text, testing::HasSubstr(",info,psu,connected\n"));
    EXPECT_THAT(text, testing::HasSubstr(",info,psu,\"reply was \"\"1,5\"\"\"\n"));
    EXPECT_THAT(text, testing::Not(testing::HasSubstr("filtered out")));
  }

  TEST(logger, unwritable_path_throws) {
    Logger logger;
    EXPECT_THROW(logger.startNewRun("/nonexistent/labrun/run.csv"), std::runtime_error);
  }

  TEST(logger, threshold_can_be_raised_at_runtime) {
    TempFile file("threshold.csv");
    {
      Logger logger(LogLevel::Debug);
      logger.startNewRun(file.path());
      logger.setThreshold(LogLevel::Warn);
      logger.info("x", "quiet");
      logger.warn("x", "loud");
      logger.finishRun();
    }
    const auto text = file.read();
    EXPECT_THAT(text, testing::Not(testing::HasSubstr("quiet")));
    EXPECT_THAT(text, testing::HasSubstr(",warn,x,loud\n"));
  }

  //---DeviceFactory-------------------------------------------------------------

  TEST(device_factory, builtins_are_registered_once) {
    DeviceFactory factory;
    devices::registerBuiltinDevices(factory);
    EXPECT_THAT(factory.types(), testing::ElementsAre("sampler", "serial"));
    EXPECT_THROW(devices::registerBuiltinDevices(factory), std::logic_error);
  }

  TEST(device_factory, creates_named_devices_and_rejects_unknown_types) {
    Engine::Config cfg;
    cfg.logLevel = LogLevel::Error;
    Engine engine(cfg);

    DeviceFactory factory;
    devices::registerBuiltinDevices(factory);

    auto dev = factory.create("sampler", "counter", engine);
    ASSERT_NE(dev, nullptr);
    EXPECT_EQ(dev->name(), "counter");
    EXPECT_FALSE(dev->ready());

    EXPECT_THROW(factory.create("oscilloscope", "scope", engine), std::out_of_range);
    EXPECT_FALSE(factory.contains("oscilloscope"));
  }

  TEST(device_factory, duplicate_and_empty_registrations) {
    DeviceFactory factory;
    auto maker = [](const std::string&, Engine&) -> std::unique_ptr<devices::Device> {
      return nullptr;
    };
    EXPECT_TRUE(factory.registerDevice("probe", maker));
    EXPECT_FALSE(factory.registerDevice("probe", maker));
    EXPECT_THROW(factory.registerDevice("empty", nullptr), std::invalid_argument);
  }

} // namespace labrun::test
