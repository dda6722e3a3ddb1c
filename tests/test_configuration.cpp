#include "cli/BatchRunner.hpp"
#include "cli/CommandLineInterface.hpp"
#include "cli/ConfigurationManager.hpp"
#include "core/InputValidator.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace aoi::test {

class ConfigurationTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::make_unique<TempDirectory>("aoi_config");
    }

    bool parse(std::vector<std::string> args) {
        args.insert(args.begin(), "aoi-composite");
        std::vector<char*> argv;
        for (auto& arg : args) {
            argv.push_back(arg.data());
        }
        return cli_.parse_arguments(static_cast<int>(argv.size()), argv.data());
    }

    static bool has_conflict(const ValidationResult& result, const std::string& description) {
        for (const auto& conflict : result.conflicts) {
            if (conflict.description == description) {
                return true;
            }
        }
        return false;
    }

    std::unique_ptr<TempDirectory> dir_;
    CommandLineInterface cli_;
    InputValidator validator_;
};

TEST_F(ConfigurationTest, DefaultsDescribeTheUsualRun) {
    CompositeConfig config;
    EXPECT_EQ(config.start_year, 2015);
    EXPECT_FALSE(config.end_year.has_value());
    ASSERT_EQ(config.lines.size(), 2u);
    EXPECT_EQ(config.lines[0].name, "Buffer1");
    EXPECT_EQ(config.lines[1].index, 1);
    EXPECT_EQ(config.bands, (std::vector<std::string>{"B04", "B08"}));
    EXPECT_DOUBLE_EQ(config.max_cloud_cover, 10.0);
    EXPECT_EQ(config.collection, "sentinel-2-l2a");
    EXPECT_TRUE(validator_.validate(config).is_valid);
}

TEST_F(ConfigurationTest, SaveAndLoadPreservesEverySetting) {
    CompositeConfig config;
    config.start_year = 2018;
    config.end_year = 2020;
    config.lines = {{"North", 3}, {"South", 7}};
    config.items_file = "/data/items.json";
    config.bands = {"B02", "B03", "B04"};
    config.max_cloud_cover = 25.5;
    config.sign_assets = false;
    config.composite_in_memory = true;
    config.num_threads = 4;
    config.parallel_processing = true;

    std::string path = dir_->file("saved.json");
    ConfigurationManager writer(config);
    ASSERT_TRUE(writer.save_to_file(path)) << writer.last_error();

    ConfigurationManager reader;
    ASSERT_TRUE(reader.load_from_file(path)) << reader.last_error();
    const CompositeConfig& loaded = reader.to_composite_config();

    EXPECT_EQ(loaded.start_year, 2018);
    ASSERT_TRUE(loaded.end_year.has_value());
    EXPECT_EQ(*loaded.end_year, 2020);
    ASSERT_EQ(loaded.lines.size(), 2u);
    EXPECT_EQ(loaded.lines[1].name, "South");
    EXPECT_EQ(loaded.lines[1].index, 7);
    EXPECT_EQ(loaded.items_file, std::optional<std::string>("/data/items.json"));
    EXPECT_EQ(loaded.bands, config.bands);
    EXPECT_DOUBLE_EQ(loaded.max_cloud_cover, 25.5);
    EXPECT_FALSE(loaded.sign_assets);
    EXPECT_TRUE(loaded.composite_in_memory);
    EXPECT_EQ(loaded.num_threads, 4);
    EXPECT_EQ(loaded.config_file, std::optional<std::string>(path));
}

TEST_F(ConfigurationTest, UnsetOptionalsSavedAsNull) {
    json j = ConfigurationManager::to_json(CompositeConfig());
    EXPECT_TRUE(j["end_year"].is_null());
    EXPECT_TRUE(j["items_file"].is_null());
    EXPECT_TRUE(j["log_file"].is_null());
    ASSERT_TRUE(j["lines"].is_array());
    EXPECT_EQ(j["lines"][0]["name"], "Buffer1");
}

TEST_F(ConfigurationTest, PartialFileKeepsOtherValues) {
    CompositeConfig config;
    ConfigurationManager::apply_json(json{{"max_cloud_cover", 5.0}, {"end_year", 2019}}, config);

    EXPECT_DOUBLE_EQ(config.max_cloud_cover, 5.0);
    EXPECT_EQ(config.end_year, std::optional<int>(2019));
    EXPECT_EQ(config.start_year, 2015);
    EXPECT_EQ(config.lines.size(), 2u);

    ConfigurationManager::apply_json(json{{"end_year", nullptr}}, config);
    EXPECT_FALSE(config.end_year.has_value());
}

TEST_F(ConfigurationTest, LinesAcceptedAsObject) {
    CompositeConfig config;
    ConfigurationManager::apply_json(json::parse(R"({"lines": {"Buffer2": 1, "Buffer1": 0}})"), config);

    ASSERT_EQ(config.lines.size(), 2u);
    EXPECT_EQ(config.lines[0].name, "Buffer1");
    EXPECT_EQ(config.lines[0].index, 0);
    EXPECT_EQ(config.lines[1].name, "Buffer2");
    EXPECT_EQ(config.lines[1].index, 1);
}

TEST_F(ConfigurationTest, WrongShapesRejected) {
    CompositeConfig config;
    EXPECT_THROW(ConfigurationManager::apply_json(json{{"lines", "Buffer1"}}, config), std::invalid_argument);
    EXPECT_THROW(ConfigurationManager::apply_json(json::array(), config), std::invalid_argument);
    EXPECT_THROW(ConfigurationManager::apply_json(json{{"start_year", "soon"}}, config), json::exception);
}

TEST_F(ConfigurationTest, BadFileLeavesConfigurationUntouched) {
    ConfigurationManager manager;
    std::string path = write_text(dir_->file("bad.json"), R"({"start_year": 2001, "lines": 5})");

    EXPECT_FALSE(manager.load_from_file(path));
    EXPECT_NE(manager.last_error().find("Invalid configuration"), std::string::npos);
    EXPECT_EQ(manager.to_composite_config().start_year, 2015);

    EXPECT_FALSE(manager.load_from_file(dir_->file("missing.json")));
    EXPECT_NE(manager.last_error().find("Could not open config file"), std::string::npos);
}

TEST_F(ConfigurationTest, ParseLineList) {
    auto jobs = CommandLineInterface::parse_line_list("Buffer1=0, Buffer2 = 4");
    ASSERT_TRUE(jobs.has_value());
    ASSERT_EQ(jobs->size(), 2u);
    EXPECT_EQ((*jobs)[0].name, "Buffer1");
    EXPECT_EQ((*jobs)[0].index, 0);
    EXPECT_EQ((*jobs)[1].name, "Buffer2");
    EXPECT_EQ((*jobs)[1].index, 4);

    EXPECT_FALSE(CommandLineInterface::parse_line_list("Buffer1").has_value());
    EXPECT_FALSE(CommandLineInterface::parse_line_list("Buffer1=x").has_value());
    EXPECT_FALSE(CommandLineInterface::parse_line_list("Buffer1=2x").has_value());
    EXPECT_FALSE(CommandLineInterface::parse_line_list("=3").has_value());
    EXPECT_FALSE(CommandLineInterface::parse_line_list("").has_value());
}

TEST_F(ConfigurationTest, ParseListTrimsAndSkipsEmpty) {
    EXPECT_EQ(CommandLineInterface::parse_list(" B04 ,,B08,"), (std::vector<std::string>{"B04", "B08"}));
    EXPECT_TRUE(CommandLineInterface::parse_list("").empty());
}

TEST_F(ConfigurationTest, CommandLineOverridesConfigFile) {
    ConfigurationManager manager;
    CompositeConfig base;
    base.max_cloud_cover = 30.0;
    base.start_year = 2016;
    manager.from_composite_config(base);
    std::string path = dir_->file("base.json");
    ASSERT_TRUE(manager.save_to_file(path));

    ASSERT_TRUE(parse({"--config", path, "--max-cloud", "12.5", "--line", "A=2,B=5",
                       "--bands", "B08,B04", "--output-dir", "out/", "--threads", "3", "--no-sign",
                       "--end-year", "2018", "--dry-run"}));

    const CompositeConfig& config = cli_.get_config();
    EXPECT_DOUBLE_EQ(config.max_cloud_cover, 12.5);
    EXPECT_EQ(config.start_year, 2016);
    EXPECT_EQ(config.end_year, std::optional<int>(2018));
    ASSERT_EQ(config.lines.size(), 2u);
    EXPECT_EQ(config.lines[1].name, "B");
    EXPECT_EQ(config.bands, (std::vector<std::string>{"B08", "B04"}));
    EXPECT_EQ(config.output_directory, "out");
    EXPECT_EQ(config.num_threads, 3);
    EXPECT_TRUE(config.parallel_processing);
    EXPECT_FALSE(config.sign_assets);
    EXPECT_TRUE(cli_.is_dry_run());
}

TEST_F(ConfigurationTest, InvalidNumberFailsWithExitCode) {
    EXPECT_FALSE(parse({"--start-year", "last"}));
    EXPECT_EQ(cli_.exit_code(), 1);
}

TEST_F(ConfigurationTest, ValidatorReportsYearRange) {
    CompositeConfig config;
    config.start_year = 2020;
    config.end_year = 2019;

    auto result = validator_.validate(config);
    EXPECT_TRUE(result.has_errors());
    EXPECT_TRUE(has_conflict(result, "End year precedes start year"));
    EXPECT_NE(result.format_error_message().find("--end-year 2019"), std::string::npos);
}

TEST_F(ConfigurationTest, ValidatorReportsThresholds) {
    CompositeConfig config;
    config.marginal_gain_threshold = 0.5;
    config.target_coverage = 0.4;
    EXPECT_TRUE(has_conflict(validator_.validate(config), "Coverage selection thresholds are out of range"));

    config = CompositeConfig();
    config.target_coverage = 1.5;
    EXPECT_TRUE(has_conflict(validator_.validate(config), "Coverage selection thresholds are out of range"));
}

TEST_F(ConfigurationTest, ValidatorReportsBandsAndCloud) {
    CompositeConfig config;
    config.bands = {"B04", "B08", "B04"};
    config.max_cloud_cover = 120.0;

    auto result = validator_.validate(config);
    EXPECT_EQ(result.conflicts.size(), 2u);
    EXPECT_TRUE(has_conflict(result, "Band listed more than once"));
    EXPECT_TRUE(has_conflict(result, "Maximum cloud cover must be a percentage"));

    config = CompositeConfig();
    config.bands.clear();
    EXPECT_TRUE(has_conflict(validator_.validate(config), "No bands requested"));
}

TEST_F(ConfigurationTest, ValidatorReportsLines) {
    CompositeConfig config;
    config.lines = {{"A", 0}, {"B", 0}};
    EXPECT_TRUE(has_conflict(validator_.validate(config), "Invalid or duplicate AOI feature indices"));

    config.lines = {{"A", -1}};
    EXPECT_TRUE(has_conflict(validator_.validate(config), "Invalid or duplicate AOI feature indices"));

    config.lines.clear();
    EXPECT_TRUE(has_conflict(validator_.validate(config), "No lines to process"));
}

TEST_F(ConfigurationTest, ValidatorReportsProcessingLimits) {
    CompositeConfig config;
    config.page_limit = 0;
    config.num_threads = -2;
    EXPECT_TRUE(has_conflict(validator_.validate(config), "Processing limits must be positive"));
}

TEST_F(ConfigurationTest, WorkerCount) {
    CompositeConfig config;
    EXPECT_EQ(BatchRunner::worker_count(config, 5), 1u);

    config.parallel_processing = true;
    config.num_threads = 3;
    EXPECT_EQ(BatchRunner::worker_count(config, 5), 3u);
    EXPECT_EQ(BatchRunner::worker_count(config, 2), 2u);
    EXPECT_EQ(BatchRunner::worker_count(config, 1), 1u);

    config.num_threads = 0;
    size_t automatic = BatchRunner::worker_count(config, 64);
    EXPECT_GE(automatic, 1u);
    EXPECT_LE(automatic, 64u);
}

} // namespace aoi::test
