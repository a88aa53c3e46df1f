#include <gtest/gtest.h>
#include <boost/filesystem.hpp>
#include <fstream>
#include <iterator>
#include <sstream>
#include <nlohmann/json.hpp>
#include "graph/entity_builder.hpp"
#include "graph/graph_store.hpp"
#include "io/record_parser.hpp"
#include "tool/tool_interface.hpp"

namespace fs = boost::filesystem;

using namespace stopgraph;

namespace {

class ToolInterfaceTest : public ::testing::Test {
protected:
    void SetUp() override {
        temp_dir_ = fs::temp_directory_path() / fs::unique_path("stopgraph-tool-%%%%-%%%%");
        fs::create_directories(temp_dir_);

        stops_path_ = temp_dir_ / "stops.txt";
        std::ofstream stops(stops_path_.string());
        stops << "stop_id,stop_code,stop_name,stop_desc,stop_lat,stop_lon\n"
              << "ST1,,Atocha,,40.5,-3.7,,,,,,\n"
              << "ST2,,Barcelona Sants,,41.38,2.14,,,,,,\n"
              << "ST3,,Atocha,\n"
              << "ST4,,Merida,,38.91,-6.34\n";
    }

    void TearDown() override {
        boost::system::error_code ec;
        fs::remove_all(temp_dir_, ec);
    }

    std::string readerJson() const {
        nlohmann::json json;
        json["file_path"] = stops_path_.string();
        return json.dump();
    }

    std::string writerJson() const {
        nlohmann::json json;
        json["output_dir"] = (temp_dir_ / "output").string();
        return json.dump();
    }

    static std::string readFile(const fs::path& path) {
        std::ifstream file(path.string());
        return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    }

    fs::path temp_dir_;
    fs::path stops_path_;
};

bool startsWith(const std::string& text, const std::string& prefix) {
    return text.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

TEST(ToolConfigTest, ParsesReaderConfig) {
    io::StopsReaderConfig config = tool::parseStopsReaderConfig(
        nlohmann::json::parse(R"({"file_path": "stops.txt", "max_lines": 0, "delimiter": ";"})"));

    EXPECT_EQ(config.file_path, "stops.txt");
    EXPECT_EQ(config.max_lines, 0u);
    EXPECT_EQ(config.delimiter, ';');

    io::StopsReaderConfig defaults = tool::parseStopsReaderConfig(nlohmann::json::object());
    EXPECT_EQ(defaults.max_lines, 200u);
    EXPECT_EQ(defaults.delimiter, ',');
}

TEST(ToolConfigTest, RejectsLongDelimiter) {
    EXPECT_THROW(tool::parseStopsReaderConfig(nlohmann::json::parse(R"({"delimiter": "::"})")),
                 std::runtime_error);
}

TEST(ToolConfigTest, ParsesAreaConfig) {
    EXPECT_EQ(tool::parseAreaConfig(nlohmann::json::object()).area_name, "madrid");
    EXPECT_EQ(tool::parseAreaConfig(nlohmann::json::parse(R"({"area": "cataluna"})")).area_name, "cataluna");

    tool::AreaSelection custom = tool::parseAreaConfig(nlohmann::json::parse(
        R"({"area": "custom", "min_lat": 39.5, "max_lat": "40.5", "min_lon": -4, "max_lon": "-3.5"})"));
    EXPECT_TRUE(custom.is_custom);
    ASSERT_TRUE(custom.bounds.has_value());
    EXPECT_DOUBLE_EQ(custom.bounds->getMinLat(), 39.5);
    EXPECT_DOUBLE_EQ(custom.bounds->getMinLon(), -4.0);

    tool::AreaSelection incomplete = tool::parseAreaConfig(nlohmann::json::parse(
        R"({"area": "custom", "min_lat": 39.5})"));
    EXPECT_TRUE(incomplete.used_fallback);
}

TEST(ToolConfigTest, RejectsNegativeCounts) {
    EXPECT_THROW(tool::parseStopsReaderConfig(nlohmann::json::parse(R"({"max_lines": -5})")),
                 std::runtime_error);
    EXPECT_THROW(tool::parseStopsReaderConfig(nlohmann::json::parse(R"({"max_lines": 2.5})")),
                 std::runtime_error);
    EXPECT_THROW(tool::parseGraphWriterConfig(nlohmann::json::parse(R"({"sample_size": -1})")),
                 std::runtime_error);
}

TEST(ToolConfigTest, NumericCustomBoundsKeepFullPrecision) {
    tool::AreaSelection custom = tool::parseAreaConfig(nlohmann::json::parse(
        R"({"area": "custom", "min_lat": 40.4168123, "max_lat": 40.5, "min_lon": -3.7038271, "max_lon": -3.5})"));

    ASSERT_TRUE(custom.bounds.has_value());
    EXPECT_EQ(custom.bounds->getMinLat(), 40.4168123);
    EXPECT_EQ(custom.bounds->getMinLon(), -3.7038271);
    EXPECT_FALSE(custom.bounds->contains(40.41681, -3.6));
    EXPECT_TRUE(custom.bounds->contains(40.4168123, -3.7038271));
}

TEST(ToolConfigTest, AreaKeyIsCaseInsensitive) {
    tool::AreaSelection custom = tool::parseAreaConfig(nlohmann::json::parse(
        R"({"area": "Custom", "min_lat": 39.5, "max_lat": 40.5, "min_lon": -4, "max_lon": -3.5})"));
    EXPECT_TRUE(custom.is_custom);
    EXPECT_FALSE(custom.used_fallback);

    EXPECT_EQ(tool::parseAreaConfig(nlohmann::json::parse(R"({"area": "Extremadura"})")).area_name, "extremadura");
}

TEST(ToolConfigTest, ParsesWriterConfig) {
    tool::GraphWriterConfig config = tool::parseGraphWriterConfig(
        nlohmann::json::parse(R"({"output_dir": "out", "sample_size": 20, "points_output_file_path": "p.gpkg"})"));

    EXPECT_EQ(config.output_dir, "out");
    EXPECT_EQ(config.sample_size, 20u);
    EXPECT_EQ(config.points_output_file_path, "p.gpkg");
    EXPECT_EQ(config.turtle_file_name, "estaciones.ttl");
    EXPECT_EQ(config.rdfxml_file_name, "estaciones.rdf");
}

TEST_F(ToolInterfaceTest, WritesFullAndFilteredGraphs) {
    std::string result = tool::processStopGraphTool(readerJson(), R"({"area": "madrid"})", writerJson());

    ASSERT_TRUE(startsWith(result, "Success")) << result;
    EXPECT_NE(result.find("1 of 3 stations"), std::string::npos) << result;

    fs::path output = temp_dir_ / "output";
    EXPECT_TRUE(fs::exists(output / "estaciones.ttl"));
    EXPECT_TRUE(fs::exists(output / "estaciones.rdf"));
    ASSERT_TRUE(fs::exists(output / "estaciones_madrid.ttl"));

    std::string full = readFile(output / "estaciones.ttl");
    EXPECT_NE(full.find("ex:ST2"), std::string::npos);
    EXPECT_EQ(full.find("ex:ST3"), std::string::npos);

    std::string filtered = readFile(output / "estaciones_madrid.ttl");
    EXPECT_NE(filtered.find("ex:ST1"), std::string::npos);
    EXPECT_EQ(filtered.find("ex:ST2"), std::string::npos);
    EXPECT_EQ(filtered.find("ex:ST4"), std::string::npos);
}

TEST_F(ToolInterfaceTest, CustomAreaFileName) {
    std::string result = tool::processStopGraphTool(
        readerJson(),
        R"({"area": "custom", "min_lat": 38.0, "max_lat": 39.0, "min_lon": -7.0, "max_lon": -6.0})",
        writerJson());

    ASSERT_TRUE(startsWith(result, "Success")) << result;
    std::string filtered = readFile(temp_dir_ / "output" / "estaciones_personalizada.ttl");
    EXPECT_NE(filtered.find("ex:ST4"), std::string::npos);
    EXPECT_EQ(filtered.find("ex:ST1"), std::string::npos);
}

TEST_F(ToolInterfaceTest, AllAreasWritesNoFilteredGraph) {
    std::string result = tool::processStopGraphTool(readerJson(), R"({"area": "all"})", writerJson());

    ASSERT_TRUE(startsWith(result, "Success")) << result;
    EXPECT_TRUE(fs::exists(temp_dir_ / "output" / "estaciones.ttl"));
    EXPECT_FALSE(fs::exists(temp_dir_ / "output" / "estaciones_all.ttl"));
}

TEST_F(ToolInterfaceTest, MissingStopsFileIsAnError) {
    nlohmann::json reader;
    reader["file_path"] = (temp_dir_ / "missing.txt").string();

    std::string result = tool::processStopGraphTool(reader.dump(), "{}", writerJson());
    EXPECT_TRUE(startsWith(result, "Error")) << result;
}

TEST_F(ToolInterfaceTest, NegativeLineLimitIsAnError) {
    nlohmann::json reader = nlohmann::json::parse(readerJson());
    reader["max_lines"] = -5;

    std::string result = tool::processStopGraphTool(reader.dump(), "{}", writerJson());
    EXPECT_TRUE(startsWith(result, "Error")) << result;
    EXPECT_FALSE(fs::exists(temp_dir_ / "output" / "estaciones.ttl"));
}

TEST_F(ToolInterfaceTest, InvalidConfigIsAnError) {
    EXPECT_TRUE(startsWith(tool::processStopGraphTool("{}", "{}", writerJson()), "Error"));
    EXPECT_TRUE(startsWith(tool::processStopGraphTool("not json", "{}", writerJson()), "Error"));
}

TEST(ToolDemonstrationTest, ListsEveryPreset) {
    graph::GraphStore store;
    graph::EntityBuilder::buildSpatialEntity(io::RecordParser::parse("ST1,,Atocha,,40.5,-3.7"), store);

    std::ostringstream out;
    tool::demonstrateFiltering(store, out);

    EXPECT_NE(out.str().find("--- Stations in Madrid ---"), std::string::npos);
    EXPECT_NE(out.str().find("--- Stations in Cataluña ---"), std::string::npos);
    EXPECT_NE(out.str().find("Atocha"), std::string::npos);
}
