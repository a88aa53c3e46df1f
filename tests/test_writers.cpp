#include <gtest/gtest.h>
#include <boost/filesystem.hpp>
#include <fstream>
#include <iterator>
#include <sstream>
#include "graph/bbox_filter.hpp"
#include "graph/entity_builder.hpp"
#include "graph/graph_store.hpp"
#include "graph/vocabulary.hpp"
#include "io/graph_report.hpp"
#include "io/rdfxml_writer.hpp"
#include "io/record_parser.hpp"
#include "io/stops_reader.hpp"
#include "io/turtle_writer.hpp"
#include "io/writer_stations.hpp"

namespace fs = boost::filesystem;

using namespace stopgraph;

namespace {

class WriterTest : public ::testing::Test {
protected:
    void SetUp() override {
        io::StopsReader::registerDefaultPrefixes(store_);
        st1_ = graph::EntityBuilder::buildSpatialEntity(io::RecordParser::parse("ST1,,Atocha,,40.5,-3.7"), store_);

        temp_dir_ = fs::temp_directory_path() / fs::unique_path("stopgraph-writers-%%%%-%%%%");
        fs::create_directories(temp_dir_);
    }

    void TearDown() override {
        boost::system::error_code ec;
        fs::remove_all(temp_dir_, ec);
    }

    static std::string readFile(const fs::path& path) {
        std::ifstream file(path.string());
        return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    }

    graph::GraphStore store_;
    std::string st1_;
    fs::path temp_dir_;
};

bool contains(const std::string& text, const std::string& fragment) {
    return text.find(fragment) != std::string::npos;
}

} // namespace

TEST_F(WriterTest, TurtleUsesPrefixesAndBareDecimals) {
    std::string turtle = io::TurtleWriter::writeToString(store_);

    EXPECT_TRUE(contains(turtle, "@prefix ex: <http://www.ejemplo.com/> .\n"));
    EXPECT_TRUE(contains(turtle, "@prefix geo: <http://www.w3.org/2003/01/geo/wgs84_pos#> .\n"));
    EXPECT_TRUE(contains(turtle,
        "\nex:ST1\n"
        "        a  geo:SpatialThing ;\n"
        "        rdfs:label  \"Atocha\"@es ;\n"
        "        geo:lat  40.5 ;\n"
        "        geo:long  -3.7 .\n"));
}

TEST_F(WriterTest, TurtleQuotesNonCanonicalLiterals) {
    const std::string subject = graph::EntityBuilder::subjectFor("ST2");
    store_.append(subject, graph::vocab::RDFS_LABEL, graph::Node::langLiteral("Plaza \"Mayor\"", "es"));
    store_.append(subject, graph::vocab::GEO_LAT, graph::Node::typedLiteral("40", graph::vocab::XSD_DECIMAL));

    std::string turtle = io::TurtleWriter::writeToString(store_);
    EXPECT_TRUE(contains(turtle, "rdfs:label  \"Plaza \\\"Mayor\\\"\"@es"));
    EXPECT_TRUE(contains(turtle, "geo:lat  \"40\"^^xsd:decimal"));
}

TEST_F(WriterTest, TurtleWritesFullIriWhenLocalNameIsInvalid) {
    const std::string subject = graph::EntityBuilder::subjectFor("A B");
    store_.append(subject, graph::vocab::RDFS_LABEL, graph::Node::plainLiteral("x"));

    std::string turtle = io::TurtleWriter::writeToString(store_);
    EXPECT_TRUE(contains(turtle, "\n<http://www.ejemplo.com/A\\u0020B>\n"));
}

TEST_F(WriterTest, TurtleWritesFile) {
    fs::path path = temp_dir_ / "estaciones.ttl";
    ASSERT_TRUE(io::TurtleWriter::writeToFile(store_, path.string()));
    EXPECT_EQ(readFile(path), io::TurtleWriter::writeToString(store_));
}

TEST_F(WriterTest, TurtleReportsUnwritablePath) {
    fs::path path = temp_dir_ / "missing" / "estaciones.ttl";
    EXPECT_FALSE(io::TurtleWriter::writeToFile(store_, path.string()));
    EXPECT_TRUE(contains(io::TurtleWriter::getLastError(), path.string()));
}

TEST_F(WriterTest, RdfXmlUsesTypedNodeElements) {
    std::string xml = io::RdfXmlWriter::writeToString(store_);

    EXPECT_TRUE(contains(xml, "<rdf:RDF"));
    EXPECT_TRUE(contains(xml, "xmlns:rdf=\"http://www.w3.org/1999/02/22-rdf-syntax-ns#\""));
    EXPECT_TRUE(contains(xml, "xmlns:geo=\"http://www.w3.org/2003/01/geo/wgs84_pos#\""));
    EXPECT_TRUE(contains(xml, "<geo:SpatialThing rdf:about=\"http://www.ejemplo.com/ST1\">"));
    EXPECT_TRUE(contains(xml, "<rdfs:label xml:lang=\"es\">Atocha</rdfs:label>"));
    EXPECT_TRUE(contains(xml,
        "<geo:lat rdf:datatype=\"http://www.w3.org/2001/XMLSchema#decimal\">40.5</geo:lat>"));
    EXPECT_TRUE(contains(xml, "</geo:SpatialThing>"));
    EXPECT_TRUE(contains(xml, "</rdf:RDF>"));
}

TEST_F(WriterTest, RdfXmlGeneratesPrefixesAndEscapes) {
    const std::string subject = graph::EntityBuilder::subjectFor("OP1");
    store_.append(subject, "http://transit.example.org/vocab#operator", graph::Node::plainLiteral("Metro & Bus <Madrid>"));
    store_.append(subject, "http://transit.example.org/vocab#line", graph::Node::resource("http://transit.example.org/line/1"));

    std::string xml = io::RdfXmlWriter::writeToString(store_);

    EXPECT_TRUE(contains(xml, "xmlns:j.0=\"http://transit.example.org/vocab#\""));
    EXPECT_TRUE(contains(xml, "<rdf:Description rdf:about=\"http://www.ejemplo.com/OP1\">"));
    EXPECT_TRUE(contains(xml, "<j.0:operator>Metro &amp; Bus &lt;Madrid&gt;</j.0:operator>"));
    EXPECT_TRUE(contains(xml, "<j.0:line rdf:resource=\"http://transit.example.org/line/1\"/>"));
}

TEST_F(WriterTest, RdfXmlRejectsUnnamablePredicate) {
    store_.append(st1_, "http://transit.example.org/vocab#1st", graph::Node::plainLiteral("x"));

    EXPECT_THROW(io::RdfXmlWriter::writeToString(store_), std::runtime_error);
    EXPECT_FALSE(io::RdfXmlWriter::writeToFile(store_, (temp_dir_ / "bad.rdf").string()));
    EXPECT_FALSE(io::RdfXmlWriter::getLastError().empty());
}

TEST_F(WriterTest, ReportPrintsStatisticsAndSample) {
    std::ostringstream out;
    io::GraphReport::printStatistics(store_, out);
    EXPECT_TRUE(contains(out.str(), "Number of triples: 4"));
    EXPECT_TRUE(contains(out.str(), "Number of stations: 1"));

    std::ostringstream sample;
    io::GraphReport::printSample(store_, sample, 2);
    EXPECT_TRUE(contains(sample.str(),
        "http://www.ejemplo.com/ST1 http://www.w3.org/2000/01/rdf-schema#label \"Atocha\"@es\n"));
    EXPECT_FALSE(contains(sample.str(), "geo/wgs84_pos#lat"));
}

TEST_F(WriterTest, ReportListsFilteredEntities) {
    graph::FilterResult result = graph::BoundingBoxFilter::filterInBounds(store_, graph::defaultBounds());

    std::ostringstream out;
    io::GraphReport::printFilteredEntities(result.entities, out);
    EXPECT_TRUE(contains(out.str(), "1. Station[http://www.ejemplo.com/ST1] Atocha (40.5000, -3.7000)"));

    std::ostringstream empty;
    io::GraphReport::printFilteredEntities({}, empty);
    EXPECT_TRUE(contains(empty.str(), "No stations found in the selected area."));
}

TEST_F(WriterTest, StationPointsAsGeoJson) {
    graph::FilterResult result = graph::BoundingBoxFilter::filterInBounds(store_, graph::defaultBounds());

    io::StationPointWriterConfig config;
    config.output_file_path = (temp_dir_ / "stations.geojson").string();

    io::StationPointWriter writer;
    ASSERT_TRUE(writer.writeStations(config, result.entities)) << writer.getLastError();
    EXPECT_EQ(writer.getOutputFilePath(), config.output_file_path);

    std::string geojson = readFile(config.output_file_path);
    EXPECT_TRUE(contains(geojson, "\"stop_id\": \"ST1\""));
    EXPECT_TRUE(contains(geojson, "\"name\": \"Atocha\""));
}

TEST_F(WriterTest, StationPointsFallBackToGeoJson) {
    io::StationPointWriterConfig config;
    config.output_file_path = (temp_dir_ / "stations.unknown").string();

    io::StationPointWriter writer;
    ASSERT_TRUE(writer.writeStations(config, {})) << writer.getLastError();
    EXPECT_EQ(fs::path(writer.getOutputFilePath()).extension().string(), ".geojson");
}

TEST_F(WriterTest, StationPointsNeedPath) {
    io::StationPointWriter writer;
    EXPECT_FALSE(writer.writeStations(io::StationPointWriterConfig(), {}));
    EXPECT_FALSE(writer.getLastError().empty());
}
