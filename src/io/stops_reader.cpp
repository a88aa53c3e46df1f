#include "io/stops_reader.hpp"
#include "io/record_parser.hpp"
#include "graph/entity_builder.hpp"
#include "graph/vocabulary.hpp"
#include <fstream>
#include <iostream>

namespace stopgraph {
namespace io {

StopsReader::StopsReader(const StopsReaderConfig& config)
    : config_(config) {
}

StopsReader::~StopsReader() = default;

bool StopsReader::read(graph::GraphStore& store) {
    std::cout << "Processing file: " << config_.file_path << std::endl;

    std::ifstream file(config_.file_path);
    if (!file.is_open()) {
        last_error_ = "Failed to open stops file: " + config_.file_path;
        std::cerr << "Error reading file: " << last_error_ << std::endl;
        return false;
    }

    return readFromStream(file, store);
}

bool StopsReader::readFromStream(std::istream& input, graph::GraphStore& store) {
    header_.clear();
    line_count_ = 0;
    processed_count_ = 0;
    failures_.clear();
    last_error_.clear();

    registerDefaultPrefixes(store);

    if (!std::getline(input, header_)) {
        last_error_ = "Stops table is empty, no header line found";
        std::cerr << "Error: " << last_error_ << std::endl;
        return false;
    }
    std::cout << "Header: " << header_ << std::endl;

    std::string line;
    while ((config_.max_lines == 0 || line_count_ < config_.max_lines) && std::getline(input, line)) {
        line_count_++;

        if (RecordParser::isBlank(line)) {
            continue;
        }

        try {
            processLine(line, store);
            processed_count_++;
        } catch (const graph::RecordError& e) {
            std::cerr << "Error processing line " << line_count_ << ": " << line << std::endl;
            std::cerr << "Error: " << e.what() << std::endl;
            failures_.emplace_back(line_count_, line, e.kind(), e.what());
        }
    }

    if (input.bad()) {
        last_error_ = "I/O error while reading stops table";
        std::cerr << "Error: " << last_error_ << std::endl;
        return false;
    }

    std::cout << "Lines processed: " << processed_count_ << " of " << line_count_ << std::endl;
    return true;
}

void StopsReader::processLine(const std::string& line, graph::GraphStore& store) {
    graph::StopRecord record = RecordParser::parse(line, config_.delimiter);
    graph::EntityBuilder::buildSpatialEntity(record, store);
}

void StopsReader::registerDefaultPrefixes(graph::GraphStore& store) {
    store.setPrefix("ex", graph::vocab::EX_NS);
    store.setPrefix("geo", graph::vocab::GEO_NS);
    store.setPrefix("rdf", graph::vocab::RDF_NS);
    store.setPrefix("rdfs", graph::vocab::RDFS_NS);
    store.setPrefix("xsd", graph::vocab::XSD_NS);
}

} // namespace io
} // namespace stopgraph
