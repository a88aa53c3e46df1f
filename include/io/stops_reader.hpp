#ifndef STOPGRAPH_STOPS_READER_HPP
#define STOPGRAPH_STOPS_READER_HPP

#include <istream>
#include <string>
#include <vector>
#include "graph/common.hpp"
#include "graph/errors.hpp"
#include "graph/graph_store.hpp"

namespace stopgraph {
namespace io {

// Stops reader configuration
struct StopsReaderConfig {
    std::string file_path;          // Input file path (stops.txt)
    char delimiter = ',';           // Field delimiter
    size_t max_lines = 200;         // Data lines to read after the header (0 = no limit)

    StopsReaderConfig() = default;
};

// Data line that could not be turned into an entity
struct LineFailure {
    size_t line_number;        // 1-based, counted after the header
    std::string content;
    graph::ErrorKind kind;
    std::string message;

    LineFailure(size_t number, const std::string& line, graph::ErrorKind error_kind, const std::string& msg)
        : line_number(number), content(line), kind(error_kind), message(msg) {}
};

/**
 * Ingestion loop: reads the stops table and builds one spatial entity per valid row
 */
class StopsReader {
public:
    explicit StopsReader(const StopsReaderConfig& config);
    ~StopsReader();

    // Disable copy constructor and assignment
    StopsReader(const StopsReader&) = delete;
    StopsReader& operator=(const StopsReader&) = delete;

    /**
     * Read the configured file into a store
     * @param store Target graph store
     * @return true if the file could be read, false on I/O failure
     */
    bool read(graph::GraphStore& store);

    /**
     * Read a stops table from a stream into a store.
     * The first line is the header and is discarded.
     * @param input Input stream
     * @param store Target graph store
     * @return true if the header could be read, false otherwise
     */
    bool readFromStream(std::istream& input, graph::GraphStore& store);

    /**
     * Register the default namespace prefixes (ex, geo, rdf, rdfs, xsd)
     * @param store Graph store
     */
    static void registerDefaultPrefixes(graph::GraphStore& store);

    /**
     * Get the number of rows turned into entities
     * @return Processed row count
     */
    size_t getProcessedCount() const { return processed_count_; }

    /**
     * Get the number of data lines read (blank lines included)
     * @return Line count
     */
    size_t getLineCount() const { return line_count_; }

    /**
     * Get the rows that failed
     * @return Failures in line order
     */
    const std::vector<LineFailure>& getFailures() const { return failures_; }

    /**
     * Get the header line of the last read
     * @return Header line
     */
    const std::string& getHeader() const { return header_; }

    /**
     * Get the last error message
     * @return Error message string
     */
    std::string getLastError() const { return last_error_; }

private:
    StopsReaderConfig config_;
    std::string header_;
    size_t line_count_ = 0;
    size_t processed_count_ = 0;
    std::vector<LineFailure> failures_;
    std::string last_error_;

    /**
     * Parse one data line and build its entity
     * @param line Raw line
     * @param store Target graph store
     * @throws graph::RecordError on invalid rows
     */
    void processLine(const std::string& line, graph::GraphStore& store);
};

} // namespace io
} // namespace stopgraph

#endif // STOPGRAPH_STOPS_READER_HPP
