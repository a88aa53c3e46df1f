#include "io/graph_report.hpp"
#include "graph/vocabulary.hpp"

namespace stopgraph {
namespace io {

void GraphReport::printStatistics(const graph::GraphStore& store, std::ostream& out) {
    out << "Graph statistics:" << std::endl;
    out << "Number of triples: " << store.size() << std::endl;
    out << "Number of stations: " << countSpatialEntities(store) << std::endl;
}

void GraphReport::printSample(const graph::GraphStore& store, std::ostream& out, size_t limit) {
    out << "Graph sample (first " << limit << " triples):" << std::endl;

    size_t count = 0;
    for (const auto& triple : store.listAllFacts()) {
        if (count >= limit) {
            break;
        }
        out << triple.subject << " " << triple.predicate << " " << triple.object.toString() << std::endl;
        count++;
    }
}

void GraphReport::printFilteredEntities(const std::vector<graph::SpatialEntity>& entities, std::ostream& out) {
    out << "\nStations in the selected area:" << std::endl;
    if (entities.empty()) {
        out << "No stations found in the selected area." << std::endl;
        return;
    }

    for (size_t i = 0; i < entities.size(); ++i) {
        out << (i + 1) << ". " << entities[i].toString() << std::endl;
    }
}

size_t GraphReport::countSpatialEntities(const graph::GraphStore& store) {
    return store.subjectsWith(graph::vocab::RDF_TYPE, graph::Node::resource(graph::vocab::GEO_SPATIAL_THING)).size();
}

} // namespace io
} // namespace stopgraph
