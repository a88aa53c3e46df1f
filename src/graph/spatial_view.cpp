#include "graph/spatial_view.hpp"
#include "graph/vocabulary.hpp"
#include <iostream>

namespace stopgraph {
namespace graph {

SpatialListing SpatialIndexView::listSpatialEntities(const GraphStore& store) {
    SpatialListing listing;

    const auto& subjects = store.subjectsWith(vocab::RDF_TYPE, Node::resource(vocab::GEO_SPATIAL_THING));
    listing.entities.reserve(subjects.size());

    for (const auto& subject : subjects) {
        listing.total_examined++;
        try {
            listing.entities.push_back(extract(store, subject));
        } catch (const RecordError& e) {
            std::cerr << "Error processing station " << subject << ": " << e.what() << std::endl;
            listing.failures.emplace_back(subject, e.kind(), e.what());
        }
    }

    return listing;
}

SpatialEntity SpatialIndexView::extract(const GraphStore& store, const std::string& subject) {
    std::optional<Node> label = store.firstObject(subject, vocab::RDFS_LABEL);
    std::string name = (label && label->isLiteral()) ? label->value : vocab::UNNAMED_LABEL;

    std::optional<Node> lat = store.firstObject(subject, vocab::GEO_LAT);
    if (!lat) {
        throw RecordError(ErrorKind::MISSING_COORDINATE, "Missing property geo:lat");
    }
    double latitude = coordinateValue(*lat, subject, "geo:lat");

    std::optional<Node> lon = store.firstObject(subject, vocab::GEO_LONG);
    if (!lon) {
        throw RecordError(ErrorKind::MISSING_COORDINATE, "Missing property geo:long");
    }
    double longitude = coordinateValue(*lon, subject, "geo:long");

    return SpatialEntity(subject, name, latitude, longitude);
}

double SpatialIndexView::coordinateValue(const Node& node, const std::string& subject, const std::string& property) {
    std::optional<double> value;
    if (node.isLiteral()) {
        value = parseNumber(node.value);
    }
    if (!value) {
        throw RecordError(ErrorKind::INVALID_COORDINATE,
                          "Property " + property + " of " + subject + " is not numeric: " + node.toString());
    }
    return *value;
}

} // namespace graph
} // namespace stopgraph
