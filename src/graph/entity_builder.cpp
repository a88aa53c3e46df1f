#include "graph/entity_builder.hpp"
#include "graph/errors.hpp"
#include "graph/vocabulary.hpp"
#include <cctype>

namespace stopgraph {
namespace graph {

std::string EntityBuilder::buildSpatialEntity(const StopRecord& record, GraphStore& store) {
    const std::string subject = subjectFor(record.stop_id);

    // Build every object first so a bad coordinate leaves the store untouched
    Node type_node = Node::resource(vocab::GEO_SPATIAL_THING);
    Node label_node = Node::langLiteral(record.name, vocab::LABEL_LANGUAGE);
    Node lat_node;
    Node lon_node;
    try {
        lat_node = makeDecimalLiteral(record.latitude_text);
        lon_node = makeDecimalLiteral(record.longitude_text);
    } catch (const RecordError& e) {
        throw RecordError(ErrorKind::INVALID_COORDINATE,
                          "Error parsing coordinates for stop " + record.stop_id + ": " + e.what());
    }

    store.append(subject, vocab::RDF_TYPE, type_node);
    store.append(subject, vocab::RDFS_LABEL, label_node);
    store.append(subject, vocab::GEO_LAT, lat_node);
    store.append(subject, vocab::GEO_LONG, lon_node);

    return subject;
}

std::string EntityBuilder::subjectFor(const std::string& stop_id) {
    return vocab::EX_NS + stop_id;
}

Node EntityBuilder::makeDecimalLiteral(const std::string& lexical) {
    if (!isDecimalLexical(lexical)) {
        throw RecordError(ErrorKind::INVALID_COORDINATE,
                          "'" + lexical + "' is not a valid xsd:decimal value");
    }
    return Node::typedLiteral(lexical, vocab::XSD_DECIMAL);
}

bool EntityBuilder::isDecimalLexical(const std::string& lexical) {
    size_t i = 0;
    const size_t n = lexical.size();

    if (i < n && (lexical[i] == '+' || lexical[i] == '-')) {
        ++i;
    }

    size_t integer_digits = 0;
    while (i < n && std::isdigit(static_cast<unsigned char>(lexical[i]))) {
        ++i;
        ++integer_digits;
    }

    size_t fraction_digits = 0;
    if (i < n && lexical[i] == '.') {
        ++i;
        while (i < n && std::isdigit(static_cast<unsigned char>(lexical[i]))) {
            ++i;
            ++fraction_digits;
        }
    }

    return i == n && (integer_digits + fraction_digits) > 0;
}

} // namespace graph
} // namespace stopgraph
