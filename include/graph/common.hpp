#ifndef STOPGRAPH_COMMON_HPP
#define STOPGRAPH_COMMON_HPP

#include <cstddef>
#include <string>
#include <vector>
#include <functional>
#include <optional>
#include <boost/geometry.hpp>
#include <boost/geometry/geometries/point.hpp>
#include <boost/geometry/geometries/box.hpp>

namespace stopgraph {
namespace graph {

// Boost Geometry namespace alias
namespace bg = boost::geometry;

// 2D geographic types: x = longitude, y = latitude (degrees)
using GeoPoint = bg::model::point<double, 2, bg::cs::cartesian>;
using GeoBox = bg::model::box<GeoPoint>;

// Node kinds that can appear in the object position of a triple
enum class NodeType {
    RESOURCE,       // Reference to another subject (IRI)
    PLAIN_LITERAL,  // Literal without language or datatype
    LANG_LITERAL,   // Literal with a language tag
    TYPED_LITERAL   // Literal with a datatype IRI
};

/**
 * Object value of a triple.
 * Literals keep their lexical form verbatim, so typed numeric values
 * carry the exact text they were created from.
 */
struct Node {
    NodeType type;
    std::string value;      // IRI for resources, lexical form for literals
    std::string language;   // Only set for LANG_LITERAL
    std::string datatype;   // Only set for TYPED_LITERAL

    Node() : type(NodeType::PLAIN_LITERAL) {}

    static Node resource(const std::string& iri) {
        return Node(NodeType::RESOURCE, iri, "", "");
    }

    static Node plainLiteral(const std::string& lexical) {
        return Node(NodeType::PLAIN_LITERAL, lexical, "", "");
    }

    static Node langLiteral(const std::string& lexical, const std::string& lang) {
        return Node(NodeType::LANG_LITERAL, lexical, lang, "");
    }

    static Node typedLiteral(const std::string& lexical, const std::string& datatype_iri) {
        return Node(NodeType::TYPED_LITERAL, lexical, "", datatype_iri);
    }

    bool isResource() const { return type == NodeType::RESOURCE; }
    bool isLiteral() const { return type != NodeType::RESOURCE; }

    /**
     * Human readable form used by the sample printer
     * e.g. "Atocha"@es, 40.5^^http://www.w3.org/2001/XMLSchema#decimal
     */
    std::string toString() const;

    bool operator==(const Node& other) const {
        return type == other.type && value == other.value &&
               language == other.language && datatype == other.datatype;
    }

    bool operator!=(const Node& other) const { return !(*this == other); }

private:
    Node(NodeType node_type, const std::string& val, const std::string& lang, const std::string& dt)
        : type(node_type), value(val), language(lang), datatype(dt) {}
};

/**
 * Hash function for Node
 */
struct NodeHash {
    std::size_t operator()(const Node& node) const {
        std::size_t h = std::hash<std::string>{}(node.value);
        h ^= std::hash<int>{}(static_cast<int>(node.type)) + 0x9e3779b9 + (h << 6) + (h >> 2);
        h ^= std::hash<std::string>{}(node.language) + 0x9e3779b9 + (h << 6) + (h >> 2);
        h ^= std::hash<std::string>{}(node.datatype) + 0x9e3779b9 + (h << 6) + (h >> 2);
        return h;
    }
};

// Triple (fact) structure
struct Triple {
    std::string subject;     // Subject IRI
    std::string predicate;   // Predicate IRI
    Node object;

    Triple(const std::string& subj, const std::string& pred, const Node& obj)
        : subject(subj), predicate(pred), object(obj) {}

    bool operator==(const Triple& other) const {
        return subject == other.subject && predicate == other.predicate && object == other.object;
    }
};

// Validated stop row from the stops table
struct StopRecord {
    std::string stop_id;          // Column 0, trimmed
    std::string name;             // Column 2, trimmed
    std::string latitude_text;    // Column 4, trimmed lexical form
    std::string longitude_text;   // Column 5, trimmed lexical form
    double latitude;
    double longitude;

    StopRecord(const std::string& id, const std::string& stop_name,
               const std::string& lat_text, const std::string& lon_text,
               double lat, double lon)
        : stop_id(id), name(stop_name), latitude_text(lat_text), longitude_text(lon_text),
          latitude(lat), longitude(lon) {}
};

/**
 * Typed view of a spatial entity reconstructed from the graph
 */
struct SpatialEntity {
    std::string subject;   // Subject IRI
    std::string name;      // rdfs:label or placeholder
    double latitude;
    double longitude;

    SpatialEntity(const std::string& subj, const std::string& entity_name, double lat, double lon)
        : subject(subj), name(entity_name), latitude(lat), longitude(lon) {}

    GeoPoint location() const { return GeoPoint(longitude, latitude); }

    /**
     * Format as "Station[<iri>] <name> (<lat>, <lon>)" with 4 decimals
     */
    std::string toString() const;
};

/**
 * Parse a complete, finite decimal number
 * @param text Text to parse (no surrounding whitespace)
 * @return Parsed value, or nullopt if text is empty, partially numeric or not finite
 */
std::optional<double> parseNumber(const std::string& text);

} // namespace graph
} // namespace stopgraph

#endif // STOPGRAPH_COMMON_HPP
