#ifndef STOPGRAPH_VOCABULARY_HPP
#define STOPGRAPH_VOCABULARY_HPP

#include <string>

namespace stopgraph {
namespace graph {
namespace vocab {

// Namespaces
inline const std::string RDF_NS = "http://www.w3.org/1999/02/22-rdf-syntax-ns#";
inline const std::string RDFS_NS = "http://www.w3.org/2000/01/rdf-schema#";
inline const std::string XSD_NS = "http://www.w3.org/2001/XMLSchema#";
inline const std::string GEO_NS = "http://www.w3.org/2003/01/geo/wgs84_pos#";
inline const std::string EX_NS = "http://www.ejemplo.com/";

// Reserved predicates and classes for spatial entities
inline const std::string RDF_TYPE = RDF_NS + "type";
inline const std::string RDFS_LABEL = RDFS_NS + "label";
inline const std::string GEO_LAT = GEO_NS + "lat";
inline const std::string GEO_LONG = GEO_NS + "long";
inline const std::string GEO_SPATIAL_THING = GEO_NS + "SpatialThing";
inline const std::string XSD_DECIMAL = XSD_NS + "decimal";

// Language tag attached to stop labels
inline const std::string LABEL_LANGUAGE = "es";

// Label used when an entity has no rdfs:label
inline const std::string UNNAMED_LABEL = "Sin nombre";

} // namespace vocab
} // namespace graph
} // namespace stopgraph

#endif // STOPGRAPH_VOCABULARY_HPP
