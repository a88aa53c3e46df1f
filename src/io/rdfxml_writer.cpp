#include "io/rdfxml_writer.hpp"
#include "io/namespace_utils.hpp"
#include "graph/vocabulary.hpp"
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <unordered_map>
#include <vector>

namespace stopgraph {
namespace io {

std::string RdfXmlWriter::last_error_ = "";

namespace {

// Subject layout computed before anything is written
struct SubjectLayout {
    std::string subject;
    std::string node_element;              // Typed node element or rdf:Description
    std::optional<size_t> type_position;   // Fact folded into the node element
    std::vector<std::string> property_elements;  // One per fact, empty for the folded one
};

} // namespace

bool RdfXmlWriter::writeToFile(const graph::GraphStore& store, const std::string& filepath) {
    try {
        std::string xml = writeToString(store);

        std::ofstream file(filepath);
        if (!file.is_open()) {
            setError("Failed to open file for writing: " + filepath);
            return false;
        }

        file << xml;
        file.close();

        if (file.fail()) {
            setError("Failed to write file: " + filepath);
            return false;
        }

        std::cout << "Graph exported to: " << filepath << std::endl;
        return true;

    } catch (const std::exception& e) {
        setError("Error writing file " + filepath + ": " + e.what());
        return false;
    }
}

std::string RdfXmlWriter::writeToString(const graph::GraphStore& store) {
    std::map<std::string, std::string> namespaces = store.prefixes();
    namespaces["rdf"] = graph::vocab::RDF_NS;

    // First pass: resolve every element name so generated prefixes are known
    std::vector<SubjectLayout> layouts;
    layouts.reserve(store.subjectCount());

    for (const auto& subject : store.listSubjects()) {
        SubjectLayout layout;
        layout.subject = subject;
        layout.node_element = "rdf:Description";

        size_t index = 0;
        for (const auto& triple : store.factsFor(subject)) {
            if (!layout.type_position && triple.predicate == graph::vocab::RDF_TYPE &&
                triple.object.isResource()) {
                std::string type_name = elementName(triple.object.value, namespaces);
                if (!type_name.empty()) {
                    layout.node_element = type_name;
                    layout.type_position = index;
                    layout.property_elements.emplace_back();
                    index++;
                    continue;
                }
            }

            std::string property_name = elementName(triple.predicate, namespaces);
            if (property_name.empty()) {
                throw std::runtime_error("Predicate cannot be written as an XML element: " + triple.predicate);
            }
            layout.property_elements.push_back(property_name);
            index++;
        }

        layouts.push_back(std::move(layout));
    }

    std::ostringstream out;
    out << "<rdf:RDF";
    for (const auto& [prefix, uri] : namespaces) {
        out << "\n    xmlns:" << prefix << "=\"" << escapeXml(uri) << "\"";
    }
    out << ">\n";

    for (const auto& layout : layouts) {
        out << "  <" << layout.node_element << " rdf:about=\"" << escapeXml(layout.subject) << "\">\n";

        size_t index = 0;
        for (const auto& triple : store.factsFor(layout.subject)) {
            if (layout.type_position && *layout.type_position == index) {
                index++;
                continue;
            }

            const std::string& name = layout.property_elements[index];
            const graph::Node& object = triple.object;

            switch (object.type) {
                case graph::NodeType::RESOURCE:
                    out << "    <" << name << " rdf:resource=\"" << escapeXml(object.value) << "\"/>\n";
                    break;
                case graph::NodeType::LANG_LITERAL:
                    out << "    <" << name << " xml:lang=\"" << escapeXml(object.language) << "\">"
                        << escapeXml(object.value) << "</" << name << ">\n";
                    break;
                case graph::NodeType::TYPED_LITERAL:
                    out << "    <" << name << " rdf:datatype=\"" << escapeXml(object.datatype) << "\">"
                        << escapeXml(object.value) << "</" << name << ">\n";
                    break;
                case graph::NodeType::PLAIN_LITERAL:
                default:
                    out << "    <" << name << ">" << escapeXml(object.value) << "</" << name << ">\n";
                    break;
            }
            index++;
        }

        out << "  </" << layout.node_element << ">\n";
    }

    out << "</rdf:RDF>\n";
    return out.str();
}

std::string RdfXmlWriter::elementName(const std::string& iri, std::map<std::string, std::string>& namespaces) {
    std::optional<QualifiedName> qname = NamespaceUtils::abbreviate(iri, namespaces, true);
    if (qname) {
        return qname->toString();
    }

    auto [ns, local] = NamespaceUtils::splitIri(iri);
    if (ns.empty() || !NamespaceUtils::isXmlLocalName(local)) {
        return "";
    }

    // Generated prefixes: j.0, j.1, ...
    size_t counter = 0;
    std::string prefix;
    do {
        prefix = "j." + std::to_string(counter++);
    } while (namespaces.count(prefix) > 0);

    namespaces[prefix] = ns;
    return prefix + ":" + local;
}

std::string RdfXmlWriter::escapeXml(const std::string& value) {
    std::string escaped;
    escaped.reserve(value.size());
    for (char c : value) {
        switch (c) {
            case '&':  escaped += "&amp;"; break;
            case '<':  escaped += "&lt;"; break;
            case '>':  escaped += "&gt;"; break;
            case '"':  escaped += "&quot;"; break;
            case '\n': escaped += "&#10;"; break;
            case '\r': escaped += "&#13;"; break;
            default:   escaped += c; break;
        }
    }
    return escaped;
}

} // namespace io
} // namespace stopgraph
