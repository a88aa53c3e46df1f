#include "io/turtle_writer.hpp"
#include "io/namespace_utils.hpp"
#include "graph/vocabulary.hpp"
#include <cctype>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace stopgraph {
namespace io {

std::string TurtleWriter::last_error_ = "";

namespace {

// Lexical forms that Turtle accepts without a datatype suffix
bool isBareDecimal(const std::string& lexical) {
    size_t i = 0;
    if (i < lexical.size() && (lexical[i] == '+' || lexical[i] == '-')) {
        ++i;
    }
    while (i < lexical.size() && std::isdigit(static_cast<unsigned char>(lexical[i]))) {
        ++i;
    }
    if (i >= lexical.size() || lexical[i] != '.') {
        return false;
    }
    ++i;
    size_t fraction_start = i;
    while (i < lexical.size() && std::isdigit(static_cast<unsigned char>(lexical[i]))) {
        ++i;
    }
    return i == lexical.size() && i > fraction_start;
}

bool isBareInteger(const std::string& lexical) {
    size_t i = 0;
    if (i < lexical.size() && (lexical[i] == '+' || lexical[i] == '-')) {
        ++i;
    }
    size_t digits_start = i;
    while (i < lexical.size() && std::isdigit(static_cast<unsigned char>(lexical[i]))) {
        ++i;
    }
    return i == lexical.size() && i > digits_start;
}

} // namespace

bool TurtleWriter::writeToFile(const graph::GraphStore& store, const std::string& filepath) {
    try {
        std::string turtle = writeToString(store);

        std::ofstream file(filepath);
        if (!file.is_open()) {
            setError("Failed to open file for writing: " + filepath);
            return false;
        }

        file << turtle;
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

std::string TurtleWriter::writeToString(const graph::GraphStore& store) {
    const auto& prefixes = store.prefixes();
    std::ostringstream out;

    for (const auto& [prefix, uri] : prefixes) {
        out << "@prefix " << prefix << ": <" << escapeIri(uri) << "> .\n";
    }

    for (const auto& subject : store.listSubjects()) {
        out << "\n" << formatIri(subject, prefixes);

        bool first = true;
        for (const auto& triple : store.factsFor(subject)) {
            out << (first ? "\n        " : " ;\n        ");
            if (triple.predicate == graph::vocab::RDF_TYPE) {
                out << "a";
            } else {
                out << formatIri(triple.predicate, prefixes);
            }
            out << "  " << formatNode(triple.object, prefixes);
            first = false;
        }
        out << " .\n";
    }

    return out.str();
}

std::string TurtleWriter::formatNode(const graph::Node& node, const std::map<std::string, std::string>& prefixes) {
    switch (node.type) {
        case graph::NodeType::RESOURCE:
            return formatIri(node.value, prefixes);
        case graph::NodeType::LANG_LITERAL:
            return "\"" + escapeString(node.value) + "\"@" + node.language;
        case graph::NodeType::TYPED_LITERAL:
            if (node.datatype == graph::vocab::XSD_DECIMAL && isBareDecimal(node.value)) {
                return node.value;
            }
            if (node.datatype == graph::vocab::XSD_NS + "integer" && isBareInteger(node.value)) {
                return node.value;
            }
            return "\"" + escapeString(node.value) + "\"^^" + formatIri(node.datatype, prefixes);
        case graph::NodeType::PLAIN_LITERAL:
        default:
            return "\"" + escapeString(node.value) + "\"";
    }
}

std::string TurtleWriter::formatIri(const std::string& iri, const std::map<std::string, std::string>& prefixes) {
    std::optional<QualifiedName> qname = NamespaceUtils::abbreviate(iri, prefixes);
    if (qname) {
        return qname->toString();
    }
    return "<" + escapeIri(iri) + ">";
}

std::string TurtleWriter::escapeString(const std::string& value) {
    std::string escaped;
    escaped.reserve(value.size());
    for (char c : value) {
        switch (c) {
            case '\\': escaped += "\\\\"; break;
            case '"':  escaped += "\\\""; break;
            case '\n': escaped += "\\n"; break;
            case '\r': escaped += "\\r"; break;
            case '\t': escaped += "\\t"; break;
            default:   escaped += c; break;
        }
    }
    return escaped;
}

std::string TurtleWriter::escapeIri(const std::string& iri) {
    std::string escaped;
    escaped.reserve(iri.size());
    for (char c : iri) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (uc <= 0x20 || c == '<' || c == '>' || c == '"' || c == '{' || c == '}' ||
            c == '|' || c == '^' || c == '`' || c == '\\') {
            char buffer[8];
            std::snprintf(buffer, sizeof(buffer), "\\u%04X", static_cast<unsigned int>(uc));
            escaped += buffer;
        } else {
            escaped += c;
        }
    }
    return escaped;
}

} // namespace io
} // namespace stopgraph
