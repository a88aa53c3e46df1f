#include "graph/graph_store.hpp"

namespace stopgraph {
namespace graph {

namespace {
const std::vector<size_t> EMPTY_POSITIONS;
const std::vector<std::string> EMPTY_SUBJECTS;
}

void GraphStore::append(const Triple& triple) {
    size_t position = triples_.size();
    triples_.push_back(triple);

    // Subject index
    auto it = subject_index_.find(triple.subject);
    if (it == subject_index_.end()) {
        subject_order_.push_back(triple.subject);
        subject_index_.emplace(triple.subject, std::vector<size_t>{position});
    } else {
        it->second.push_back(position);
    }

    // (predicate, object) index
    SubjectSet& subjects = predicate_object_index_[PredicateObjectKey{triple.predicate, triple.object}];
    if (subjects.members.insert(triple.subject).second) {
        subjects.ordered.push_back(triple.subject);
    }
}

void GraphStore::append(const std::string& subject, const std::string& predicate, const Node& object) {
    append(Triple(subject, predicate, object));
}

FactRange GraphStore::factsFor(const std::string& subject) const {
    auto it = subject_index_.find(subject);
    if (it == subject_index_.end()) {
        return FactRange(triples_, EMPTY_POSITIONS);
    }
    return FactRange(triples_, it->second);
}

const std::vector<std::string>& GraphStore::subjectsWith(const std::string& predicate, const Node& object) const {
    auto it = predicate_object_index_.find(PredicateObjectKey{predicate, object});
    if (it == predicate_object_index_.end()) {
        return EMPTY_SUBJECTS;
    }
    return it->second.ordered;
}

std::optional<Node> GraphStore::firstObject(const std::string& subject, const std::string& predicate) const {
    for (const auto& triple : factsFor(subject)) {
        if (triple.predicate == predicate) {
            return triple.object;
        }
    }
    return std::nullopt;
}

void GraphStore::setPrefix(const std::string& prefix, const std::string& uri) {
    prefixes_[prefix] = uri;
}

void GraphStore::setPrefixes(const std::map<std::string, std::string>& prefixes) {
    prefixes_ = prefixes;
}

} // namespace graph
} // namespace stopgraph
