#ifndef STOPGRAPH_GRAPH_STORE_HPP
#define STOPGRAPH_GRAPH_STORE_HPP

#include <cstddef>
#include <iterator>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>
#include "graph/common.hpp"

namespace stopgraph {
namespace graph {

/**
 * Read-only range over the facts of one subject.
 * Holds positions into the store's fact log and resolves them on access.
 */
class FactRange {
public:
    class const_iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = Triple;
        using difference_type = std::ptrdiff_t;
        using pointer = const Triple*;
        using reference = const Triple&;

        const_iterator(const std::vector<Triple>* triples, std::vector<size_t>::const_iterator pos)
            : triples_(triples), pos_(pos) {}

        reference operator*() const { return (*triples_)[*pos_]; }
        pointer operator->() const { return &(*triples_)[*pos_]; }

        const_iterator& operator++() {
            ++pos_;
            return *this;
        }

        const_iterator operator++(int) {
            const_iterator tmp = *this;
            ++pos_;
            return tmp;
        }

        bool operator==(const const_iterator& other) const { return pos_ == other.pos_; }
        bool operator!=(const const_iterator& other) const { return pos_ != other.pos_; }

    private:
        const std::vector<Triple>* triples_;
        std::vector<size_t>::const_iterator pos_;
    };

    FactRange(const std::vector<Triple>& triples, const std::vector<size_t>& positions)
        : triples_(&triples), positions_(&positions) {}

    const_iterator begin() const { return const_iterator(triples_, positions_->begin()); }
    const_iterator end() const { return const_iterator(triples_, positions_->end()); }
    size_t size() const { return positions_->size(); }
    bool empty() const { return positions_->empty(); }

private:
    const std::vector<Triple>* triples_;
    const std::vector<size_t>* positions_;
};

/**
 * Append-only triple store.
 *
 * The fact log is the only source of truth. The subject index keeps
 * positions into the log in insertion order, and the (predicate, object)
 * index keeps subjects in the order they first asserted the pair.
 * Duplicate facts are retained.
 */
class GraphStore {
public:
    GraphStore() = default;
    ~GraphStore() = default;

    // Disable copy constructor and assignment
    GraphStore(const GraphStore&) = delete;
    GraphStore& operator=(const GraphStore&) = delete;

    GraphStore(GraphStore&&) = default;
    GraphStore& operator=(GraphStore&&) = default;

    /**
     * Append one fact and update both indexes
     * @param triple Fact to append
     */
    void append(const Triple& triple);

    /**
     * Append one fact built from its parts
     * @param subject Subject IRI
     * @param predicate Predicate IRI
     * @param object Object node
     */
    void append(const std::string& subject, const std::string& predicate, const Node& object);

    /**
     * Get the facts of a subject in insertion order
     * @param subject Subject IRI
     * @return Range of facts (empty if the subject is unknown)
     */
    FactRange factsFor(const std::string& subject) const;

    /**
     * Get the subjects asserting an exact (predicate, object) pair
     * @param predicate Predicate IRI
     * @param object Object node
     * @return Subjects in first-assertion order (empty if none)
     */
    const std::vector<std::string>& subjectsWith(const std::string& predicate, const Node& object) const;

    /**
     * Get the object of the first fact matching (subject, predicate)
     * @param subject Subject IRI
     * @param predicate Predicate IRI
     * @return Object node if found
     */
    std::optional<Node> firstObject(const std::string& subject, const std::string& predicate) const;

    /**
     * Get all facts in insertion order
     * @return Fact log
     */
    const std::vector<Triple>& listAllFacts() const { return triples_; }

    /**
     * Get subjects in order of first appearance
     * @return Vector of subject IRIs
     */
    const std::vector<std::string>& listSubjects() const { return subject_order_; }

    /**
     * Get total number of facts
     * @return Fact count
     */
    size_t size() const { return triples_.size(); }

    /**
     * Get number of distinct subjects
     * @return Subject count
     */
    size_t subjectCount() const { return subject_order_.size(); }

    bool empty() const { return triples_.empty(); }

    /**
     * Register a namespace prefix used by encoders for abbreviation
     * @param prefix Short prefix (e.g. "geo")
     * @param uri Namespace URI
     */
    void setPrefix(const std::string& prefix, const std::string& uri);

    /**
     * Replace the prefix map (used when deriving a store from another one)
     * @param prefixes Prefix to URI map
     */
    void setPrefixes(const std::map<std::string, std::string>& prefixes);

    /**
     * Get the prefix to URI map
     * @return Prefix map ordered by prefix
     */
    const std::map<std::string, std::string>& prefixes() const { return prefixes_; }

private:
    // Key of the (predicate, object) index
    struct PredicateObjectKey {
        std::string predicate;
        Node object;

        bool operator==(const PredicateObjectKey& other) const {
            return predicate == other.predicate && object == other.object;
        }
    };

    struct PredicateObjectKeyHash {
        std::size_t operator()(const PredicateObjectKey& key) const {
            std::size_t h = std::hash<std::string>{}(key.predicate);
            return h ^ (NodeHash{}(key.object) << 1);
        }
    };

    // Ordered set of subjects for one (predicate, object) pair
    struct SubjectSet {
        std::vector<std::string> ordered;
        std::unordered_set<std::string> members;
    };

    std::vector<Triple> triples_;
    std::unordered_map<std::string, std::vector<size_t>> subject_index_;
    std::vector<std::string> subject_order_;
    std::unordered_map<PredicateObjectKey, SubjectSet, PredicateObjectKeyHash> predicate_object_index_;
    std::map<std::string, std::string> prefixes_;
};

} // namespace graph
} // namespace stopgraph

#endif // STOPGRAPH_GRAPH_STORE_HPP
