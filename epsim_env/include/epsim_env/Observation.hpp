#pragma once

#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <epsim_core/Types.hpp>
#include <epsim_engine/Texture.hpp>

namespace epsim {

/** Leaf of an observation record */
using ObservationLeaf = std::variant<vector_t, matrix_t, engine::FloatImage, engine::UintImage>;

/**
 * @brief Nested, insertion-ordered mapping from keys to observation leaves or nested mappings.
 * Re-setting an existing key keeps its position.
 */
class ObservationDict {
   public:
    struct Entry;

    /** Set a leaf, replacing any existing value under key */
    void set(const std::string &key, ObservationLeaf value);

    /** Set a nested mapping, replacing any existing value under key */
    void set(const std::string &key, ObservationDict value);

    /** Nested mapping under key, created empty if absent. Throws LookupError if key holds a leaf. */
    ObservationDict &child(const std::string &key);

    bool contains(const std::string &key) const;
    bool isDict(const std::string &key) const;

    /** Leaf under key, throws LookupError if absent or nested */
    const ObservationLeaf &leaf(const std::string &key) const;
    ObservationLeaf &leaf(const std::string &key);

    /** Nested mapping under key, throws LookupError if absent or a leaf */
    const ObservationDict &dict(const std::string &key) const;
    ObservationDict &dict(const std::string &key);

    /** Remove and return the leaf under key, throws LookupError if absent or nested */
    ObservationLeaf pop(const std::string &key);

    std::vector<std::string> keys() const;
    const std::vector<Entry> &entries() const { return entries_; }

    size_t size() const;
    bool empty() const;

   private:
    const Entry *find(const std::string &key) const;
    Entry *find(const std::string &key);

    std::vector<Entry> entries_;
};

struct ObservationDict::Entry {
    std::string key;
    std::variant<ObservationLeaf, ObservationDict> value;
};

/** Observation returned by the environment: a nested record, or a flat vector in "state" mode */
using Observation = std::variant<ObservationDict, vector_t>;

/**
 * @brief Concatenate all vector leaves of a record, visiting keys in insertion order. Nested mappings are visited
 * depth first. Any other leaf kind throws ShapeMismatchError.
 */
vector_t flattenStateDict(const ObservationDict &dict);

/** Element type of an observation leaf */
enum class ObservationDtype { FLOAT64, FLOAT32, UINT32 };

std::string toString(ObservationDtype dtype);

struct Box {
    std::vector<long> shape;
    ObservationDtype dtype;

    bool operator==(const Box &other) const { return shape == other.shape && dtype == other.dtype; }
    bool operator!=(const Box &other) const { return !(*this == other); }
};

/** Shape and element type of a leaf */
Box boxOf(const ObservationLeaf &leaf);

/**
 * @brief Static description of the observations of an environment: one box per leaf, keyed by its '/'-separated path
 */
class ObservationSpace {
   public:
    ObservationSpace() = default;

    static ObservationSpace fromObservation(const Observation &observation);

    /** True if observation has exactly the same leaves, shapes and element types */
    bool contains(const Observation &observation) const;

    /** Box of the leaf at path, nullptr if absent. The path of a flat observation is "". */
    const Box *find(const std::string &path) const;

    const std::vector<std::pair<std::string, Box>> &getBoxes() const { return boxes_; }
    bool isFlat() const { return flat_; }
    size_t size() const { return boxes_.size(); }

   private:
    bool flat_ = false;
    std::vector<std::pair<std::string, Box>> boxes_;
};

}  // namespace epsim
