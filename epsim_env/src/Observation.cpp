#include <epsim_core/Throws.hpp>
#include <epsim_core/Utils.hpp>
#include <epsim_env/Observation.hpp>

namespace epsim {

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
const ObservationDict::Entry *ObservationDict::find(const std::string &key) const {
    for (const auto &entry : entries_) {
        if (entry.key == key) {
            return &entry;
        }
    }
    return nullptr;
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
ObservationDict::Entry *ObservationDict::find(const std::string &key) {
    for (auto &entry : entries_) {
        if (entry.key == key) {
            return &entry;
        }
    }
    return nullptr;
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
void ObservationDict::set(const std::string &key, ObservationLeaf value) {
    if (auto *entry = find(key)) {
        entry->value = std::move(value);
        return;
    }
    entries_.push_back({key, std::move(value)});
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
void ObservationDict::set(const std::string &key, ObservationDict value) {
    if (auto *entry = find(key)) {
        entry->value = std::move(value);
        return;
    }
    entries_.push_back({key, std::move(value)});
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
ObservationDict &ObservationDict::child(const std::string &key) {
    if (find(key) == nullptr) {
        entries_.push_back({key, ObservationDict()});
    }
    return dict(key);
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
bool ObservationDict::contains(const std::string &key) const {
    return find(key) != nullptr;
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
bool ObservationDict::isDict(const std::string &key) const {
    const auto *entry = find(key);
    return entry != nullptr && std::holds_alternative<ObservationDict>(entry->value);
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
const ObservationLeaf &ObservationDict::leaf(const std::string &key) const {
    const auto *entry = find(key);
    if (entry == nullptr || !std::holds_alternative<ObservationLeaf>(entry->value)) {
        EPSIM_THROW_AS(LookupError, "Observation has no leaf '{}'", key);
    }
    return std::get<ObservationLeaf>(entry->value);
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
ObservationLeaf &ObservationDict::leaf(const std::string &key) {
    auto *entry = find(key);
    if (entry == nullptr || !std::holds_alternative<ObservationLeaf>(entry->value)) {
        EPSIM_THROW_AS(LookupError, "Observation has no leaf '{}'", key);
    }
    return std::get<ObservationLeaf>(entry->value);
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
const ObservationDict &ObservationDict::dict(const std::string &key) const {
    const auto *entry = find(key);
    if (entry == nullptr || !std::holds_alternative<ObservationDict>(entry->value)) {
        EPSIM_THROW_AS(LookupError, "Observation has no nested record '{}'", key);
    }
    return std::get<ObservationDict>(entry->value);
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
ObservationDict &ObservationDict::dict(const std::string &key) {
    auto *entry = find(key);
    if (entry == nullptr || !std::holds_alternative<ObservationDict>(entry->value)) {
        EPSIM_THROW_AS(LookupError, "Observation has no nested record '{}'", key);
    }
    return std::get<ObservationDict>(entry->value);
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
ObservationLeaf ObservationDict::pop(const std::string &key) {
    ObservationLeaf value = std::move(leaf(key));
    for (auto it = entries_.begin(); it != entries_.end(); ++it) {
        if (it->key == key) {
            entries_.erase(it);
            break;
        }
    }
    return value;
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
std::vector<std::string> ObservationDict::keys() const {
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto &entry : entries_) {
        out.push_back(entry.key);
    }
    return out;
}

size_t ObservationDict::size() const {
    return entries_.size();
}

bool ObservationDict::empty() const {
    return entries_.empty();
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
static void collectVectors(const ObservationDict &dict, const std::string &prefix,
                           std::vector<std::reference_wrapper<const vector_t>> &out) {
    for (const auto &entry : dict.entries()) {
        const std::string path = prefix.empty() ? entry.key : prefix + "/" + entry.key;
        if (const auto *nested = std::get_if<ObservationDict>(&entry.value)) {
            collectVectors(*nested, path, out);
            continue;
        }
        const auto &leaf = std::get<ObservationLeaf>(entry.value);
        const auto *vec = std::get_if<vector_t>(&leaf);
        if (vec == nullptr) {
            EPSIM_THROW_AS(ShapeMismatchError, "Cannot flatten observation leaf '{}': only vectors can be flattened",
                           path);
        }
        out.push_back(std::cref(*vec));
    }
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
vector_t flattenStateDict(const ObservationDict &dict) {
    std::vector<std::reference_wrapper<const vector_t>> vectors;
    collectVectors(dict, "", vectors);
    return vvstack(vectors);
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
std::string toString(ObservationDtype dtype) {
    switch (dtype) {
        case ObservationDtype::FLOAT64:
            return "float64";
        case ObservationDtype::FLOAT32:
            return "float32";
        case ObservationDtype::UINT32:
            return "uint32";
    }
    return "unknown";
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
Box boxOf(const ObservationLeaf &leaf) {
    if (const auto *vec = std::get_if<vector_t>(&leaf)) {
        return {{static_cast<long>(vec->size())}, ObservationDtype::FLOAT64};
    }
    if (const auto *mat = std::get_if<matrix_t>(&leaf)) {
        return {{static_cast<long>(mat->rows()), static_cast<long>(mat->cols())}, ObservationDtype::FLOAT64};
    }
    if (const auto *image = std::get_if<engine::FloatImage>(&leaf)) {
        return {{image->height, image->width, image->channels}, ObservationDtype::FLOAT32};
    }
    const auto &image = std::get<engine::UintImage>(leaf);
    return {{image.height, image.width, image.channels}, ObservationDtype::UINT32};
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
static void collectBoxes(const ObservationDict &dict, const std::string &prefix,
                         std::vector<std::pair<std::string, Box>> &out) {
    for (const auto &entry : dict.entries()) {
        const std::string path = prefix.empty() ? entry.key : prefix + "/" + entry.key;
        if (const auto *nested = std::get_if<ObservationDict>(&entry.value)) {
            collectBoxes(*nested, path, out);
        } else {
            out.emplace_back(path, boxOf(std::get<ObservationLeaf>(entry.value)));
        }
    }
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
ObservationSpace ObservationSpace::fromObservation(const Observation &observation) {
    ObservationSpace space;
    if (const auto *flat = std::get_if<vector_t>(&observation)) {
        space.flat_ = true;
        space.boxes_.emplace_back("", Box{{static_cast<long>(flat->size())}, ObservationDtype::FLOAT64});
    } else {
        collectBoxes(std::get<ObservationDict>(observation), "", space.boxes_);
    }
    return space;
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
bool ObservationSpace::contains(const Observation &observation) const {
    const ObservationSpace other = fromObservation(observation);
    return flat_ == other.flat_ && boxes_ == other.boxes_;
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
const Box *ObservationSpace::find(const std::string &path) const {
    for (const auto &item : boxes_) {
        if (item.first == path) {
            return &item.second;
        }
    }
    return nullptr;
}

}  // namespace epsim
