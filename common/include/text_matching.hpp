#pragma once

#include "recognition_types.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace dre {

// OCR collaborator. Implementations throw OcrUnavailableError when the
// underlying engine cannot be reached.
class TextRecognizer {
public:
    virtual ~TextRecognizer() = default;

    // One string per detected text line
    virtual std::vector<std::string> recognize_text(const std::vector<uint8_t>& image_bytes) = 0;

    virtual bool available() const = 0;
};

struct NameMatch {
    DrugId drug_id;
    float confidence;  // [0, 1]

    NameMatch() : drug_id(0), confidence(0.0f) {}
    NameMatch(DrugId drug_id_, float confidence_)
        : drug_id(drug_id_), confidence(confidence_) {}
};

// Normalized drug names for fuzzy lookup
class NameIndex {
public:
    struct Entry {
        DrugId drug_id;
        std::u32string name;
    };

    NameIndex() = default;
    explicit NameIndex(const std::vector<DrugInfo>& drugs);

    const std::vector<Entry>& entries() const {
        return entries_;
    }

    bool empty() const {
        return entries_.empty();
    }

    size_t size() const {
        return entries_.size();
    }

private:
    std::vector<Entry> entries_;
};

// Lower-cases ASCII, drops whitespace and punctuation, decodes UTF-8
std::u32string normalize_name(const std::string& text);

// 1.0 for equal strings, otherwise 2*LCS/(|a|+|b|); containment floors at 0.8
float name_similarity(const std::u32string& a, const std::u32string& b);

// Best confidence per drug over all strings, sorted by confidence desc, drug_id asc
std::vector<NameMatch> fuzzy_match(const std::vector<std::string>& strings,
                                   const NameIndex& index,
                                   float min_confidence = 0.5f);

// Single best drug per string, deduplicated (several drugs on one prescription)
std::vector<NameMatch> best_match_per_line(const std::vector<std::string>& strings,
                                           const NameIndex& index,
                                           float min_confidence = 0.5f);

}  // namespace dre
