#include "text_matching.hpp"
#include <algorithm>
#include <map>

namespace dre {

namespace {

// Decodes UTF-8; malformed bytes are skipped
std::u32string decode_utf8(const std::string& text) {
    std::u32string out;
    out.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        const unsigned char lead = static_cast<unsigned char>(text[i]);
        char32_t cp = 0;
        size_t len = 0;

        if (lead < 0x80) {
            cp = lead;
            len = 1;
        } else if ((lead & 0xE0) == 0xC0) {
            cp = lead & 0x1F;
            len = 2;
        } else if ((lead & 0xF0) == 0xE0) {
            cp = lead & 0x0F;
            len = 3;
        } else if ((lead & 0xF8) == 0xF0) {
            cp = lead & 0x07;
            len = 4;
        } else {
            ++i;
            continue;
        }

        if (i + len > text.size()) {
            break;
        }

        bool valid = true;
        for (size_t k = 1; k < len; ++k) {
            const unsigned char cont = static_cast<unsigned char>(text[i + k]);
            if ((cont & 0xC0) != 0x80) {
                valid = false;
                break;
            }
            cp = (cp << 6) | (cont & 0x3F);
        }

        if (valid) {
            out.push_back(cp);
            i += len;
        } else {
            ++i;
        }
    }

    return out;
}

bool is_separator(char32_t cp) {
    if (cp < 0x80) {
        return !((cp >= '0' && cp <= '9') || (cp >= 'a' && cp <= 'z') || (cp >= 'A' && cp <= 'Z'));
    }
    // CJK and fullwidth punctuation, ideographic space
    return (cp >= 0x3000 && cp <= 0x303F) || (cp >= 0xFF00 && cp <= 0xFF0F) ||
           (cp >= 0xFF1A && cp <= 0xFF20);
}

size_t lcs_length(const std::u32string& a, const std::u32string& b) {
    std::vector<size_t> prev(b.size() + 1, 0);
    std::vector<size_t> curr(b.size() + 1, 0);

    for (size_t i = 1; i <= a.size(); ++i) {
        for (size_t j = 1; j <= b.size(); ++j) {
            if (a[i - 1] == b[j - 1]) {
                curr[j] = prev[j - 1] + 1;
            } else {
                curr[j] = std::max(prev[j], curr[j - 1]);
            }
        }
        std::swap(prev, curr);
    }

    return prev[b.size()];
}

bool match_before(const NameMatch& a, const NameMatch& b) {
    if (a.confidence != b.confidence) {
        return a.confidence > b.confidence;
    }
    return a.drug_id < b.drug_id;
}

}  // namespace

std::u32string normalize_name(const std::string& text) {
    std::u32string decoded = decode_utf8(text);
    std::u32string out;
    out.reserve(decoded.size());

    for (char32_t cp : decoded) {
        if (is_separator(cp)) {
            continue;
        }
        if (cp >= 'A' && cp <= 'Z') {
            cp = cp - 'A' + 'a';
        }
        out.push_back(cp);
    }

    return out;
}

float name_similarity(const std::u32string& a, const std::u32string& b) {
    if (a.empty() || b.empty()) {
        return 0.0f;
    }
    if (a == b) {
        return 1.0f;
    }

    float ratio = static_cast<float>(2.0 * lcs_length(a, b) / (a.size() + b.size()));

    // A name read off a box ("panadol") should still find "panadol tablets"
    if (a.find(b) != std::u32string::npos || b.find(a) != std::u32string::npos) {
        ratio = std::max(ratio, 0.8f);
    }

    return ratio;
}

NameIndex::NameIndex(const std::vector<DrugInfo>& drugs) {
    entries_.reserve(drugs.size() * 2);

    for (const auto& drug : drugs) {
        std::u32string chinese = normalize_name(drug.chinese_name);
        if (!chinese.empty()) {
            entries_.push_back({drug.id, std::move(chinese)});
        }
        std::u32string english = normalize_name(drug.english_name);
        if (!english.empty()) {
            entries_.push_back({drug.id, std::move(english)});
        }
    }
}

std::vector<NameMatch> fuzzy_match(const std::vector<std::string>& strings,
                                   const NameIndex& index,
                                   float min_confidence) {
    std::map<DrugId, float> best;

    for (const auto& text : strings) {
        std::u32string query = normalize_name(text);
        if (query.empty()) {
            continue;
        }

        for (const auto& entry : index.entries()) {
            float confidence = name_similarity(query, entry.name);
            if (confidence < min_confidence) {
                continue;
            }
            auto it = best.find(entry.drug_id);
            if (it == best.end() || confidence > it->second) {
                best[entry.drug_id] = confidence;
            }
        }
    }

    std::vector<NameMatch> matches;
    matches.reserve(best.size());
    for (const auto& kv : best) {
        matches.emplace_back(kv.first, kv.second);
    }
    std::sort(matches.begin(), matches.end(), match_before);

    return matches;
}

std::vector<NameMatch> best_match_per_line(const std::vector<std::string>& strings,
                                           const NameIndex& index,
                                           float min_confidence) {
    std::map<DrugId, float> best;

    for (const auto& text : strings) {
        std::vector<NameMatch> line = fuzzy_match({text}, index, min_confidence);
        if (line.empty()) {
            continue;
        }
        const NameMatch& top = line.front();
        auto it = best.find(top.drug_id);
        if (it == best.end() || top.confidence > it->second) {
            best[top.drug_id] = top.confidence;
        }
    }

    std::vector<NameMatch> matches;
    matches.reserve(best.size());
    for (const auto& kv : best) {
        matches.emplace_back(kv.first, kv.second);
    }
    std::sort(matches.begin(), matches.end(), match_before);

    return matches;
}

}  // namespace dre
