//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: LexicalRanker.cpp
// Purpose: Field-weighted term scoring used by the snapshot provider's search
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <unordered_set>

#include "codebridge/index/LexicalRanker.h"

namespace codebridge {

namespace {

std::string toLower(const std::string& s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace

LexicalRanker::LexicalRanker(RankingConfig config) : config_(config) {}

std::vector<std::string> LexicalRanker::extractQueryTerms(const std::string& query) {
    std::vector<std::string> terms;
    std::unordered_set<std::string> seen;
    std::string current;
    auto flush = [&]() {
        if (!current.empty() && seen.insert(current).second) {
            terms.push_back(current);
        }
        current.clear();
    };
    for (char c : query) {
        const unsigned char uc = static_cast<unsigned char>(c);
        // Non-ASCII bytes stay inside terms so UTF-8 identifiers remain searchable.
        if (std::isalnum(uc) || uc >= 0x80) {
            current.push_back(static_cast<char>(std::tolower(uc)));
        } else {
            flush();
        }
    }
    flush();
    return terms;
}

double LexicalRanker::fieldScore(const std::string& loweredField, const std::string& term) const {
    if (loweredField.empty()) {
        return 0.0;
    }
    if (loweredField.find(term) != std::string::npos) {
        return 1.0;
    }
    // Stem hit: "authentication" still finds "authenticate".
    if (term.size() > 5) {
        const std::string stem = term.substr(0, std::max<std::size_t>(4, term.size() - 3));
        if (loweredField.find(stem) != std::string::npos) {
            return config_.partialMatchFactor;
        }
    }
    return 0.0;
}

double LexicalRanker::calculateScore(const SymbolRecord& symbol, const std::vector<std::string>& terms,
                                     const std::string& normalizedQuery) const {
    if (terms.empty()) {
        return 0.0;
    }
    const std::string name = toLower(symbol.name);
    const std::string signature = toLower(symbol.signature.value_or(""));
    const std::string doc = toLower(symbol.doc.value_or(""));
    const std::string path = toLower(symbol.file);

    double raw = 0.0;
    for (const auto& term : terms) {
        raw += fieldScore(name, term) * config_.nameBoost;
        raw += fieldScore(signature, term) * config_.signatureBoost;
        raw += fieldScore(doc, term) * config_.docBoost;
        raw += fieldScore(path, term) * config_.pathBoost;
    }
    if (raw <= 0.0) {
        return 0.0;
    }
    if (name == normalizedQuery) {
        raw += config_.exactNameBonus;
    }
    return normalizeScore(raw, terms.size());
}

double LexicalRanker::normalizeScore(double raw, std::size_t termCount) const {
    const double perTerm = config_.nameBoost + config_.signatureBoost + config_.docBoost + config_.pathBoost;
    const double maxScore = perTerm * static_cast<double>(termCount) + config_.exactNameBonus;
    if (maxScore <= 0.0) {
        return 0.0;
    }
    return std::clamp(raw / maxScore, 0.0, 1.0);
}

void LexicalRanker::rankResults(std::vector<SearchMatch>& results) {
    std::sort(results.begin(), results.end(), [](const SearchMatch& a, const SearchMatch& b) {
        if (a.score != b.score) {
            return a.score > b.score;
        }
        return a.symbol.id < b.symbol.id;
    });
}

} // namespace codebridge
