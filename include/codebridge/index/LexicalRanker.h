//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: LexicalRanker.h
// Purpose: Field-weighted term scoring used by the snapshot provider's search
//==========================================================================================================

#pragma once

#include <string>
#include <vector>

#include "codebridge/index/IndexTypes.h"

namespace codebridge {

struct RankingConfig {
    double nameBoost{3.0};
    double signatureBoost{1.5};
    double docBoost{1.0};
    double pathBoost{0.5};
    double exactNameBonus{2.0};
    double partialMatchFactor{0.5}; // credit for a stem (prefix) hit instead of the full term
};

class LexicalRanker {
public:
    explicit LexicalRanker(RankingConfig config = {});

    // Lower-cased alphanumeric terms of a free-text query, duplicates removed, order kept.
    static std::vector<std::string> extractQueryTerms(const std::string& query);

    // Score in [0,1]; 0 means no term matched any field.
    double calculateScore(const SymbolRecord& symbol, const std::vector<std::string>& terms,
                          const std::string& normalizedQuery) const;

    // Descending score, ties broken by ascending symbol id.
    static void rankResults(std::vector<SearchMatch>& results);

private:
    double fieldScore(const std::string& loweredField, const std::string& term) const;
    double normalizeScore(double raw, std::size_t termCount) const;

    RankingConfig config_;
};

} // namespace codebridge
