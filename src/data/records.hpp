#pragma once

#include "data/errors.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

// ---------------------------------------------------------------------------
// Population — the closed set of counted immune cell subtypes.
// Enumerator order is the canonical reporting order.
// ---------------------------------------------------------------------------
enum class Population : int {
    B_CELL = 0,
    CD8_T_CELL = 1,
    CD4_T_CELL = 2,
    NK_CELL = 3,
    MONOCYTE = 4,
};

inline constexpr size_t NUM_POPULATIONS = 5;

inline constexpr std::array<Population, NUM_POPULATIONS> ALL_POPULATIONS = {
    Population::B_CELL,
    Population::CD8_T_CELL,
    Population::CD4_T_CELL,
    Population::NK_CELL,
    Population::MONOCYTE,
};

inline const char* population_name(Population p) {
    switch (p) {
        case Population::B_CELL:     return "b_cell";
        case Population::CD8_T_CELL: return "cd8_t_cell";
        case Population::CD4_T_CELL: return "cd4_t_cell";
        case Population::NK_CELL:    return "nk_cell";
        case Population::MONOCYTE:   return "monocyte";
    }
    return "unknown";
}

inline Population parse_population(const std::string& name) {
    for (Population p : ALL_POPULATIONS) {
        if (name == population_name(p)) return p;
    }
    throw DataIntegrityError("unknown population '" + name + "'");
}

inline size_t population_index(Population p) {
    return static_cast<size_t>(p);
}

// ---------------------------------------------------------------------------
// Store records. Immutable once ingested; the analysis layer only reads them.
// ---------------------------------------------------------------------------
struct Subject {
    std::string subject_id;
    std::string condition;
    int age = 0;
    std::string sex;
};

struct Sample {
    std::string sample_id;
    std::string project;
    std::string subject_id;
    std::string treatment;
    std::string response;  // "yes", "no", or empty when unknown
    std::string sample_type;
    int time_from_treatment_start = 0;
};

struct PopulationCount {
    std::string sample_id;
    Population population = Population::B_CELL;
    int64_t count = 0;
};

namespace response_label {
inline constexpr const char* YES = "yes";
inline constexpr const char* NO = "no";
}  // namespace response_label
