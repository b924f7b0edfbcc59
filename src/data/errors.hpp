#pragma once

#include <stdexcept>
#include <string>

// ---------------------------------------------------------------------------
// DataIntegrityError — counts for a sample cannot produce percentages
// (zero total, missing/duplicate population, unknown population name).
// ---------------------------------------------------------------------------
class DataIntegrityError : public std::runtime_error {
public:
    explicit DataIntegrityError(const std::string& what)
        : std::runtime_error("data integrity: " + what) {}
};

// ---------------------------------------------------------------------------
// StoreAccessError — the record store could not be opened or read.
// Surfaced unchanged; callers do not retry.
// ---------------------------------------------------------------------------
class StoreAccessError : public std::runtime_error {
public:
    explicit StoreAccessError(const std::string& what)
        : std::runtime_error("store access: " + what) {}
};
