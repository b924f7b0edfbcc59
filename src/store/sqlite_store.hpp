#pragma once

#include "store/record_store.hpp"

#include <sqlite3.h>

#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// SqliteRecordStore — reads the subjects / samples / counts tables written by
// the ingestion process. The database is opened read-only for each call and
// closed when the call returns or throws.
// ---------------------------------------------------------------------------
class SqliteRecordStore : public RecordStore {
public:
    explicit SqliteRecordStore(std::string db_path) : db_path_(std::move(db_path)) {}

    std::vector<Subject> subjects() const override {
        std::vector<Subject> out;
        query("SELECT subject_id, condition, age, sex FROM subjects ORDER BY subject_id",
              [&](sqlite3_stmt* stmt) {
                  Subject s;
                  s.subject_id = text_column(stmt, 0);
                  s.condition = text_column(stmt, 1);
                  s.age = sqlite3_column_int(stmt, 2);
                  s.sex = text_column(stmt, 3);
                  out.push_back(std::move(s));
              });
        return out;
    }

    std::vector<Sample> samples() const override {
        std::vector<Sample> out;
        query("SELECT sample_id, project, subject_id, treatment, response, sample_type, "
              "time_from_treatment_start FROM samples ORDER BY sample_id",
              [&](sqlite3_stmt* stmt) {
                  Sample s;
                  s.sample_id = text_column(stmt, 0);
                  s.project = text_column(stmt, 1);
                  s.subject_id = text_column(stmt, 2);
                  s.treatment = text_column(stmt, 3);
                  s.response = text_column(stmt, 4);
                  s.sample_type = text_column(stmt, 5);
                  s.time_from_treatment_start = sqlite3_column_int(stmt, 6);
                  out.push_back(std::move(s));
              });
        return out;
    }

    std::vector<PopulationCount> population_counts() const override {
        std::vector<PopulationCount> out;
        query("SELECT sample_id, population, count FROM counts ORDER BY sample_id, population",
              [&](sqlite3_stmt* stmt) {
                  PopulationCount c;
                  c.sample_id = text_column(stmt, 0);
                  c.population = parse_population(text_column(stmt, 1));
                  c.count = sqlite3_column_int64(stmt, 2);
                  out.push_back(std::move(c));
              });
        return out;
    }

    std::string snapshot_id() const override {
        return "sqlite:" + store_util::file_fingerprint(db_path_);
    }

    const std::string& path() const { return db_path_; }

private:
    using DbHandle = std::unique_ptr<sqlite3, decltype(&sqlite3_close)>;
    using StmtHandle = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

    std::string db_path_;

    DbHandle open() const {
        sqlite3* raw = nullptr;
        int rc = sqlite3_open_v2(db_path_.c_str(), &raw, SQLITE_OPEN_READONLY, nullptr);
        DbHandle db(raw, &sqlite3_close);
        if (rc != SQLITE_OK) {
            std::string msg = raw ? sqlite3_errmsg(raw) : sqlite3_errstr(rc);
            throw StoreAccessError("cannot open " + db_path_ + ": " + msg);
        }
        return db;
    }

    void query(const std::string& sql, const std::function<void(sqlite3_stmt*)>& on_row) const {
        auto db = open();
        sqlite3_stmt* raw = nullptr;
        if (sqlite3_prepare_v2(db.get(), sql.c_str(), -1, &raw, nullptr) != SQLITE_OK) {
            throw StoreAccessError("query failed on " + db_path_ + ": " + sqlite3_errmsg(db.get()));
        }
        StmtHandle stmt(raw, &sqlite3_finalize);

        int rc;
        while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
            on_row(stmt.get());
        }
        if (rc != SQLITE_DONE) {
            throw StoreAccessError("read failed on " + db_path_ + ": " + sqlite3_errmsg(db.get()));
        }
    }

    // NULL text reads as an empty string.
    static std::string text_column(sqlite3_stmt* stmt, int col) {
        const unsigned char* txt = sqlite3_column_text(stmt, col);
        return txt ? reinterpret_cast<const char*>(txt) : std::string();
    }
};
