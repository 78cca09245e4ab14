/**
 * @file integrity.hpp
 * @brief Schema and data integrity checks run around migrations
 *
 * Two layers:
 *
 * SchemaValidator - declarative structural requirements (tables, columns,
 * NOT NULL, indexes). Reports every violation, not just the first.
 *
 *   SchemaValidator validator;
 *   validator.requireTable("stocks")
 *            .requireColumn("stocks", "ts_code", "TEXT")
 *            .requireIndex("stocks", "stocks_symbol_idx");
 *   auto errors = validator.validate(conn);
 *
 * IntegrityValidator - the check suite the enhanced runner executes before
 * a run, after every migration attempt and once more at the end:
 *   (a) PRAGMA foreign_key_check reports no violations
 *   (b) PRAGMA integrity_check reports "ok"
 *   (c) expected indexes exist on those tables that are present
 *   (d) once the tracked core-tables migration is applied, the tables it
 *       creates still exist
 */

#pragma once

#include <string>
#include <vector>
#include "connection.hpp"

namespace stockdb {

class SchemaValidator {
public:
    struct ValidationError {
        std::string type;     // "missing_table", "missing_column", "wrong_type", "nullable", "missing_index"
        std::string subject;  // table, column or index name the error is about
        std::string message;
    };

    SchemaValidator& requireTable(const std::string& tableName);

    /**
     * @param expectedType Expected declared type (case-insensitive substring), or empty for any
     */
    SchemaValidator& requireColumn(const std::string& tableName,
                                   const std::string& columnName,
                                   const std::string& expectedType = "");

    SchemaValidator& requireNotNull(const std::string& tableName,
                                    const std::string& columnName);

    SchemaValidator& requireIndex(const std::string& tableName,
                                  const std::string& indexName);

    /**
     * @return All violations found, empty if the schema satisfies every rule
     */
    std::vector<ValidationError> validate(Connection& conn) const;

    bool empty() const;

private:
    struct ColumnRequirement {
        std::string tableName;
        std::string columnName;
        std::string expectedType;
        bool requireNotNull = false;
    };

    struct IndexRequirement {
        std::string tableName;
        std::string indexName;
    };

    std::vector<std::string> tableRequirements_;
    std::vector<ColumnRequirement> columnRequirements_;
    std::vector<IndexRequirement> indexRequirements_;
};

/**
 * @brief Indexes that must exist whenever `table` exists
 */
struct IndexExpectation {
    std::string table;
    std::vector<std::string> indexes;
};

/**
 * @brief What the integrity suite checks beyond the built-in PRAGMAs
 */
struct IntegrityRules {
    std::vector<IndexExpectation> expectedIndexes;

    // Migration whose presence in __migrations makes trackedTables mandatory
    std::string trackedMigrationId;
    std::vector<std::string> trackedTables;

    /**
     * @brief Rules for the dashboard's stock schema
     */
    static IntegrityRules stockDefaults();

    /**
     * @brief Only the foreign-key and consistency checks
     */
    static IntegrityRules pragmasOnly();
};

struct IntegrityReport {
    bool valid = true;
    std::vector<std::string> issues;
};

class IntegrityValidator {
public:
    explicit IntegrityValidator(IntegrityRules rules = IntegrityRules::stockDefaults());

    /**
     * @brief Run all checks, accumulating issues
     * @throws DatabaseException if a check cannot be executed
     */
    IntegrityReport validate(Connection& conn) const;

    const IntegrityRules& rules() const { return rules_; }

private:
    void checkForeignKeys(Connection& conn, std::vector<std::string>& issues) const;
    void checkConsistency(Connection& conn, std::vector<std::string>& issues) const;
    void checkIndexes(Connection& conn, std::vector<std::string>& issues) const;
    void checkTrackedTables(Connection& conn, std::vector<std::string>& issues) const;

    IntegrityRules rules_;
};

} // namespace stockdb
