/**
 * @file integrity.cpp
 * @brief Implementation of SchemaValidator and IntegrityValidator
 */

#include "stockdb/integrity.hpp"
#include "stockdb/statement.hpp"
#include <cctype>

namespace stockdb {

namespace {

std::string toUpper(std::string text) {
    for (char& c : text) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return text;
}

} // namespace

// ========== SchemaValidator ==========

SchemaValidator& SchemaValidator::requireTable(const std::string& tableName) {
    tableRequirements_.push_back(tableName);
    return *this;
}

SchemaValidator& SchemaValidator::requireColumn(const std::string& tableName,
                                                const std::string& columnName,
                                                const std::string& expectedType) {
    columnRequirements_.push_back({tableName, columnName, expectedType, false});
    return *this;
}

SchemaValidator& SchemaValidator::requireNotNull(const std::string& tableName,
                                                 const std::string& columnName) {
    for (auto& req : columnRequirements_) {
        if (req.tableName == tableName && req.columnName == columnName) {
            req.requireNotNull = true;
            return *this;
        }
    }
    columnRequirements_.push_back({tableName, columnName, "", true});
    return *this;
}

SchemaValidator& SchemaValidator::requireIndex(const std::string& tableName,
                                               const std::string& indexName) {
    indexRequirements_.push_back({tableName, indexName});
    return *this;
}

bool SchemaValidator::empty() const {
    return tableRequirements_.empty()
        && columnRequirements_.empty()
        && indexRequirements_.empty();
}

std::vector<SchemaValidator::ValidationError> SchemaValidator::validate(Connection& conn) const {
    std::vector<ValidationError> errors;

    for (const auto& table : tableRequirements_) {
        if (!conn.tableExists(table)) {
            errors.push_back({
                "missing_table",
                table,
                "Required table '" + table + "' does not exist"
            });
        }
    }

    for (const auto& req : columnRequirements_) {
        auto stmt = conn.prepare(
            "SELECT type, \"notnull\" FROM pragma_table_info(?) WHERE name = ?");
        stmt.bind(1, req.tableName).bind(2, req.columnName);

        if (!stmt.step()) {
            errors.push_back({
                "missing_column",
                req.tableName + "." + req.columnName,
                "Required column '" + req.tableName + "." + req.columnName +
                "' does not exist"
            });
            continue;
        }

        if (!req.expectedType.empty()) {
            std::string colType = stmt.columnString(0);
            if (toUpper(colType).find(toUpper(req.expectedType)) == std::string::npos) {
                errors.push_back({
                    "wrong_type",
                    req.tableName + "." + req.columnName,
                    "Column '" + req.tableName + "." + req.columnName +
                    "' has type '" + colType + "', expected '" + req.expectedType + "'"
                });
            }
        }

        if (req.requireNotNull && stmt.columnInt(1) == 0) {
            errors.push_back({
                "nullable",
                req.tableName + "." + req.columnName,
                "Column '" + req.tableName + "." + req.columnName +
                "' should be NOT NULL"
            });
        }
    }

    for (const auto& req : indexRequirements_) {
        auto stmt = conn.prepare(
            "SELECT 1 FROM sqlite_master WHERE type='index' AND tbl_name=? AND name=?");
        stmt.bind(1, req.tableName).bind(2, req.indexName);
        if (!stmt.step()) {
            errors.push_back({
                "missing_index",
                req.indexName,
                "Required index '" + req.indexName + "' on table '" +
                req.tableName + "' does not exist"
            });
        }
    }

    return errors;
}

// ========== IntegrityRules ==========

IntegrityRules IntegrityRules::stockDefaults() {
    IntegrityRules rules;
    rules.expectedIndexes.push_back({
        "stocks",
        {"stocks_symbol_idx", "stocks_name_idx", "stocks_industry_idx"}
    });
    rules.trackedMigrationId = "002_v1.1_create_stocks_tables";
    rules.trackedTables = {"stocks", "stock_daily", "user_stock_favorites"};
    return rules;
}

IntegrityRules IntegrityRules::pragmasOnly() {
    return IntegrityRules{};
}

// ========== IntegrityValidator ==========

IntegrityValidator::IntegrityValidator(IntegrityRules rules)
    : rules_(std::move(rules))
{}

IntegrityReport IntegrityValidator::validate(Connection& conn) const {
    IntegrityReport report;

    checkForeignKeys(conn, report.issues);
    checkConsistency(conn, report.issues);
    checkIndexes(conn, report.issues);
    checkTrackedTables(conn, report.issues);

    report.valid = report.issues.empty();
    return report;
}

void IntegrityValidator::checkForeignKeys(Connection& conn, std::vector<std::string>& issues) const {
    auto stmt = conn.prepare("PRAGMA foreign_key_check");
    int64_t violations = 0;
    while (stmt.step()) {
        ++violations;
    }
    if (violations > 0) {
        issues.push_back("Foreign key violations: " + std::to_string(violations) + " rows");
    }
}

void IntegrityValidator::checkConsistency(Connection& conn, std::vector<std::string>& issues) const {
    auto stmt = conn.prepare("PRAGMA integrity_check");
    if (!stmt.step()) {
        issues.push_back("Integrity check failed: no result");
        return;
    }
    std::string verdict = stmt.columnString(0);
    if (verdict != "ok") {
        issues.push_back("Integrity check failed: " + verdict);
    }
}

void IntegrityValidator::checkIndexes(Connection& conn, std::vector<std::string>& issues) const {
    SchemaValidator validator;
    for (const auto& expectation : rules_.expectedIndexes) {
        if (!conn.tableExists(expectation.table)) {
            continue;
        }
        for (const auto& index : expectation.indexes) {
            validator.requireIndex(expectation.table, index);
        }
    }

    for (const auto& error : validator.validate(conn)) {
        issues.push_back("Missing index: " + error.subject);
    }
}

void IntegrityValidator::checkTrackedTables(Connection& conn, std::vector<std::string>& issues) const {
    if (rules_.trackedMigrationId.empty() || !conn.tableExists("__migrations")) {
        return;
    }

    auto stmt = conn.prepare("SELECT 1 FROM __migrations WHERE id = ?");
    stmt.bind(1, rules_.trackedMigrationId);
    if (!stmt.step()) {
        return;
    }

    SchemaValidator validator;
    for (const auto& table : rules_.trackedTables) {
        validator.requireTable(table);
    }
    for (const auto& error : validator.validate(conn)) {
        issues.push_back("Missing table: " + error.subject);
    }
}

} // namespace stockdb
