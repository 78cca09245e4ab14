/**
 * @file statement_adapter.cpp
 * @brief Implementation of SqlFragment and StatementAdapter
 */

#include "stockdb/statement_adapter.hpp"
#include <cmath>
#include <iomanip>
#include <sstream>
#include <type_traits>

namespace stockdb {

// ========== SqlFragment ==========

SqlFragment::SqlFragment(std::string text) {
    chunks_.emplace_back(std::move(text));
}

SqlFragment SqlFragment::raw(std::string text) {
    return SqlFragment(std::move(text));
}

SqlFragment& SqlFragment::append(std::string text) {
    chunks_.emplace_back(std::move(text));
    return *this;
}

SqlFragment& SqlFragment::param(Value value) {
    chunks_.emplace_back(Param{std::move(value)});
    return *this;
}

SqlFragment& SqlFragment::nest(SqlFragment fragment) {
    chunks_.emplace_back(std::make_shared<const SqlFragment>(std::move(fragment)));
    return *this;
}

SqlFragment& SqlFragment::nest(Nested fragment) {
    chunks_.emplace_back(std::move(fragment));
    return *this;
}

// ========== StatementAdapter ==========

StatementAdapter::StatementAdapter(Connection& conn)
    : conn_(conn)
{}

void StatementAdapter::execute(const Query& query) {
    if (cancelled_) {
        throw MigrationTimeout("Statement cancelled: procedure exceeded its timeout", "");
    }
    send(toSql(query));
}

void StatementAdapter::send(const std::string& sql) {
    conn_.execute(sql);
}

std::string StatementAdapter::toSql(const Query& query) {
    if (const auto* text = std::get_if<std::string>(&query)) {
        return *text;
    }
    return flatten(std::get<SqlFragment>(query));
}

std::string StatementAdapter::flatten(const SqlFragment& fragment) {
    std::string out;
    flattenInto(fragment, out, 0);
    return out;
}

void StatementAdapter::flattenInto(const SqlFragment& fragment, std::string& out, int depth) {
    if (depth > kMaxNestingDepth) {
        throw QueryFormatError("fragment nesting exceeds " + std::to_string(kMaxNestingDepth) + " levels");
    }

    for (const auto& chunk : fragment.chunks()) {
        std::visit([&out, depth](const auto& c) {
            using T = std::decay_t<decltype(c)>;
            if constexpr (std::is_same_v<T, std::string>) {
                out += c;
            } else if constexpr (std::is_same_v<T, SqlFragment::Param>) {
                out += literal(c.value);
            } else {
                if (!c) {
                    throw QueryFormatError("nested fragment is null");
                }
                flattenInto(*c, out, depth + 1);
            }
        }, chunk);
    }
}

std::string StatementAdapter::literal(const Value& value) {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, NullValue>) {
            return "NULL";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
            if (!std::isfinite(v)) {
                throw QueryFormatError("non-finite number cannot be inlined");
            }
            std::ostringstream oss;
            oss << std::setprecision(17) << v;
            return oss.str();
        } else if constexpr (std::is_same_v<T, std::string>) {
            std::string quoted = "'";
            for (char ch : v) {
                if (ch == '\'') {
                    quoted += '\'';
                }
                quoted += ch;
            }
            quoted += '\'';
            return quoted;
        } else {
            static constexpr char kHex[] = "0123456789ABCDEF";
            std::string hex = "X'";
            for (uint8_t byte : v) {
                hex += kHex[(byte >> 4) & 0x0F];
                hex += kHex[byte & 0x0F];
            }
            hex += '\'';
            return hex;
        }
    }, value);
}

} // namespace stockdb
